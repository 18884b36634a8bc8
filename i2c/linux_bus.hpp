#pragma once

#include "i2c_ibus.hpp"

#include <string>

namespace i2c {

// Шина через /dev/i2c-N (i2c-dev)
class LinuxBus : public IBus
{
public:
    explicit LinuxBus(std::string device);
    ~LinuxBus();

    LinuxBus(const LinuxBus &) = delete;
    LinuxBus &operator=(const LinuxBus &) = delete;

    void writeByteToRegister(uint8_t address, uint8_t reg, uint8_t value) override final;
    void close() override final;

private:
    void selectDevice(uint8_t address);

    std::string device_;
    int fd_ = -1;
    int current_address_ = -1;
};

} // namespace i2c
