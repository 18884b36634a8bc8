#pragma once

#include <cstdint>

namespace i2c {

class IBus
{
public:
    virtual ~IBus() = default;

    virtual void writeByteToRegister(uint8_t address, uint8_t reg, uint8_t value) = 0;
    virtual void close() = 0;
};

} // namespace i2c
