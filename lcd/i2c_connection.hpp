#pragma once

#include "i2c/i2c_ibus.hpp"
#include "lcd_iconnection.hpp"
#include "lcd_pin_map.hpp"

#include <array>
#include <memory>

namespace lcd {

// HD44780 в 4-битном режиме за расширителем MCP23017
class I2cConnection : public IConnection
{
public:
    I2cConnection(std::unique_ptr<i2c::IBus> bus, uint8_t address, const PinMap &pin_map);

    I2cConnection(const I2cConnection &) = delete;
    I2cConnection &operator=(const I2cConnection &) = delete;

    void write(bool register_select, uint8_t data) override final;

    void backlightOn() override final;
    void backlightOff() override final;

    void close() override final;

    // Старший и младший полубайт, разложенные по битам порта, с RS
    static std::array<uint8_t, 2> encode(const PinMap &pin_map, bool register_select, uint8_t data);

    uint8_t backlightValue(bool on) const;

private:
    void pulseEnable(uint8_t frame);

    std::unique_ptr<i2c::IBus> bus_;
    uint8_t address_;
    PinMap pin_map_;
};

} // namespace lcd
