#include "i2c_connection.hpp"
#include "lcd_constants.hpp"

#include <stdexcept>
#include <thread>

namespace lcd {

namespace {

uint8_t nibbleFrame(const PinMap &pin_map, uint8_t nibble)
{
    uint8_t frame = 0x00;
    frame |= ((nibble >> 0) & 0x01) << pin_map.d4;
    frame |= ((nibble >> 1) & 0x01) << pin_map.d5;
    frame |= ((nibble >> 2) & 0x01) << pin_map.d6;
    frame |= ((nibble >> 3) & 0x01) << pin_map.d7;
    return frame;
}

} // namespace

I2cConnection::I2cConnection(std::unique_ptr<i2c::IBus> bus,
                             uint8_t address,
                             const PinMap &pin_map)
    : bus_(std::move(bus))
    , address_(address)
    , pin_map_(pin_map)
{
    if (!bus_) {
        throw std::invalid_argument("I2cConnection requires an I2C bus");
    }

    // Если чип остался в BANK=1, IOCON находится по 0x05
    bus_->writeByteToRegister(address_, mcp23017::IoconBank1, 0x00);
    bus_->writeByteToRegister(address_, mcp23017::Iocon, mcp23017::IoconSeqop);
    bus_->writeByteToRegister(address_, mcp23017::GpioA, backlightValue(false));
    bus_->writeByteToRegister(address_, mcp23017::IodirA, 0x00);
    bus_->writeByteToRegister(address_, mcp23017::IodirB, 0x00);
}

std::array<uint8_t, 2> I2cConnection::encode(const PinMap &pin_map,
                                             bool register_select,
                                             uint8_t data)
{
    std::array<uint8_t, 2> frames{nibbleFrame(pin_map, data >> 4), nibbleFrame(pin_map, data & 0x0F)};
    if (register_select) {
        for (auto &frame : frames) {
            frame |= 0x01 << pin_map.rs;
        }
    }
    return frames;
}

void I2cConnection::write(bool register_select, uint8_t data)
{
    for (uint8_t frame : encode(pin_map_, register_select, data)) {
        pulseEnable(frame);
    }
    std::this_thread::sleep_for(timing::WriteDelay);
}

void I2cConnection::pulseEnable(uint8_t frame)
{
    const uint8_t strobe[3] = {frame, static_cast<uint8_t>(frame | (0x01 << pin_map_.en)), frame};
    for (uint8_t value : strobe) {
        std::this_thread::sleep_for(timing::PulseDelay);
        bus_->writeByteToRegister(address_, mcp23017::GpioB, value);
    }
}

uint8_t I2cConnection::backlightValue(bool on) const
{
    if (!pin_map_.backlight) {
        return 0x00;
    }
    const bool level = on == (pin_map_.backlight_polarity == BacklightPolarity::Positive);
    return level ? static_cast<uint8_t>(0x01 << *pin_map_.backlight) : 0x00;
}

void I2cConnection::backlightOn()
{
    if (pin_map_.backlight) {
        bus_->writeByteToRegister(address_, mcp23017::GpioA, backlightValue(true));
    }
}

void I2cConnection::backlightOff()
{
    if (pin_map_.backlight) {
        bus_->writeByteToRegister(address_, mcp23017::GpioA, backlightValue(false));
    }
}

void I2cConnection::close()
{
    bus_->close();
}

} // namespace lcd
