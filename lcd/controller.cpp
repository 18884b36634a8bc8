#include "controller.hpp"
#include "i2c_connection.hpp"
#include "lcd_constants.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace lcd {

Controller::Controller(std::unique_ptr<IConnection> connection,
                       const RowAddress &row_address,
                       const std::vector<ModeSetter> &modes)
    : connection_(std::move(connection))
    , row_address_(row_address)
{
    if (!connection_) {
        throw std::invalid_argument("Controller requires a connection");
    }

    initialize();

    std::vector<ModeSetter> setters = defaultModes();
    setters.insert(setters.end(), modes.begin(), modes.end());
    setMode(setters);
}

std::unique_ptr<Controller> Controller::createI2c(std::unique_ptr<i2c::IBus> bus,
                                                  uint8_t address,
                                                  const PinMap &pin_map,
                                                  const RowAddress &row_address,
                                                  const std::vector<ModeSetter> &modes)
{
    auto connection = std::make_unique<I2cConnection>(std::move(bus), address, pin_map);
    return std::make_unique<Controller>(std::move(connection), row_address, modes);
}

void Controller::initialize()
{
    printMessage("[LCD] Initializing display");
    writeInstruction(command::Init);
    printMessage("[LCD] Initializing display in 4-bit mode");
    writeInstruction(command::Init4Bit);
}

void Controller::setMode(const std::vector<ModeSetter> &setters)
{
    for (ModeSetter setter : setters) {
        setter(state_);
    }

    sendDisplayMode();
    sendFunctionMode();
    sendEntryMode();
}

void Controller::sendEntryMode()
{
    writeInstruction(command::SetEntryMode | state_.entry);
}

void Controller::sendDisplayMode()
{
    writeInstruction(command::SetDisplayMode | state_.display);
}

void Controller::sendFunctionMode()
{
    writeInstruction(command::SetFunctionMode | state_.function);
}

bool Controller::entryIncrementEnabled() const
{
    return (state_.entry & entry::Increment) != 0;
}

bool Controller::entryShiftEnabled() const
{
    return (state_.entry & entry::ShiftOn) != 0;
}

bool Controller::displayEnabled() const
{
    return (state_.display & display::DisplayOn) != 0;
}

bool Controller::cursorEnabled() const
{
    return (state_.display & display::CursorOn) != 0;
}

bool Controller::blinkEnabled() const
{
    return (state_.display & display::BlinkOn) != 0;
}

bool Controller::eightBitModeEnabled() const
{
    return (state_.function & function::EightBit) != 0;
}

bool Controller::twoLineEnabled() const
{
    return (state_.function & function::TwoLine) != 0;
}

bool Controller::dots5x10Enabled() const
{
    return (state_.function & function::Dots5x10) != 0;
}

void Controller::displayOn()
{
    mode::displayOn(state_);
    sendDisplayMode();
}

void Controller::displayOff()
{
    mode::displayOff(state_);
    sendDisplayMode();
}

void Controller::cursorOn()
{
    mode::cursorOn(state_);
    sendDisplayMode();
}

void Controller::cursorOff()
{
    mode::cursorOff(state_);
    sendDisplayMode();
}

void Controller::blinkOn()
{
    mode::blinkOn(state_);
    sendDisplayMode();
}

void Controller::blinkOff()
{
    mode::blinkOff(state_);
    sendDisplayMode();
}

void Controller::shiftLeft()
{
    writeInstruction(command::CursorShift | command::DisplayMove | command::MoveLeft);
}

void Controller::shiftRight()
{
    writeInstruction(command::CursorShift | command::DisplayMove | command::MoveRight);
}

void Controller::home()
{
    writeInstruction(command::ReturnHome);
    std::this_thread::sleep_for(timing::ClearDelay);
}

void Controller::clear()
{
    writeInstruction(command::ClearDisplay);
    std::this_thread::sleep_for(timing::ClearDelay);
    setMode();
}

void Controller::setCursor(int column, int row)
{
    const int clamped = std::clamp(row, 0, static_cast<int>(row_address_.size()) - 1);
    setDdramAddress(static_cast<uint8_t>(static_cast<uint8_t>(column) + row_address_[clamped]));
}

void Controller::setDdramAddress(uint8_t address)
{
    writeInstruction(command::SetDdramAddress | address);
}

void Controller::setCgramAddress(uint8_t address)
{
    writeInstruction(command::SetCgramAddress | (address & 0x3F));
}

void Controller::createChar(uint8_t location, const std::array<uint8_t, 8> &bitmap)
{
    setCgramAddress(static_cast<uint8_t>((location & 0x07) << 3));
    for (uint8_t row : bitmap) {
        writeChar(row & 0x1F);
    }
}

void Controller::print(std::string_view text)
{
    for (char c : text) {
        writeChar(static_cast<uint8_t>(c));
    }
}

void Controller::writeChar(uint8_t value)
{
    connection_->write(true, value);
}

void Controller::writeInstruction(uint8_t value)
{
    connection_->write(false, value);
}

void Controller::backlightOn()
{
    connection_->backlightOn();
}

void Controller::backlightOff()
{
    connection_->backlightOff();
}

void Controller::close()
{
    printMessage("[LCD] Closing display connection");
    connection_->close();
}

void Controller::printMessage(const std::string &msg) const
{
    std::cout << msg << std::endl;
}

} // namespace lcd
