#pragma once

#include "i2c/i2c_ibus.hpp"
#include "lcd_iconnection.hpp"
#include "lcd_modes.hpp"
#include "lcd_pin_map.hpp"

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lcd {

// Символьный дисплей HD44780, только запись.
// Не потокобезопасен: один экземпляр обслуживает один поток.
class Controller
{
public:
    Controller(std::unique_ptr<IConnection> connection,
               const RowAddress &row_address,
               const std::vector<ModeSetter> &modes = {});

    // Дисплей за MCP23017 на шине I2C
    static std::unique_ptr<Controller> createI2c(std::unique_ptr<i2c::IBus> bus,
                                                 uint8_t address,
                                                 const PinMap &pin_map,
                                                 const RowAddress &row_address,
                                                 const std::vector<ModeSetter> &modes = {});

    Controller(const Controller &) = delete;
    Controller &operator=(const Controller &) = delete;

    // Применяет setters и заново отправляет display, function и entry
    void setMode(const std::vector<ModeSetter> &setters = {});

    bool entryIncrementEnabled() const;
    bool entryShiftEnabled() const;
    bool displayEnabled() const;
    bool cursorEnabled() const;
    bool blinkEnabled() const;
    bool eightBitModeEnabled() const;
    bool twoLineEnabled() const;
    bool dots5x10Enabled() const;

    const ModeState &modeState() const { return state_; }

    void displayOn();
    void displayOff();
    void cursorOn();
    void cursorOff();
    void blinkOn();
    void blinkOff();

    void shiftLeft();
    void shiftRight();

    void home();
    // Очистка сбрасывает часть режимов, поэтому после неё режимы отправляются повторно
    void clear();

    // Строки больше 3 прижимаются к последней, адрес считается в 8 битах
    void setCursor(int column, int row);
    void setDdramAddress(uint8_t address);
    void setCgramAddress(uint8_t address);

    // Пользовательский символ 0..7. После вызова счётчик адреса указывает в CGRAM,
    // перед выводом текста нужен setCursor() или home().
    void createChar(uint8_t location, const std::array<uint8_t, 8> &bitmap);

    void print(std::string_view text);

    void writeChar(uint8_t value);
    void writeInstruction(uint8_t value);

    void backlightOn();
    void backlightOff();

    void close();

private:
    void initialize();
    void sendEntryMode();
    void sendDisplayMode();
    void sendFunctionMode();

    void printMessage(const std::string &msg) const;

private:
    std::unique_ptr<IConnection> connection_;
    RowAddress row_address_;
    ModeState state_;
};

} // namespace lcd
