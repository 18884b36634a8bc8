#pragma once

#include <cstdint>
#include <vector>

namespace lcd {

// Копия конфигурационных регистров контроллера. Прочитать их с дисплея нельзя,
// поэтому после любого изменения байт команды отправляется целиком.
struct ModeState
{
    uint8_t entry = 0x00;
    uint8_t display = 0x00;
    uint8_t function = 0x00;
};

using ModeSetter = void (*)(ModeState &);

namespace mode {
void entryDecrement(ModeState &state);
void entryIncrement(ModeState &state);
void entryShiftOff(ModeState &state);
void entryShiftOn(ModeState &state);

void displayOff(ModeState &state);
void displayOn(ModeState &state);
void cursorOff(ModeState &state);
void cursorOn(ModeState &state);
void blinkOff(ModeState &state);
void blinkOn(ModeState &state);

void fourBitMode(ModeState &state);
void eightBitMode(ModeState &state);
void oneLine(ModeState &state);
void twoLine(ModeState &state);
void dots5x8(ModeState &state);
void dots5x10(ModeState &state);
} // namespace mode

// Применяются при создании контроллера до пользовательских
const std::vector<ModeSetter> &defaultModes();

} // namespace lcd
