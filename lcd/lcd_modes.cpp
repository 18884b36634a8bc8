#include "lcd_modes.hpp"
#include "lcd_constants.hpp"

namespace lcd {

namespace mode {

void entryDecrement(ModeState &state) { state.entry &= ~entry::Increment; }
void entryIncrement(ModeState &state) { state.entry |= entry::Increment; }
void entryShiftOff(ModeState &state) { state.entry &= ~entry::ShiftOn; }
void entryShiftOn(ModeState &state) { state.entry |= entry::ShiftOn; }

void displayOff(ModeState &state) { state.display &= ~display::DisplayOn; }
void displayOn(ModeState &state) { state.display |= display::DisplayOn; }
void cursorOff(ModeState &state) { state.display &= ~display::CursorOn; }
void cursorOn(ModeState &state) { state.display |= display::CursorOn; }
void blinkOff(ModeState &state) { state.display &= ~display::BlinkOn; }
void blinkOn(ModeState &state) { state.display |= display::BlinkOn; }

void fourBitMode(ModeState &state) { state.function &= ~function::EightBit; }
void eightBitMode(ModeState &state) { state.function |= function::EightBit; }
void oneLine(ModeState &state) { state.function &= ~function::TwoLine; }
void twoLine(ModeState &state) { state.function |= function::TwoLine; }
void dots5x8(ModeState &state) { state.function &= ~function::Dots5x10; }
void dots5x10(ModeState &state) { state.function |= function::Dots5x10; }

} // namespace mode

const std::vector<ModeSetter> &defaultModes()
{
    static const std::vector<ModeSetter> modes = {
        mode::fourBitMode,
        mode::twoLine,
        mode::dots5x8,
        mode::entryIncrement,
        mode::entryShiftOff,
        mode::displayOn,
        mode::cursorOff,
        mode::blinkOff,
    };
    return modes;
}

} // namespace lcd
