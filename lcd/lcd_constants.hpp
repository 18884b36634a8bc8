#pragma once

#include <chrono>
#include <cstdint>

namespace lcd {

// Тайминги HD44780. Сокращать нельзя: дисплей начнёт терять символы.
namespace timing {
constexpr std::chrono::microseconds PulseDelay{1};
constexpr std::chrono::microseconds WriteDelay{37};
constexpr std::chrono::microseconds ClearDelay{1520};
} // namespace timing

namespace command {
constexpr uint8_t Init = 0x33;
constexpr uint8_t Init4Bit = 0x32;

constexpr uint8_t ClearDisplay = 0x01;
constexpr uint8_t ReturnHome = 0x02;
constexpr uint8_t SetEntryMode = 0x04;
constexpr uint8_t SetDisplayMode = 0x08;
constexpr uint8_t CursorShift = 0x10;
constexpr uint8_t SetFunctionMode = 0x20;
constexpr uint8_t SetCgramAddress = 0x40;
constexpr uint8_t SetDdramAddress = 0x80;

// Флаги сдвига
constexpr uint8_t CursorMove = 0x00;
constexpr uint8_t DisplayMove = 0x08;
constexpr uint8_t MoveLeft = 0x00;
constexpr uint8_t MoveRight = 0x04;
} // namespace command

namespace entry {
constexpr uint8_t Increment = 0x02;
constexpr uint8_t ShiftOn = 0x01;
} // namespace entry

namespace display {
constexpr uint8_t DisplayOn = 0x04;
constexpr uint8_t CursorOn = 0x02;
constexpr uint8_t BlinkOn = 0x01;
} // namespace display

namespace function {
constexpr uint8_t EightBit = 0x10;
constexpr uint8_t TwoLine = 0x08;
constexpr uint8_t Dots5x10 = 0x04;
} // namespace function

// Регистры MCP23017 в режиме IOCON.BANK = 0
namespace mcp23017 {
constexpr uint8_t IodirA = 0x00;
constexpr uint8_t IodirB = 0x01;
constexpr uint8_t IoconBank1 = 0x05;
constexpr uint8_t Iocon = 0x0A;
constexpr uint8_t GpioA = 0x12;
constexpr uint8_t GpioB = 0x13;

constexpr uint8_t IoconSeqop = 0x20;
} // namespace mcp23017

} // namespace lcd
