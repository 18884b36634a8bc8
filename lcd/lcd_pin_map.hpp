#pragma once

#include <array>
#include <cstdint>
#include <optional>

namespace lcd {

enum class BacklightPolarity {
    Negative, // подсветка горит при низком уровне
    Positive  // подсветка горит при высоком уровне
};

// Номера битов выходного регистра расширителя для линий HD44780.
// RS, RW, EN, D4..D7 на порту данных; подсветка на отдельном порту.
struct PinMap
{
    uint8_t rs;
    uint8_t rw;
    uint8_t en;
    uint8_t d4;
    uint8_t d5;
    uint8_t d6;
    uint8_t d7;
    std::optional<uint8_t> backlight;
    BacklightPolarity backlight_polarity;
};

// Плата Adafruit RGB LCD на MCP23017: данные на GPB, подсветка на GPA6, активный низкий
inline constexpr PinMap Mcp230xxPinMap{7, 6, 5, 4, 3, 2, 1, 6, BacklightPolarity::Negative};

// Базовый адрес DDRAM для каждой строки
using RowAddress = std::array<uint8_t, 4>;

inline constexpr RowAddress RowAddress16Col{0x00, 0x40, 0x10, 0x50};
inline constexpr RowAddress RowAddress20Col{0x00, 0x40, 0x14, 0x54};

} // namespace lcd
