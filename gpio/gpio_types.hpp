#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace gpio {

// Возможности пина, флаги комбинируются
namespace cap {
constexpr uint32_t Normal = 1u << 0;
constexpr uint32_t I2c = 1u << 1;
constexpr uint32_t Uart = 1u << 2;
constexpr uint32_t Spi = 1u << 3;
constexpr uint32_t Gpmc = 1u << 4;
constexpr uint32_t Lcd = 1u << 5;
constexpr uint32_t Pwm = 1u << 6;
constexpr uint32_t Analog = 1u << 7;
} // namespace cap

// Вид открытого хэндла пина
enum class PinKind {
    Digital,
    Analog
};

enum class Direction {
    Input,
    Output
};

enum class DigitalValue {
    Low,
    High
};

struct PinDescriptor
{
    int number;
    std::vector<std::string> ids;
    uint32_t caps;
    int analog_channel = -1;
};

// Ключ поиска: номер пина или любой из его псевдонимов
using PinKey = std::variant<int, std::string>;

inline std::string toString(const PinKey &key)
{
    if (const int *number = std::get_if<int>(&key)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(key);
}

inline const char *toString(PinKind kind)
{
    return kind == PinKind::Digital ? "digital" : "analog";
}

} // namespace gpio
