#include "command_processor.hpp"
#include "gpio/pin_error.hpp"
#include "io_error.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace {

int requireInt(const nlohmann::json &data, const char *field)
{
    if (!data.contains(field) || !data[field].is_number_integer()) {
        throw std::invalid_argument(std::string("Missing or invalid '") + field + "' field");
    }
    return data[field].get<int>();
}

bool requireBool(const nlohmann::json &data, const char *field)
{
    if (!data.contains(field) || !data[field].is_boolean()) {
        throw std::invalid_argument(std::string("Missing or invalid '") + field + "' field");
    }
    return data[field].get<bool>();
}

// Позиция курсора из полей column и row, отрицательные значения не принимаются
std::pair<int, int> requirePosition(const nlohmann::json &data)
{
    int column = requireInt(data, "column");
    int row = requireInt(data, "row");
    if (column < 0 || row < 0) {
        throw std::invalid_argument("Cursor position must not be negative");
    }
    return {column, row};
}

// Пин задаётся номером или псевдонимом из таблицы платы
gpio::PinKey requirePinKey(const nlohmann::json &data)
{
    if (data.contains("pin")) {
        if (data["pin"].is_number_integer()) {
            return data["pin"].get<int>();
        }
        if (data["pin"].is_string()) {
            return data["pin"].get<std::string>();
        }
    }
    throw std::invalid_argument("Missing or invalid 'pin' field");
}

} // namespace

CommandProcessor::CommandProcessor(lcd::Controller &display,
                                   gpio::PinArbiter &pins,
                                   mqtt::IClient &mqtt_client)
    : display_(display)
    , pins_(pins)
    , mqtt_client_(mqtt_client)
{}

CommandProcessor::Result CommandProcessor::process(const std::string &topic,
                                                   const std::string &payload)
{
    if (topic != topics::Control) {
        reportError("Unsupported topic: " + topic);
        return Result::Rejected;
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error &e) {
        reportError("Invalid JSON format: " + std::string(e.what()));
        return Result::Rejected;
    }

    if (!data.is_object() || !data.contains("command") || !data["command"].is_string()) {
        reportError("Missing or invalid 'command' field");
        return Result::Rejected;
    }

    const std::string command = data["command"];

    try {
        return dispatch(command, data);
    } catch (const gpio::PinError &e) {
        reportError("GPIO error: " + std::string(e.what()));
    } catch (const IoError &e) {
        reportError("I/O error: " + std::string(e.what()));
    } catch (const std::invalid_argument &e) {
        reportError(e.what());
    } catch (const nlohmann::json::exception &e) {
        reportError("Invalid command payload: " + std::string(e.what()));
    }
    return Result::Rejected;
}

CommandProcessor::Result CommandProcessor::dispatch(const std::string &command,
                                                    const nlohmann::json &data)
{
    if (command == "restart") {
        return Result::RestartRequested;
    }

    if (command == "print") {
        print(data);
    } else if (command == "clear") {
        display_.clear();
    } else if (command == "home") {
        display_.home();
    } else if (command == "set_cursor") {
        setCursor(data);
    } else if (command == "shift") {
        shift(data);
    } else if (command == "set_mode") {
        setMode(data);
    } else if (command == "backlight") {
        backlight(data);
    } else if (command == "create_char") {
        createChar(data);
    } else if (command == "set_pin") {
        setPin(data);
    } else if (command == "read_pin") {
        readPin(data);
    } else if (command == "read_analog") {
        readAnalog(data);
    } else {
        reportError("Unsupported command: " + command);
        return Result::Rejected;
    }
    return Result::Done;
}

void CommandProcessor::print(const nlohmann::json &data)
{
    if (!data.contains("text") || !data["text"].is_string()) {
        throw std::invalid_argument("Missing or invalid 'text' field");
    }

    // Позиция необязательна: без неё текст продолжается с текущего адреса
    if (data.contains("column") || data.contains("row")) {
        const auto [column, row] = requirePosition(data);
        display_.setCursor(column, row);
    }
    display_.print(data["text"].get<std::string>());
}

void CommandProcessor::setCursor(const nlohmann::json &data)
{
    const auto [column, row] = requirePosition(data);
    display_.setCursor(column, row);
}

void CommandProcessor::shift(const nlohmann::json &data)
{
    const std::string direction = data.value("direction", "");
    if (direction == "left") {
        display_.shiftLeft();
    } else if (direction == "right") {
        display_.shiftRight();
    } else {
        throw std::invalid_argument("Shift direction must be 'left' or 'right'");
    }
}

void CommandProcessor::setMode(const nlohmann::json &data)
{
    struct Toggle
    {
        const char *field;
        lcd::ModeSetter on;
        lcd::ModeSetter off;
    };

    static const Toggle toggles[] = {
        {"display", lcd::mode::displayOn, lcd::mode::displayOff},
        {"cursor", lcd::mode::cursorOn, lcd::mode::cursorOff},
        {"blink", lcd::mode::blinkOn, lcd::mode::blinkOff},
        {"entry_increment", lcd::mode::entryIncrement, lcd::mode::entryDecrement},
        {"entry_shift", lcd::mode::entryShiftOn, lcd::mode::entryShiftOff},
    };

    std::vector<lcd::ModeSetter> setters;
    for (const auto &toggle : toggles) {
        if (data.contains(toggle.field)) {
            setters.push_back(requireBool(data, toggle.field) ? toggle.on : toggle.off);
        }
    }

    if (setters.empty()) {
        throw std::invalid_argument("set_mode requires at least one mode field");
    }
    display_.setMode(setters);
}

void CommandProcessor::backlight(const nlohmann::json &data)
{
    if (requireBool(data, "on")) {
        display_.backlightOn();
    } else {
        display_.backlightOff();
    }
}

void CommandProcessor::createChar(const nlohmann::json &data)
{
    static constexpr int max_location = 7;
    static constexpr int max_row_value = 0x1F;

    int location = requireInt(data, "location");
    if (location < 0 || location > max_location) {
        throw std::invalid_argument("Character location must be in range [0, 7]");
    }

    if (!data.contains("rows") || !data["rows"].is_array() || data["rows"].size() != 8) {
        throw std::invalid_argument("'rows' must be an array of 8 integers");
    }

    std::array<uint8_t, 8> bitmap{};
    for (std::size_t i = 0; i < bitmap.size(); ++i) {
        const auto &row = data["rows"][i];
        if (!row.is_number_integer() || row.get<int>() < 0 || row.get<int>() > max_row_value) {
            throw std::invalid_argument("Character rows must be integers in range [0, 31]");
        }
        bitmap[i] = static_cast<uint8_t>(row.get<int>());
    }

    display_.createChar(static_cast<uint8_t>(location), bitmap);
    display_.home();
}

void CommandProcessor::setPin(const nlohmann::json &data)
{
    const gpio::PinKey key = requirePinKey(data);
    const bool value = requireBool(data, "value");

    auto &pin = pins_.acquireDigital(key);
    pin.setDirection(gpio::Direction::Output);
    pin.write(value ? gpio::DigitalValue::High : gpio::DigitalValue::Low);
}

void CommandProcessor::readPin(const nlohmann::json &data)
{
    const gpio::PinKey key = requirePinKey(data);

    auto &pin = pins_.acquireDigital(key);
    pin.setDirection(gpio::Direction::Input);

    nlohmann::json message;
    message["pin"] = data["pin"];
    message["value"] = pin.read() == gpio::DigitalValue::High ? 1 : 0;
    mqtt_client_.publish(topics::PinsState, message.dump());
}

void CommandProcessor::readAnalog(const nlohmann::json &data)
{
    const gpio::PinKey key = requirePinKey(data);

    auto &pin = pins_.acquireAnalog(key);

    nlohmann::json message;
    message["pin"] = data["pin"];
    message["value"] = pin.read();
    mqtt_client_.publish(topics::PinsAnalog, message.dump());
}

void CommandProcessor::reportError(const std::string &msg)
{
    printError("[CMD] " + msg);
    mqtt_client_.publish(topics::Errors, msg);
}

void CommandProcessor::printError(const std::string &msg) const
{
    std::cerr << msg << std::endl;
}
