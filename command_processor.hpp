#pragma once

#include "gpio/pin_arbiter.hpp"
#include "lcd/controller.hpp"
#include "mqtt/mqtt_iclient.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace topics {
inline const std::string Control = "display/control";
inline const std::string Errors = "display/errors";
inline const std::string PinsState = "display/pins/state";
inline const std::string PinsAnalog = "display/pins/analog";
inline const std::string Status = "display/status";
} // namespace topics

// Разбор JSON-команд из MQTT и их выполнение на дисплее и пинах.
// Ошибки не пробрасываются, а публикуются в display/errors.
class CommandProcessor
{
public:
    enum class Result {
        Done,
        Rejected,
        RestartRequested
    };

    CommandProcessor(lcd::Controller &display, gpio::PinArbiter &pins, mqtt::IClient &mqtt_client);

    Result process(const std::string &topic, const std::string &payload);

private:
    Result dispatch(const std::string &command, const nlohmann::json &data);

    void print(const nlohmann::json &data);
    void setCursor(const nlohmann::json &data);
    void shift(const nlohmann::json &data);
    void setMode(const nlohmann::json &data);
    void backlight(const nlohmann::json &data);
    void createChar(const nlohmann::json &data);
    void setPin(const nlohmann::json &data);
    void readPin(const nlohmann::json &data);
    void readAnalog(const nlohmann::json &data);

    void reportError(const std::string &msg);

    void printError(const std::string &msg) const;

private:
    lcd::Controller &display_;
    gpio::PinArbiter &pins_;
    mqtt::IClient &mqtt_client_;
};
