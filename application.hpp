#pragma once

#include "command_processor.hpp"
#include "config.hpp"
#include "gpio/pin_arbiter.hpp"
#include "lcd/controller.hpp"
#include "mqtt/mqtt_iclient.hpp"
#include "safe_queue.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

class Application
{
public:
    Application(const AppConfig &config,
                std::unique_ptr<mqtt::IClient> mqtt_client,
                std::unique_ptr<lcd::Controller> display,
                std::unique_ptr<gpio::PinArbiter> pins);
    ~Application();

    void run();
    void restart();

private:
    enum class State {
        WaitingToConnect,
        Connected,
        Disconnected,
        Reconnecting,
        Restarting,
        Exiting
    };

    void connectToMqtt();
    void setupDisplay();
    void setupStatusLed();
    void releasePins();
    void setupMqttHandlers();
    void removeMqttHandlers();
    void processIncomingMessages();
    void updateStatusLed(bool connected);

    void printMessage(const std::string &msg) const;
    void printError(const std::string &msg) const;

private:
    AppConfig config_;
    std::unique_ptr<mqtt::IClient> mqtt_client_;
    std::unique_ptr<lcd::Controller> display_;
    std::unique_ptr<gpio::PinArbiter> pins_;
    CommandProcessor processor_;
    SafeQueue<std::pair<std::string, std::string>> incoming_messages_;

    State state_;
    int reconnect_attempts_;
    std::chrono::steady_clock::time_point last_reconnect_time_;
    bool status_led_on_;

    mutable std::mutex state_mutex_;
    mutable std::mutex log_mutex_;
};
