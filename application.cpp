#include "application.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

template<typename T>
T &require(const std::unique_ptr<T> &ptr, const char *name)
{
    if (!ptr) {
        throw std::invalid_argument(std::string("Application requires ") + name);
    }
    return *ptr;
}

} // namespace

Application::Application(const AppConfig &config,
                         std::unique_ptr<mqtt::IClient> mqtt_client,
                         std::unique_ptr<lcd::Controller> display,
                         std::unique_ptr<gpio::PinArbiter> pins)
    : config_(config)
    , mqtt_client_(std::move(mqtt_client))
    , display_(std::move(display))
    , pins_(std::move(pins))
    , processor_(require(display_, "a display"),
                 require(pins_, "a pin arbiter"),
                 require(mqtt_client_, "an MQTT client"))
    , state_(State::WaitingToConnect)
    , reconnect_attempts_(0)
    , last_reconnect_time_(std::chrono::steady_clock::now())
    , status_led_on_(false)
{
    setupDisplay();
    setupStatusLed();
}

Application::~Application()
{
    removeMqttHandlers();
}

void Application::setupDisplay()
{
    display_->clear();
    display_->backlightOn();
    display_->setCursor(0, 0);
    display_->print("charlcd_node");
    display_->setCursor(0, 1);
    display_->print("waiting for MQTT");
}

void Application::setupStatusLed()
{
    if (config_.gpio.status_led_pin.empty()) {
        return;
    }

    try {
        auto &led = pins_->acquireDigital(config_.gpio.status_led_pin);
        led.setDirection(gpio::Direction::Output);
        led.write(gpio::DigitalValue::Low);
        status_led_on_ = false;
    } catch (const std::exception &e) {
        // Без индикатора работать можно, дисплей важнее
        printError("[APP] Status LED " + config_.gpio.status_led_pin
                   + " unavailable: " + std::string(e.what()));
    }
}

void Application::releasePins()
{
    try {
        pins_->closeAll();
    } catch (const std::exception &e) {
        printError("[APP] Failed to release all pins, some may remain held: "
                   + std::string(e.what()));
    }
}

void Application::updateStatusLed(bool connected)
{
    if (config_.gpio.status_led_pin.empty() || status_led_on_ == connected
        || !pins_->isAcquired(config_.gpio.status_led_pin)) {
        return;
    }

    try {
        pins_->acquireDigital(config_.gpio.status_led_pin)
            .write(connected ? gpio::DigitalValue::High : gpio::DigitalValue::Low);
        status_led_on_ = connected;
    } catch (const std::exception &e) {
        printError("[APP] Failed to update status LED: " + std::string(e.what()));
    }
}

void Application::setupMqttHandlers()
{
    mqtt_client_->setMessageCallback([this](const std::string &topic, const std::string &payload) {
        incoming_messages_.emplace(topic, payload);
    });

    mqtt_client_->setConnectCallback([this]() {
        printMessage("[APP] MQTT Client Connected");
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = State::Connected;
            reconnect_attempts_ = 0;
        }
        mqtt_client_->publishRetained(topics::Status, "online");
    });

    mqtt_client_->setDisconnectCallback([this](int reason) {
        printMessage("[APP] MQTT Client Disconnected, reason = " + std::to_string(reason));
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != State::Restarting && state_ != State::Exiting) {
                state_ = State::Disconnected;
                last_reconnect_time_ = std::chrono::steady_clock::now();
            }
        }
    });
}

void Application::removeMqttHandlers()
{
    mqtt_client_->setMessageCallback(nullptr);
    mqtt_client_->setConnectCallback(nullptr);
    mqtt_client_->setDisconnectCallback(nullptr);
}

void Application::connectToMqtt()
{
    try {
        mqtt_client_->setLastWill(topics::Status, "offline");
        mqtt_client_->connect();
        mqtt_client_->subscribe(topics::Control);
    } catch (const std::exception &e) {
        printError("[APP] MQTT initial client connect failed: " + std::string(e.what()));
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = State::Disconnected;
            last_reconnect_time_ = std::chrono::steady_clock::now();
        }
    }
}

void Application::processIncomingMessages()
{
    static constexpr auto poll_timeout = std::chrono::milliseconds(10);

    auto msg = incoming_messages_.popFor(poll_timeout);
    if (!msg) {
        return;
    }

    const auto &[topic, payload] = *msg;
    printMessage("[APP] MQTT message received: [" + topic + "] " + payload);

    try {
        if (processor_.process(topic, payload) == CommandProcessor::Result::RestartRequested) {
            printMessage("[APP] Received restart command");
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = State::Restarting;
        }
    } catch (const std::exception &e) {
        // Сюда попадают только ошибки публикации, ошибки команд уже отправлены в display/errors
        printError("[APP] Failed to process message: " + std::string(e.what()));
    }
}

void Application::restart()
{
    static constexpr int restart_timeout_s = 3;

    mqtt_client_->disconnect();
    removeMqttHandlers();
    incoming_messages_.clear();
    releasePins();
    status_led_on_ = false;

    printMessage("[APP] Restarting...");
    std::this_thread::sleep_for(std::chrono::seconds(restart_timeout_s));

    // дисплей и пины настраиваем заново
    try {
        setupDisplay();
    } catch (const std::exception &e) {
        printError("[APP] Display re-initialization failed: " + std::string(e.what()));
    }
    setupStatusLed();
    setupMqttHandlers();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = State::Disconnected;
        reconnect_attempts_ = 0;
        last_reconnect_time_ = std::chrono::steady_clock::now() - std::chrono::hours(1);
    }
}

void Application::run()
{
    static constexpr int reconnect_interval_ms = 2000;
    static constexpr auto idle_sleep = std::chrono::milliseconds(10);

    setupMqttHandlers();
    connectToMqtt();

    bool is_running = true;

    while (is_running) {
        State current_state;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            current_state = state_;
        }

        auto now = std::chrono::steady_clock::now();

        switch (current_state) {
        case State::WaitingToConnect:
            std::this_thread::sleep_for(idle_sleep);
            break;

        case State::Connected:
            updateStatusLed(true);
            processIncomingMessages();
            break;

        case State::Disconnected: {
            updateStatusLed(false);
            if (std::chrono::duration_cast<std::chrono::milliseconds>(now - last_reconnect_time_)
                    .count()
                >= reconnect_interval_ms) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (reconnect_attempts_ < config_.max_reconnect_attempts) {
                    printMessage("[APP] Attempting reconnect MQTT connection, attempt "
                                 + std::to_string(reconnect_attempts_ + 1));
                    state_ = State::Reconnecting;
                } else {
                    printError("[APP] Max reconnection attempts reached, getting application to exit");
                    state_ = State::Exiting;
                }
            } else {
                std::this_thread::sleep_for(idle_sleep);
            }
            break;
        }

        case State::Reconnecting: {
            try {
                if (mqtt_client_->isConnected()) {
                    mqtt_client_->disconnect();
                }
                mqtt_client_->setLastWill(topics::Status, "offline");
                mqtt_client_->connect();
                mqtt_client_->subscribe(topics::Control);
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    if (state_ != State::Connected) {
                        state_ = State::WaitingToConnect;
                    }
                }
            } catch (const std::exception &e) {
                printError("[APP] Reconnect failed: " + std::string(e.what()));
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    state_ = State::Disconnected;
                    last_reconnect_time_ = now;
                    reconnect_attempts_++;
                }
            }
            break;
        }

        case State::Restarting:
            restart();
            break;

        case State::Exiting:
            printMessage("[APP] Exiting application");
            is_running = false;
            break;
        }
    }

    updateStatusLed(false);
    mqtt_client_->disconnect();
    releasePins();
}

void Application::printMessage(const std::string &msg) const
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cout << msg << std::endl;
}

void Application::printError(const std::string &msg) const
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr << msg << std::endl;
}
