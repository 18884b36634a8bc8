#pragma once

#include "gpio/gpio_idriver.hpp"
#include "i2c/i2c_ibus.hpp"
#include "io_error.hpp"
#include "lcd/lcd_iconnection.hpp"
#include "mqtt/mqtt_iclient.hpp"

#include <gmock/gmock.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fakes {

struct BusWrite
{
    uint8_t address;
    uint8_t reg;
    uint8_t value;

    bool operator==(const BusWrite &other) const
    {
        return address == other.address && reg == other.reg && value == other.value;
    }
};

// Записи шины остаются доступны тесту после передачи владения
struct BusLog
{
    std::vector<BusWrite> writes;
    int fail_on_write = -1;
    bool closed = false;
};

class FakeBus : public i2c::IBus
{
public:
    explicit FakeBus(std::shared_ptr<BusLog> log)
        : log_(std::move(log))
    {}

    void writeByteToRegister(uint8_t address, uint8_t reg, uint8_t value) override
    {
        if (log_->fail_on_write == static_cast<int>(log_->writes.size())) {
            throw IoError("bus write failed");
        }
        log_->writes.push_back({address, reg, value});
    }

    void close() override { log_->closed = true; }

private:
    std::shared_ptr<BusLog> log_;
};

struct ConnectionWrite
{
    bool register_select;
    uint8_t data;

    bool operator==(const ConnectionWrite &other) const
    {
        return register_select == other.register_select && data == other.data;
    }
};

struct ConnectionLog
{
    std::vector<ConnectionWrite> writes;
    std::vector<bool> backlight;
    int fail_on_write = -1;
    bool closed = false;

    std::vector<uint8_t> instructions() const
    {
        std::vector<uint8_t> result;
        for (const auto &write : writes) {
            if (!write.register_select) {
                result.push_back(write.data);
            }
        }
        return result;
    }
};

class FakeConnection : public lcd::IConnection
{
public:
    explicit FakeConnection(std::shared_ptr<ConnectionLog> log)
        : log_(std::move(log))
    {}

    void write(bool register_select, uint8_t data) override
    {
        if (log_->fail_on_write == static_cast<int>(log_->writes.size())) {
            throw IoError("connection write failed");
        }
        log_->writes.push_back({register_select, data});
    }

    void backlightOn() override { log_->backlight.push_back(true); }
    void backlightOff() override { log_->backlight.push_back(false); }
    void close() override { log_->closed = true; }

private:
    std::shared_ptr<ConnectionLog> log_;
};

struct PinLog
{
    int close_count = 0;
    bool fail_close = false;
    gpio::Direction direction = gpio::Direction::Input;
    gpio::DigitalValue value = gpio::DigitalValue::Low;
    int analog_value = 0;
};

class FakeDigitalPin : public gpio::IDigitalPin
{
public:
    FakeDigitalPin(int number, std::shared_ptr<PinLog> log)
        : number_(number)
        , log_(std::move(log))
    {}

    int number() const override { return number_; }
    void setDirection(gpio::Direction direction) override { log_->direction = direction; }
    void write(gpio::DigitalValue value) override { log_->value = value; }
    gpio::DigitalValue read() override { return log_->value; }

    void close() override
    {
        if (log_->fail_close) {
            throw IoError("unexport failed for pin " + std::to_string(number_));
        }
        log_->close_count++;
    }

private:
    int number_;
    std::shared_ptr<PinLog> log_;
};

class FakeAnalogPin : public gpio::IAnalogPin
{
public:
    FakeAnalogPin(int number, std::shared_ptr<PinLog> log)
        : number_(number)
        , log_(std::move(log))
    {}

    int number() const override { return number_; }
    int read() override { return log_->analog_value; }

    void close() override
    {
        if (log_->fail_close) {
            throw IoError("close failed for pin " + std::to_string(number_));
        }
        log_->close_count++;
    }

private:
    int number_;
    std::shared_ptr<PinLog> log_;
};

struct DriverLog
{
    int digital_opens = 0;
    int analog_opens = 0;
    std::map<int, std::shared_ptr<PinLog>> pins;

    std::shared_ptr<PinLog> pin(int number)
    {
        auto &log = pins[number];
        if (!log) {
            log = std::make_shared<PinLog>();
        }
        return log;
    }
};

class FakeDriver : public gpio::IDriver
{
public:
    explicit FakeDriver(std::shared_ptr<DriverLog> log)
        : log_(std::move(log))
    {}

    std::unique_ptr<gpio::IDigitalPin> openDigital(const gpio::PinDescriptor &pin) override
    {
        log_->digital_opens++;
        return std::make_unique<FakeDigitalPin>(pin.number, log_->pin(pin.number));
    }

    std::unique_ptr<gpio::IAnalogPin> openAnalog(const gpio::PinDescriptor &pin) override
    {
        log_->analog_opens++;
        return std::make_unique<FakeAnalogPin>(pin.number, log_->pin(pin.number));
    }

private:
    std::shared_ptr<DriverLog> log_;
};

class MockClient : public mqtt::IClient
{
public:
    MOCK_METHOD(void, connect, (), (override));
    MOCK_METHOD(void, disconnect, (), (override));
    MOCK_METHOD(bool, isConnected, (), (override));
    MOCK_METHOD(void, subscribe, (const std::string &topic), (override));
    MOCK_METHOD(void, publish, (const std::string &topic, const std::string &payload), (override));
    MOCK_METHOD(void,
                publishRetained,
                (const std::string &topic, const std::string &payload),
                (override));
    MOCK_METHOD(void, setLastWill, (const std::string &topic, const std::string &payload), (override));
    MOCK_METHOD(void, setMessageCallback, (MessageCallback callback), (override));
    MOCK_METHOD(void, setConnectCallback, (ConnectCallback callback), (override));
    MOCK_METHOD(void, setDisconnectCallback, (DisconnectCallback callback), (override));
};

} // namespace fakes
