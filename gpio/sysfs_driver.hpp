#pragma once

#include "gpio_idriver.hpp"

#include <string>

namespace gpio {

// Цифровой пин через /sys/class/gpio. Экспортируется в конструкторе, освобождается в close().
class SysfsDigitalPin : public IDigitalPin
{
public:
    SysfsDigitalPin(std::string root, int number);
    ~SysfsDigitalPin() override;

    SysfsDigitalPin(const SysfsDigitalPin &) = delete;
    SysfsDigitalPin &operator=(const SysfsDigitalPin &) = delete;

    int number() const override final { return number_; }

    void setDirection(Direction direction) override final;
    void write(DigitalValue value) override final;
    DigitalValue read() override final;

    void close() override final;

private:
    std::string pinPath(const std::string &attribute) const;
    void ensureOpen() const;

    std::string root_;
    int number_;
    bool exported_{false};
};

// Аналоговый вход через IIO: <root>/in_voltage<N>_raw
class IioAnalogPin : public IAnalogPin
{
public:
    IioAnalogPin(std::string root, int number, int channel);

    int number() const override final { return number_; }
    int read() override final;
    void close() override final;

private:
    std::string root_;
    int number_;
    int channel_;
    bool open_{true};
};

class SysfsDriver : public IDriver
{
public:
    SysfsDriver(std::string gpio_root = "/sys/class/gpio",
                std::string iio_root = "/sys/bus/iio/devices/iio:device0");

    std::unique_ptr<IDigitalPin> openDigital(const PinDescriptor &pin) override final;
    std::unique_ptr<IAnalogPin> openAnalog(const PinDescriptor &pin) override final;

private:
    std::string gpio_root_;
    std::string iio_root_;
};

} // namespace gpio
