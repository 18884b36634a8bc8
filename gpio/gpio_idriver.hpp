#pragma once

#include "gpio_ipin.hpp"
#include "gpio_types.hpp"

#include <memory>

namespace gpio {

// Физическая настройка пинов. PinArbiter вызывает open* только после проверки возможностей.
class IDriver
{
public:
    virtual ~IDriver() = default;

    virtual std::unique_ptr<IDigitalPin> openDigital(const PinDescriptor &pin) = 0;
    virtual std::unique_ptr<IAnalogPin> openAnalog(const PinDescriptor &pin) = 0;
};

} // namespace gpio
