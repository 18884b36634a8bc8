#pragma once

#include "gpio_types.hpp"

namespace gpio {

class IDigitalPin
{
public:
    virtual ~IDigitalPin() = default;

    virtual int number() const = 0;

    virtual void setDirection(Direction direction) = 0;
    virtual void write(DigitalValue value) = 0;
    virtual DigitalValue read() = 0;

    virtual void close() = 0;
};

class IAnalogPin
{
public:
    virtual ~IAnalogPin() = default;

    virtual int number() const = 0;

    // Сырое значение АЦП
    virtual int read() = 0;

    virtual void close() = 0;
};

} // namespace gpio
