#pragma once

#include <cstdint>

namespace lcd {

// Способ доставки байтов до контроллера HD44780
class IConnection
{
public:
    virtual ~IConnection() = default;

    // register_select = true: данные, false: команда
    virtual void write(bool register_select, uint8_t data) = 0;

    virtual void backlightOn() = 0;
    virtual void backlightOff() = 0;

    virtual void close() = 0;
};

} // namespace lcd
