#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

// Ошибка ввода-вывода: шина I2C, sysfs, IIO
class IoError : public std::runtime_error
{
public:
    explicit IoError(const std::string &what)
        : std::runtime_error(what)
    {}

    IoError(const std::string &what, int error_number)
        : std::runtime_error(what + ": " + std::strerror(error_number))
        , error_number_(error_number)
    {}

    int errorNumber() const noexcept { return error_number_; }

private:
    int error_number_ = 0;
};
