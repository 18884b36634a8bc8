#pragma once

#include <stdexcept>
#include <string>

namespace gpio {

enum class PinErrorCode {
    NotFound,        // ключ не соответствует ни одному пину
    ModeConflict,    // пин уже открыт в другом режиме
    UnsupportedMode  // у пина нет нужной возможности
};

class PinError : public std::runtime_error
{
public:
    PinError(PinErrorCode code, const std::string &what)
        : std::runtime_error(what)
        , code_(code)
    {}

    PinErrorCode code() const noexcept { return code_; }

private:
    PinErrorCode code_;
};

} // namespace gpio
