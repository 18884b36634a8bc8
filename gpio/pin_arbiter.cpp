#include "pin_arbiter.hpp"
#include "pin_error.hpp"

#include <iostream>

namespace gpio {

PinArbiter::PinArbiter(PinRegistry registry, std::unique_ptr<IDriver> driver)
    : registry_(std::move(registry))
    , driver_(std::move(driver))
{
    if (!driver_) {
        throw std::invalid_argument("PinArbiter requires a pin driver");
    }
}

PinArbiter::~PinArbiter()
{
    try {
        closeAll();
    } catch (const std::exception &e) {
        printError("[GPIO] Failed to release pins on shutdown, some may remain exported: "
                   + std::string(e.what()));
    }
}

IDigitalPin &PinArbiter::acquireDigital(const PinKey &key)
{
    const PinDescriptor pin = resolve(key);

    auto it = pins_.find(pin.number);
    if (it != pins_.end()) {
        if (auto *digital = std::get_if<std::unique_ptr<IDigitalPin>>(&it->second)) {
            return **digital;
        }
        throw PinError(PinErrorCode::ModeConflict,
                       "Pin " + toString(key) + " is already initialized for "
                           + toString(kindOf(it->second)) + " mode");
    }

    checkCapability(key, pin, cap::Normal, PinKind::Digital);

    auto handle = driver_->openDigital(pin);
    IDigitalPin &ref = *handle;
    pins_.emplace(pin.number, std::move(handle));
    return ref;
}

IAnalogPin &PinArbiter::acquireAnalog(const PinKey &key)
{
    const PinDescriptor pin = resolve(key);

    auto it = pins_.find(pin.number);
    if (it != pins_.end()) {
        if (auto *analog = std::get_if<std::unique_ptr<IAnalogPin>>(&it->second)) {
            return **analog;
        }
        throw PinError(PinErrorCode::ModeConflict,
                       "Pin " + toString(key) + " is already initialized for "
                           + toString(kindOf(it->second)) + " mode");
    }

    checkCapability(key, pin, cap::Analog, PinKind::Analog);

    auto handle = driver_->openAnalog(pin);
    IAnalogPin &ref = *handle;
    pins_.emplace(pin.number, std::move(handle));
    return ref;
}

void PinArbiter::release(const PinKey &key)
{
    const PinDescriptor pin = resolve(key);

    auto it = pins_.find(pin.number);
    if (it == pins_.end()) {
        return;
    }

    closeHandle(it->second);
    pins_.erase(it);
}

void PinArbiter::closeAll()
{
    auto it = pins_.begin();
    while (it != pins_.end()) {
        closeHandle(it->second);
        it = pins_.erase(it);
    }
}

bool PinArbiter::isAcquired(const PinKey &key) const
{
    auto pin = registry_.lookup(key);
    return pin && pins_.count(pin->number) > 0;
}

PinDescriptor PinArbiter::resolve(const PinKey &key) const
{
    auto pin = registry_.lookup(key);
    if (!pin) {
        throw PinError(PinErrorCode::NotFound, "Could not find pin matching " + toString(key));
    }
    return *pin;
}

void PinArbiter::checkCapability(const PinKey &key,
                                 const PinDescriptor &pin,
                                 uint32_t required,
                                 PinKind kind) const
{
    if ((pin.caps & required) == 0) {
        throw PinError(PinErrorCode::UnsupportedMode,
                       "Pin " + toString(key) + " cannot be used for " + toString(kind) + " io");
    }

    if (pin.caps != required) {
        printMessage("[GPIO] Pin " + toString(key) + " is not a dedicated " + toString(kind)
                     + " io pin, please refer to the board reference manual for more details");
    }
}

PinKind PinArbiter::kindOf(const PinHandle &handle)
{
    return std::holds_alternative<std::unique_ptr<IDigitalPin>>(handle) ? PinKind::Digital
                                                                          : PinKind::Analog;
}

void PinArbiter::closeHandle(PinHandle &handle)
{
    std::visit([](auto &pin) { pin->close(); }, handle);
}

void PinArbiter::printMessage(const std::string &msg) const
{
    std::cout << msg << std::endl;
}

void PinArbiter::printError(const std::string &msg) const
{
    std::cerr << msg << std::endl;
}

} // namespace gpio
