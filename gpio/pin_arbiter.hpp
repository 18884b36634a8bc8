#pragma once

#include "gpio_idriver.hpp"
#include "gpio_ipin.hpp"
#include "pin_registry.hpp"

#include <map>
#include <memory>
#include <string>
#include <variant>

namespace gpio {

// Выдаёт не более одного открытого хэндла на физический пин.
// Внутренней синхронизации нет: вызовы из разных потоков сериализует вызывающий.
class PinArbiter
{
public:
    PinArbiter(PinRegistry registry, std::unique_ptr<IDriver> driver);
    ~PinArbiter();

    PinArbiter(const PinArbiter &) = delete;
    PinArbiter &operator=(const PinArbiter &) = delete;

    // Хэндлом владеет арбитр, ссылка действительна до release()/closeAll()
    IDigitalPin &acquireDigital(const PinKey &key);
    IAnalogPin &acquireAnalog(const PinKey &key);

    void release(const PinKey &key);

    // Останавливается на первой ошибке: этот пин и все следующие остаются открытыми
    void closeAll();

    bool isAcquired(const PinKey &key) const;
    std::size_t size() const { return pins_.size(); }

    const PinRegistry &registry() const { return registry_; }

private:
    using PinHandle = std::variant<std::unique_ptr<IDigitalPin>, std::unique_ptr<IAnalogPin>>;

    PinDescriptor resolve(const PinKey &key) const;
    void checkCapability(const PinKey &key,
                         const PinDescriptor &pin,
                         uint32_t required,
                         PinKind kind) const;

    static PinKind kindOf(const PinHandle &handle);
    static void closeHandle(PinHandle &handle);

    void printMessage(const std::string &msg) const;
    void printError(const std::string &msg) const;

private:
    PinRegistry registry_;
    std::unique_ptr<IDriver> driver_;
    std::map<int, PinHandle> pins_;
};

} // namespace gpio
