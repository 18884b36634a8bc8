#pragma once

#include "gpio_types.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gpio {

// Таблица пинов платы. Только поиск, состояния нет.
class PinRegistry
{
public:
    PinRegistry() = default;
    explicit PinRegistry(std::vector<PinDescriptor> pins);

    // JSON-массив объектов {"number", "ids", "caps", "analog_channel"}
    static PinRegistry fromJson(const nlohmann::json &document);
    static PinRegistry fromFile(const std::string &path);

    // Первое совпадение по номеру или псевдониму
    std::optional<PinDescriptor> lookup(const PinKey &key) const;

    const std::vector<PinDescriptor> &pins() const { return pins_; }
    std::size_t size() const { return pins_.size(); }

private:
    void validate() const;

    std::vector<PinDescriptor> pins_;
};

} // namespace gpio
