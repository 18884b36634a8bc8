#include "pin_registry.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace gpio {

namespace {

uint32_t capabilityFromName(const std::string &name)
{
    static const std::unordered_map<std::string, uint32_t> capabilities = {
        {"gpio", cap::Normal},
        {"i2c", cap::I2c},
        {"uart", cap::Uart},
        {"spi", cap::Spi},
        {"gpmc", cap::Gpmc},
        {"lcd", cap::Lcd},
        {"pwm", cap::Pwm},
        {"analog", cap::Analog},
    };

    auto it = capabilities.find(name);
    if (it == capabilities.end()) {
        throw std::runtime_error("Unknown pin capability: " + name);
    }
    return it->second;
}

} // namespace

PinRegistry::PinRegistry(std::vector<PinDescriptor> pins)
    : pins_(std::move(pins))
{
    validate();
}

PinRegistry PinRegistry::fromJson(const nlohmann::json &document)
{
    if (!document.is_array()) {
        throw std::runtime_error("Pin table must be a JSON array");
    }

    std::vector<PinDescriptor> pins;
    pins.reserve(document.size());

    for (const auto &entry : document) {
        if (!entry.contains("number") || !entry["number"].is_number_integer()) {
            throw std::runtime_error("Pin entry without integer 'number': " + entry.dump());
        }

        PinDescriptor pin{entry["number"].get<int>(), {}, 0};

        if (entry.contains("ids")) {
            pin.ids = entry["ids"].get<std::vector<std::string>>();
        }
        if (entry.contains("caps")) {
            for (const auto &name : entry["caps"]) {
                pin.caps |= capabilityFromName(name.get<std::string>());
            }
        }
        if (entry.contains("analog_channel")) {
            pin.analog_channel = entry["analog_channel"].get<int>();
        }

        pins.push_back(std::move(pin));
    }

    return PinRegistry(std::move(pins));
}

PinRegistry PinRegistry::fromFile(const std::string &path)
{
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open pin table: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("Invalid pin table " + path + ": " + e.what());
    }
    return fromJson(document);
}

std::optional<PinDescriptor> PinRegistry::lookup(const PinKey &key) const
{
    if (const int *number = std::get_if<int>(&key)) {
        for (const auto &pin : pins_) {
            if (pin.number == *number) {
                return pin;
            }
        }
        return std::nullopt;
    }

    const auto &alias = std::get<std::string>(key);
    for (const auto &pin : pins_) {
        for (const auto &id : pin.ids) {
            if (id == alias) {
                return pin;
            }
        }
    }
    return std::nullopt;
}

void PinRegistry::validate() const
{
    std::set<int> numbers;
    std::set<std::string> aliases;

    for (const auto &pin : pins_) {
        if (!numbers.insert(pin.number).second) {
            throw std::invalid_argument("Duplicate pin number in pin table: "
                                        + std::to_string(pin.number));
        }
        for (const auto &id : pin.ids) {
            // Повторный псевдоним допустим, но lookup вернёт первый пин
            if (!aliases.insert(id).second) {
                std::cerr << "[GPIO] Pin alias '" << id << "' is used more than once, pin "
                          << pin.number << " is shadowed for it" << std::endl;
            }
        }
    }
}

} // namespace gpio
