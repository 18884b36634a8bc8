#include "application.hpp"
#include "config.hpp"
#include "gpio/pin_arbiter.hpp"
#include "gpio/pin_registry.hpp"
#include "gpio/sysfs_driver.hpp"
#include "i2c/linux_bus.hpp"
#include "lcd/controller.hpp"
#include "lcd/lcd_pin_map.hpp"
#include "mqtt/mqtt_client.hpp"

#include <cstdint>
#include <cstdlib> // std::getenv
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

std::string getEnvVar(const std::string &key, const std::string &default_value = "")
{
    if (const char *val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return default_value;
}

int getEnvVarInt(const std::string &key, int default_value)
{
    if (const char *val = std::getenv(key.c_str())) {
        // 0x27 и 39 одинаково допустимы для адреса
        return std::stoi(val, nullptr, 0);
    }
    return default_value;
}

int main()
{
    try {
        AppConfig app_config{
            .max_reconnect_attempts = getEnvVarInt("MAX_RECONNECT_ATTEMPTS", 5),
            .display = DisplayConfig{.i2c_device = getEnvVar("LCD_I2C_DEVICE", "/dev/i2c-1"),
                                     .expander_address = getEnvVarInt("LCD_I2C_ADDRESS", 0x20),
                                     .columns = getEnvVarInt("LCD_COLUMNS", 16)},
            .gpio = GpioConfig{
                .pin_table_file = getEnvVar("PIN_TABLE_FILE", "boards/beaglebone_black.json"),
                .sysfs_gpio_root = getEnvVar("SYSFS_GPIO_ROOT", "/sys/class/gpio"),
                .iio_device_root = getEnvVar("IIO_DEVICE_ROOT", "/sys/bus/iio/devices/iio:device0"),
                .status_led_pin = getEnvVar("STATUS_LED_PIN", "")}};

        MqttConfig mqtt_config{.host = getEnvVar("MQTT_HOST", "localhost"),
                               .port = getEnvVarInt("MQTT_PORT", 1883),
                               .client_id = getEnvVar("MQTT_CLIENT_ID", "charlcd_node"),
                               .username = getEnvVar("MQTT_USERNAME", ""),
                               .password = getEnvVar("MQTT_PASSWORD", "")};

        if (app_config.display.columns != 16 && app_config.display.columns != 20) {
            throw std::runtime_error("LCD_COLUMNS must be 16 or 20");
        }
        const auto &row_address = app_config.display.columns == 20 ? lcd::RowAddress20Col
                                                                    : lcd::RowAddress16Col;

        std::unique_ptr<mqtt::IClient> mqtt_client = std::make_unique<mqtt::Client>(mqtt_config);

        std::unique_ptr<lcd::Controller> display = lcd::Controller::createI2c(
            std::make_unique<i2c::LinuxBus>(app_config.display.i2c_device),
            static_cast<uint8_t>(app_config.display.expander_address),
            lcd::Mcp230xxPinMap,
            row_address);

        auto pins = std::make_unique<gpio::PinArbiter>(
            gpio::PinRegistry::fromFile(app_config.gpio.pin_table_file),
            std::make_unique<gpio::SysfsDriver>(app_config.gpio.sysfs_gpio_root,
                                                app_config.gpio.iio_device_root));

        Application app(app_config, std::move(mqtt_client), std::move(display), std::move(pins));

        app.run();
    } catch (const std::exception &ex) {
        std::cerr << "[MAIN] Unhandled exception: " << ex.what() << std::endl;
        return 1;
    }
}
