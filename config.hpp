#pragma once

#include <string>

struct MqttConfig
{
    std::string host;
    int port;
    std::string client_id;
    std::string username;
    std::string password;
};

struct DisplayConfig
{
    std::string i2c_device;
    int expander_address;
    int columns;
};

struct GpioConfig
{
    std::string pin_table_file;
    std::string sysfs_gpio_root;
    std::string iio_device_root;
    std::string status_led_pin; // пустая строка: без индикатора
};

struct AppConfig
{
    int max_reconnect_attempts;
    DisplayConfig display;
    GpioConfig gpio;
};
