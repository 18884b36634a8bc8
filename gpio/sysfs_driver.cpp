#include "sysfs_driver.hpp"
#include "io_error.hpp"

#include <cerrno>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace gpio {

namespace {

void writeAttribute(const std::string &path, const std::string &value)
{
    std::ofstream file(path);
    if (!file) {
        throw IoError("Failed to open " + path, errno);
    }
    file << value;
    file.flush();
    if (!file) {
        throw IoError("Failed to write '" + value + "' to " + path, errno);
    }
}

std::string readAttribute(const std::string &path)
{
    std::ifstream file(path);
    if (!file) {
        throw IoError("Failed to open " + path, errno);
    }
    std::string value;
    if (!(file >> value)) {
        throw IoError("Failed to read " + path);
    }
    return value;
}

} // namespace

SysfsDigitalPin::SysfsDigitalPin(std::string root, int number)
    : root_(std::move(root))
    , number_(number)
{
    writeAttribute(root_ + "/export", std::to_string(number_));
    exported_ = true;
}

SysfsDigitalPin::~SysfsDigitalPin()
{
    if (exported_) {
        try {
            close();
        } catch (const std::exception &e) {
            std::cerr << "[GPIO] Failed to unexport pin " << number_ << ": " << e.what()
                      << std::endl;
        }
    }
}

void SysfsDigitalPin::setDirection(Direction direction)
{
    ensureOpen();
    writeAttribute(pinPath("direction"), direction == Direction::Output ? "out" : "in");
}

void SysfsDigitalPin::write(DigitalValue value)
{
    ensureOpen();
    writeAttribute(pinPath("value"), value == DigitalValue::High ? "1" : "0");
}

DigitalValue SysfsDigitalPin::read()
{
    ensureOpen();
    return readAttribute(pinPath("value")) == "0" ? DigitalValue::Low : DigitalValue::High;
}

void SysfsDigitalPin::close()
{
    if (!exported_) {
        return;
    }
    writeAttribute(root_ + "/unexport", std::to_string(number_));
    exported_ = false;
}

std::string SysfsDigitalPin::pinPath(const std::string &attribute) const
{
    return root_ + "/gpio" + std::to_string(number_) + "/" + attribute;
}

void SysfsDigitalPin::ensureOpen() const
{
    if (!exported_) {
        throw IoError("Digital pin " + std::to_string(number_) + " is closed");
    }
}

IioAnalogPin::IioAnalogPin(std::string root, int number, int channel)
    : root_(std::move(root))
    , number_(number)
    , channel_(channel)
{}

int IioAnalogPin::read()
{
    if (!open_) {
        throw IoError("Analog pin " + std::to_string(number_) + " is closed");
    }

    const std::string path = root_ + "/in_voltage" + std::to_string(channel_) + "_raw";
    const std::string raw = readAttribute(path);
    try {
        return std::stoi(raw);
    } catch (const std::exception &) {
        throw IoError("Unexpected value '" + raw + "' in " + path);
    }
}

void IioAnalogPin::close()
{
    open_ = false;
}

SysfsDriver::SysfsDriver(std::string gpio_root, std::string iio_root)
    : gpio_root_(std::move(gpio_root))
    , iio_root_(std::move(iio_root))
{}

std::unique_ptr<IDigitalPin> SysfsDriver::openDigital(const PinDescriptor &pin)
{
    return std::make_unique<SysfsDigitalPin>(gpio_root_, pin.number);
}

std::unique_ptr<IAnalogPin> SysfsDriver::openAnalog(const PinDescriptor &pin)
{
    if (pin.analog_channel < 0) {
        throw std::invalid_argument("Pin " + std::to_string(pin.number)
                                    + " has no analog channel in the pin table");
    }
    return std::make_unique<IioAnalogPin>(iio_root_, pin.number, pin.analog_channel);
}

} // namespace gpio
