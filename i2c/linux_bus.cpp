#include "linux_bus.hpp"
#include "io_error.hpp"

#include <cerrno>
#include <fcntl.h>
#include <iostream>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace i2c {

LinuxBus::LinuxBus(std::string device)
    : device_(std::move(device))
{
    fd_ = ::open(device_.c_str(), O_RDWR);
    if (fd_ < 0) {
        throw IoError("Failed to open I2C bus " + device_, errno);
    }
}

LinuxBus::~LinuxBus()
{
    try {
        close();
    } catch (const std::exception &e) {
        std::cerr << "[I2C] " << e.what() << std::endl;
    }
}

void LinuxBus::writeByteToRegister(uint8_t address, uint8_t reg, uint8_t value)
{
    if (fd_ < 0) {
        throw IoError("I2C bus " + device_ + " is closed");
    }

    selectDevice(address);

    const uint8_t buffer[2] = {reg, value};
    ssize_t written = ::write(fd_, buffer, sizeof(buffer));
    if (written != static_cast<ssize_t>(sizeof(buffer))) {
        throw IoError("I2C write to " + device_ + " failed", written < 0 ? errno : EIO);
    }
}

void LinuxBus::close()
{
    if (fd_ < 0) {
        return;
    }

    int fd = fd_;
    fd_ = -1;
    current_address_ = -1;
    if (::close(fd) != 0) {
        throw IoError("Failed to close I2C bus " + device_, errno);
    }
}

void LinuxBus::selectDevice(uint8_t address)
{
    if (current_address_ == address) {
        return;
    }
    if (::ioctl(fd_, I2C_SLAVE, address) < 0) {
        throw IoError("Failed to select I2C device " + std::to_string(address) + " on " + device_,
                      errno);
    }
    current_address_ = address;
}

} // namespace i2c
