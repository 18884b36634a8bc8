#include "gpio/sysfs_driver.hpp"
#include "io_error.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

// Каталог, имитирующий /sys/class/gpio и устройство IIO
class SysfsDriverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        root_ = fs::temp_directory_path()
                / ("charlcd_sysfs_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "gpio" / "gpio17");
        fs::create_directories(root_ / "iio");
        writeFile(root_ / "gpio" / "gpio17" / "value", "0\n");
        writeFile(root_ / "gpio" / "gpio17" / "direction", "in\n");
    }

    void TearDown() override { fs::remove_all(root_); }

    static void writeFile(const fs::path &path, const std::string &content)
    {
        std::ofstream file(path);
        file << content;
    }

    static std::string readFile(const fs::path &path)
    {
        std::ifstream file(path);
        std::string content;
        file >> content;
        return content;
    }

    gpio::SysfsDriver driver() const
    {
        return gpio::SysfsDriver((root_ / "gpio").string(), (root_ / "iio").string());
    }

    fs::path root_;
};

} // namespace

TEST_F(SysfsDriverTest, DigitalPinExportsAndDrivesValue)
{
    auto sysfs = driver();
    auto pin = sysfs.openDigital({17, {"P9_23"}, gpio::cap::Normal});

    EXPECT_EQ(readFile(root_ / "gpio" / "export"), "17");
    EXPECT_EQ(pin->number(), 17);

    pin->setDirection(gpio::Direction::Output);
    pin->write(gpio::DigitalValue::High);

    EXPECT_EQ(readFile(root_ / "gpio" / "gpio17" / "direction"), "out");
    EXPECT_EQ(readFile(root_ / "gpio" / "gpio17" / "value"), "1");
    EXPECT_EQ(pin->read(), gpio::DigitalValue::High);

    pin->write(gpio::DigitalValue::Low);
    EXPECT_EQ(pin->read(), gpio::DigitalValue::Low);
}

TEST_F(SysfsDriverTest, CloseUnexportsOnceAndRejectsFurtherIo)
{
    auto sysfs = driver();
    auto pin = sysfs.openDigital({17, {}, gpio::cap::Normal});

    pin->close();
    EXPECT_EQ(readFile(root_ / "gpio" / "unexport"), "17");

    fs::remove(root_ / "gpio" / "unexport");
    pin->close();
    EXPECT_FALSE(fs::exists(root_ / "gpio" / "unexport"));

    EXPECT_THROW(pin->write(gpio::DigitalValue::High), IoError);
}

TEST_F(SysfsDriverTest, MissingGpioRootFailsToExport)
{
    gpio::SysfsDriver sysfs((root_ / "missing").string(), (root_ / "iio").string());

    EXPECT_THROW(sysfs.openDigital({17, {}, gpio::cap::Normal}), IoError);
}

TEST_F(SysfsDriverTest, AnalogPinReadsRawChannel)
{
    writeFile(root_ / "iio" / "in_voltage2_raw", "1234\n");
    auto sysfs = driver();

    auto pin = sysfs.openAnalog({202, {"AIN2"}, gpio::cap::Analog, 2});

    EXPECT_EQ(pin->number(), 202);
    EXPECT_EQ(pin->read(), 1234);

    pin->close();
    EXPECT_THROW(pin->read(), IoError);
}

TEST_F(SysfsDriverTest, AnalogPinRejectsGarbage)
{
    writeFile(root_ / "iio" / "in_voltage0_raw", "busy\n");
    auto sysfs = driver();

    auto pin = sysfs.openAnalog({200, {}, gpio::cap::Analog, 0});

    EXPECT_THROW(pin->read(), IoError);
}

TEST_F(SysfsDriverTest, AnalogPinRequiresChannel)
{
    auto sysfs = driver();

    EXPECT_THROW(sysfs.openAnalog({200, {}, gpio::cap::Analog}), std::invalid_argument);
}
