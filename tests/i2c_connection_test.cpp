#include "fakes.hpp"
#include "lcd/i2c_connection.hpp"
#include "lcd/lcd_constants.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace {

constexpr uint8_t expander_address = 0x20;

// D4→1, D5→2, D6→3, D7→4, RS→7, EN→5
constexpr lcd::PinMap example_pin_map{7, 6, 5, 1, 2, 3, 4, std::nullopt, lcd::BacklightPolarity::Positive};

class I2cConnectionTest : public ::testing::Test
{
protected:
    std::unique_ptr<lcd::I2cConnection> connect(const lcd::PinMap &pin_map)
    {
        bus_log_ = std::make_shared<fakes::BusLog>();
        auto connection = std::make_unique<lcd::I2cConnection>(
            std::make_unique<fakes::FakeBus>(bus_log_), expander_address, pin_map);
        bus_log_->writes.clear();
        return connection;
    }

    static fakes::BusWrite data(uint8_t value)
    {
        return {expander_address, lcd::mcp23017::GpioB, value};
    }

    std::shared_ptr<fakes::BusLog> bus_log_;
};

} // namespace

TEST_F(I2cConnectionTest, ConstructionConfiguresExpander)
{
    auto log = std::make_shared<fakes::BusLog>();
    lcd::I2cConnection connection(std::make_unique<fakes::FakeBus>(log),
                                  expander_address,
                                  lcd::Mcp230xxPinMap);

    const std::vector<fakes::BusWrite> expected = {
        {expander_address, 0x05, 0x00},
        {expander_address, 0x0A, 0x20},
        {expander_address, 0x12, 0x40},
        {expander_address, 0x00, 0x00},
        {expander_address, 0x01, 0x00},
    };
    EXPECT_EQ(log->writes, expected);
}

TEST_F(I2cConnectionTest, ConstructionFailurePropagates)
{
    auto log = std::make_shared<fakes::BusLog>();
    log->fail_on_write = 2;

    EXPECT_THROW(lcd::I2cConnection(std::make_unique<fakes::FakeBus>(log),
                                    expander_address,
                                    lcd::Mcp230xxPinMap),
                 IoError);
}

TEST_F(I2cConnectionTest, DataByteIsSentAsTwoStrobedNibbles)
{
    auto connection = connect(example_pin_map);

    connection->write(true, 0x41);

    // 0100 -> D6 (бит 3), 0001 -> D4 (бит 1), RS = бит 7, EN = бит 5
    const std::vector<fakes::BusWrite> expected = {
        data(0x88), data(0xA8), data(0x88),
        data(0x82), data(0xA2), data(0x82),
    };
    EXPECT_EQ(bus_log_->writes, expected);
}

TEST_F(I2cConnectionTest, InstructionLeavesRegisterSelectClear)
{
    auto connection = connect(example_pin_map);

    connection->write(false, 0x41);

    const std::vector<fakes::BusWrite> expected = {
        data(0x08), data(0x28), data(0x08),
        data(0x02), data(0x22), data(0x02),
    };
    EXPECT_EQ(bus_log_->writes, expected);
}

TEST_F(I2cConnectionTest, WriteHonoursStrobeAndSettleDelays)
{
    auto connection = connect(example_pin_map);

    const auto start = std::chrono::steady_clock::now();
    connection->write(true, 0x41);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // 2 полубайта по 3 записи, перед каждой PulseDelay, после байта WriteDelay
    EXPECT_GE(elapsed, 6 * lcd::timing::PulseDelay + lcd::timing::WriteDelay);
}

TEST_F(I2cConnectionTest, EncodingIsDeterministic)
{
    auto connection = connect(lcd::Mcp230xxPinMap);

    connection->write(true, 0xA5);
    auto first = bus_log_->writes;
    bus_log_->writes.clear();
    connection->write(true, 0xA5);

    EXPECT_EQ(first, bus_log_->writes);
    EXPECT_EQ(first.size(), 6u);
}

TEST_F(I2cConnectionTest, EncodeMapsEachBitToItsPin)
{
    // Mcp230xxPinMap: D4→4, D5→3, D6→2, D7→1, RS→7
    auto frames = lcd::I2cConnection::encode(lcd::Mcp230xxPinMap, false, 0x81);
    EXPECT_EQ(frames[0], 0x02); // 1000: только D7
    EXPECT_EQ(frames[1], 0x10); // 0001: только D4

    frames = lcd::I2cConnection::encode(lcd::Mcp230xxPinMap, true, 0xFF);
    EXPECT_EQ(frames[0], 0x9E);
    EXPECT_EQ(frames[1], 0x9E);

    frames = lcd::I2cConnection::encode(lcd::Mcp230xxPinMap, false, 0x00);
    EXPECT_EQ(frames[0], 0x00);
    EXPECT_EQ(frames[1], 0x00);
}

TEST_F(I2cConnectionTest, BusFailureStopsTheStrobe)
{
    auto connection = connect(example_pin_map);
    bus_log_->fail_on_write = 4;

    EXPECT_THROW(connection->write(true, 0x41), IoError);
    EXPECT_EQ(bus_log_->writes.size(), 4u);
}

TEST_F(I2cConnectionTest, ActiveLowBacklight)
{
    auto connection = connect(lcd::Mcp230xxPinMap);

    connection->backlightOn();
    connection->backlightOff();

    const std::vector<fakes::BusWrite> expected = {
        {expander_address, lcd::mcp23017::GpioA, 0x00},
        {expander_address, lcd::mcp23017::GpioA, 0x40},
    };
    EXPECT_EQ(bus_log_->writes, expected);
}

TEST_F(I2cConnectionTest, ActiveHighBacklight)
{
    lcd::PinMap pin_map = example_pin_map;
    pin_map.backlight = 0;
    pin_map.backlight_polarity = lcd::BacklightPolarity::Positive;
    auto connection = connect(pin_map);

    connection->backlightOn();
    connection->backlightOff();

    const std::vector<fakes::BusWrite> expected = {
        {expander_address, lcd::mcp23017::GpioA, 0x01},
        {expander_address, lcd::mcp23017::GpioA, 0x00},
    };
    EXPECT_EQ(bus_log_->writes, expected);
}

TEST_F(I2cConnectionTest, NoBacklightLineMeansNoWrites)
{
    auto connection = connect(example_pin_map);

    connection->backlightOn();
    connection->backlightOff();

    EXPECT_TRUE(bus_log_->writes.empty());
}

TEST_F(I2cConnectionTest, CloseClosesBus)
{
    auto connection = connect(example_pin_map);

    connection->close();

    EXPECT_TRUE(bus_log_->closed);
}
