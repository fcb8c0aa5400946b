#include <gtest/gtest.h>
#include "battery_monitor/battery_reader.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using battery_history::BatteryStatus;
using battery_monitor::BatteryReader;

// Fake /sys/class/power_supply tree in a temporary directory
class BatteryReaderTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = std::filesystem::temp_directory_path() /
      ("battery_reader_" + std::to_string(::getpid()) + "_" +
       ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
  }

  void TearDown() override
  {
    std::filesystem::remove_all(root_);
  }

  void writeAttribute(const std::string& supply, const std::string& name, const std::string& value)
  {
    std::filesystem::create_directories(root_ / supply);
    std::ofstream file(root_ / supply / name);
    file << value << "\n";
  }

  void makeBattery(const std::string& name, const std::string& status, long long power_uw)
  {
    writeAttribute(name, "type", "Battery");
    writeAttribute(name, "capacity", "87");
    writeAttribute(name, "status", status);
    writeAttribute(name, "power_now", std::to_string(power_uw));
    writeAttribute(name, "voltage_now", "12450000");
    writeAttribute(name, "energy_now", "49600000");
    writeAttribute(name, "energy_full", "57000000");
  }

  std::filesystem::path root_;
};

TEST_F(BatteryReaderTest, FindsBatteryAmongSupplies)
{
  writeAttribute("AC", "type", "Mains");
  makeBattery("BAT1", "Discharging", 1000000);
  makeBattery("BAT0", "Discharging", 1000000);

  BatteryReader reader(root_.string());
  ASSERT_TRUE(reader.open());
  EXPECT_EQ(std::filesystem::path(reader.batteryPath()).filename().string(), "BAT0");
}

TEST_F(BatteryReaderTest, NoBatteryFails)
{
  writeAttribute("AC", "type", "Mains");

  BatteryReader reader(root_.string());
  EXPECT_FALSE(reader.open());
  EXPECT_FALSE(reader.isOpen());

  battery_history::Sample sample;
  EXPECT_FALSE(reader.readSample(sample));
}

TEST_F(BatteryReaderTest, MissingRootFails)
{
  BatteryReader reader((root_ / "does_not_exist").string());
  EXPECT_FALSE(reader.open());
}

TEST_F(BatteryReaderTest, ReadsDischargingSample)
{
  makeBattery("BAT0", "Discharging", 8250000);

  BatteryReader reader(root_.string());
  ASSERT_TRUE(reader.open());

  battery_history::Sample sample;
  ASSERT_TRUE(reader.readSample(sample));
  EXPECT_DOUBLE_EQ(sample.capacity_percent, 87.0);
  EXPECT_EQ(sample.status, BatteryStatus::Discharging);
  EXPECT_NEAR(sample.power_watts, -8.25, 1e-9);
  EXPECT_NEAR(sample.voltage_volts, 12.45, 1e-9);
  EXPECT_NEAR(sample.energy_wh, 49.6, 1e-9);
  EXPECT_NEAR(sample.energy_full_wh, 57.0, 1e-9);
}

TEST_F(BatteryReaderTest, ChargingPowerIsPositive)
{
  makeBattery("BAT0", "Charging", 30000000);

  BatteryReader reader(root_.string());
  ASSERT_TRUE(reader.open());

  battery_history::Sample sample;
  ASSERT_TRUE(reader.readSample(sample));
  EXPECT_EQ(sample.status, BatteryStatus::Charging);
  EXPECT_NEAR(sample.power_watts, 30.0, 1e-9);
}

TEST_F(BatteryReaderTest, IdleStatesReportZeroPower)
{
  makeBattery("BAT0", "Not charging", 500000);

  BatteryReader reader(root_.string());
  ASSERT_TRUE(reader.open());

  battery_history::Sample sample;
  ASSERT_TRUE(reader.readSample(sample));
  EXPECT_EQ(sample.status, BatteryStatus::NotCharging);
  EXPECT_DOUBLE_EQ(sample.power_watts, 0.0);
}

TEST_F(BatteryReaderTest, PowerFromCurrentWhenPowerMissing)
{
  makeBattery("BAT0", "Discharging", 0);
  std::filesystem::remove(root_ / "BAT0" / "power_now");
  writeAttribute("BAT0", "current_now", "2000000");   // 2 A at 12.45 V

  BatteryReader reader(root_.string());
  ASSERT_TRUE(reader.open());

  battery_history::Sample sample;
  ASSERT_TRUE(reader.readSample(sample));
  EXPECT_NEAR(sample.power_watts, -24.9, 1e-6);
}

TEST_F(BatteryReaderTest, MissingCapacityIsUnavailable)
{
  makeBattery("BAT0", "Discharging", 1000000);
  std::filesystem::remove(root_ / "BAT0" / "capacity");

  BatteryReader reader(root_.string());
  ASSERT_TRUE(reader.open());

  battery_history::Sample sample;
  EXPECT_FALSE(reader.readSample(sample));
}

TEST_F(BatteryReaderTest, NameFromManufacturerAndModel)
{
  makeBattery("BAT0", "Full", 0);

  BatteryReader reader(root_.string());
  ASSERT_TRUE(reader.open());
  EXPECT_EQ(reader.batteryName(), "BAT0");

  writeAttribute("BAT0", "manufacturer", "SMP");
  writeAttribute("BAT0", "model_name", "5B10W13975");
  EXPECT_EQ(reader.batteryName(), "SMP 5B10W13975");
}

TEST(BatteryReaderStatus, ParsesSysfsStrings)
{
  EXPECT_EQ(battery_monitor::parseSysfsStatus("Charging"), BatteryStatus::Charging);
  EXPECT_EQ(battery_monitor::parseSysfsStatus("Discharging"), BatteryStatus::Discharging);
  EXPECT_EQ(battery_monitor::parseSysfsStatus("Not charging"), BatteryStatus::NotCharging);
  EXPECT_EQ(battery_monitor::parseSysfsStatus("Full"), BatteryStatus::Full);
  EXPECT_EQ(battery_monitor::parseSysfsStatus("Unknown"), BatteryStatus::Unknown);
  EXPECT_EQ(battery_monitor::parseSysfsStatus(""), BatteryStatus::Unknown);
}
