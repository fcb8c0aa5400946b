#include "battery_monitor/battery_reader.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace battery_monitor
{

namespace
{

std::string trim(const std::string& text)
{
  const char* whitespace = " \t\r\n";
  size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return std::string();
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

// sysfs reports micro-units
constexpr double MICRO = 1e-6;

} // namespace

battery_history::BatteryStatus parseSysfsStatus(const std::string& text)
{
  using battery_history::BatteryStatus;

  if (text == "Charging") {
    return BatteryStatus::Charging;
  } else if (text == "Discharging") {
    return BatteryStatus::Discharging;
  } else if (text == "Not charging") {
    return BatteryStatus::NotCharging;
  } else if (text == "Full") {
    return BatteryStatus::Full;
  }
  return BatteryStatus::Unknown;
}

BatteryReader::BatteryReader(const std::string& power_supply_root)
: root_(power_supply_root)
{
}

bool BatteryReader::open()
{
  battery_path_.clear();

  std::error_code ec;
  std::filesystem::directory_iterator it(root_, ec);
  if (ec) {
    return false;
  }

  // Sorted so BAT0 wins over BAT1
  std::vector<std::string> supplies;
  for (const auto& entry : it) {
    supplies.push_back(entry.path().string());
  }
  std::sort(supplies.begin(), supplies.end());

  for (const auto& path : supplies) {
    std::ifstream file(path + "/type");
    if (!file.is_open()) {
      continue;
    }
    std::string type;
    std::getline(file, type);
    if (trim(type) == "Battery") {
      battery_path_ = path;
      return true;
    }
  }
  return false;
}

bool BatteryReader::readSample(battery_history::Sample& sample) const
{
  if (!isOpen()) {
    return false;
  }

  long long capacity;
  std::string status_text;
  if (!readInteger("capacity", capacity) || !readString("status", status_text)) {
    return false;
  }
  battery_history::BatteryStatus status = parseSysfsStatus(status_text);

  long long voltage_uv = readIntegerOr("voltage_now", 0);
  long long power_uw;
  if (!readInteger("power_now", power_uw)) {
    // Some batteries only expose current
    long long current_ua = readIntegerOr("current_now", 0);
    power_uw = std::llround(
      static_cast<double>(current_ua) * static_cast<double>(voltage_uv) * MICRO);
  }
  double power_watts = std::abs(static_cast<double>(power_uw)) * MICRO;

  // Sign convention: positive = charging, negative = discharging
  double signed_power = 0.0;
  if (status == battery_history::BatteryStatus::Charging) {
    signed_power = power_watts;
  } else if (status == battery_history::BatteryStatus::Discharging) {
    signed_power = -power_watts;
  }

  sample = battery_history::makeSample(
    battery_history::Clock::now(),
    static_cast<double>(capacity),
    signed_power,
    voltage_uv * MICRO,
    readIntegerOr("energy_now", 0) * MICRO,
    readIntegerOr("energy_full", 0) * MICRO,
    status);
  return true;
}

std::string BatteryReader::batteryName() const
{
  std::string model;
  std::string manufacturer;
  bool has_model = readString("model_name", model) && !model.empty();
  bool has_manufacturer = readString("manufacturer", manufacturer) && !manufacturer.empty();

  if (!has_model && !has_manufacturer) {
    if (battery_path_.empty()) {
      return "Battery";
    }
    return std::filesystem::path(battery_path_).filename().string();
  }
  return trim(manufacturer + " " + model);
}

bool BatteryReader::readString(const std::string& attribute, std::string& value) const
{
  std::ifstream file(battery_path_ + "/" + attribute);
  if (!file.is_open()) {
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  value = trim(buffer.str());
  return true;
}

bool BatteryReader::readInteger(const std::string& attribute, long long& value) const
{
  std::string text;
  if (!readString(attribute, text)) {
    return false;
  }

  std::istringstream iss(text);
  long long parsed;
  if (!(iss >> parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

long long BatteryReader::readIntegerOr(const std::string& attribute, long long fallback) const
{
  long long value;
  if (!readInteger(attribute, value)) {
    return fallback;
  }
  return value;
}

} // namespace battery_monitor
