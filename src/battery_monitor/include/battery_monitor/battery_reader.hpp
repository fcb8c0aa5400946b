#ifndef BATTERY_MONITOR__BATTERY_READER_HPP_
#define BATTERY_MONITOR__BATTERY_READER_HPP_

#include "battery_history/sample.hpp"
#include <string>

namespace battery_monitor
{

class BatteryReader
{
public:
  static constexpr const char* DEFAULT_POWER_SUPPLY_ROOT = "/sys/class/power_supply";

  explicit BatteryReader(const std::string& power_supply_root = DEFAULT_POWER_SUPPLY_ROOT);
  ~BatteryReader() = default;

  // Locate the first power supply whose type is "Battery".
  // Returns false if the machine has none.
  bool open();

  bool isOpen() const { return !battery_path_.empty(); }

  // Read one sample; false if capacity or status could not be read
  bool readSample(battery_history::Sample& sample) const;

  // "<manufacturer> <model>", or the sysfs directory name
  std::string batteryName() const;

  const std::string& batteryPath() const { return battery_path_; }

private:
  bool readString(const std::string& attribute, std::string& value) const;
  bool readInteger(const std::string& attribute, long long& value) const;
  long long readIntegerOr(const std::string& attribute, long long fallback) const;

  std::string root_;
  std::string battery_path_;
};

// Map a sysfs status string ("Not charging", ...) to a status
battery_history::BatteryStatus parseSysfsStatus(const std::string& text);

} // namespace battery_monitor

#endif // BATTERY_MONITOR__BATTERY_READER_HPP_
