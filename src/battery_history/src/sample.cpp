#include "battery_history/sample.hpp"
#include <algorithm>

namespace battery_history
{

std::string statusDisplayName(BatteryStatus status)
{
  switch (status) {
    case BatteryStatus::Charging:
      return "Charging";
    case BatteryStatus::Discharging:
      return "Discharging";
    case BatteryStatus::Full:
      return "Full";
    case BatteryStatus::NotCharging:
      return "Not charging";
    case BatteryStatus::Unknown:
      break;
  }
  return "Unknown";
}

std::string statusTag(BatteryStatus status)
{
  switch (status) {
    case BatteryStatus::Charging:
      return "charging";
    case BatteryStatus::Discharging:
      return "discharging";
    case BatteryStatus::Full:
      return "full";
    case BatteryStatus::NotCharging:
      return "not_charging";
    case BatteryStatus::Unknown:
      break;
  }
  return "unknown";
}

BatteryStatus statusFromTag(const std::string& tag)
{
  if (tag == "charging") {
    return BatteryStatus::Charging;
  } else if (tag == "discharging") {
    return BatteryStatus::Discharging;
  } else if (tag == "full") {
    return BatteryStatus::Full;
  } else if (tag == "not_charging") {
    return BatteryStatus::NotCharging;
  }
  return BatteryStatus::Unknown;
}

Sample makeSample(
  Timestamp timestamp,
  double capacity_percent,
  double power_watts,
  double voltage_volts,
  double energy_wh,
  double energy_full_wh,
  BatteryStatus status)
{
  Sample sample;
  sample.timestamp = timestamp;
  sample.capacity_percent = std::max(0.0, std::min(100.0, capacity_percent));
  sample.power_watts = power_watts;
  sample.voltage_volts = voltage_volts;
  sample.energy_wh = energy_wh;
  sample.energy_full_wh = energy_full_wh;
  sample.status = status;
  return sample;
}

int64_t toEpochMillis(Timestamp timestamp)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    timestamp.time_since_epoch()).count();
}

Timestamp fromEpochMillis(int64_t millis)
{
  return Timestamp(std::chrono::duration_cast<Clock::duration>(
    std::chrono::milliseconds(millis)));
}

double secondsBetween(Timestamp reference, Timestamp timestamp)
{
  auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - reference);
  return delta.count() / 1000.0;
}

} // namespace battery_history
