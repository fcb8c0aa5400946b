#ifndef BATTERY_HISTORY__SAMPLE_HPP_
#define BATTERY_HISTORY__SAMPLE_HPP_

#include <chrono>
#include <cstdint>
#include <string>

namespace battery_history
{

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Battery charging state as reported by the power supply
enum class BatteryStatus
{
  Charging,
  Discharging,
  Full,
  NotCharging,
  Unknown
};

// Human readable name ("Not charging", ...)
std::string statusDisplayName(BatteryStatus status);

// Stable tag used in the persisted document ("not_charging", ...)
std::string statusTag(BatteryStatus status);

// Inverse of statusTag; unrecognized tags map to Unknown
BatteryStatus statusFromTag(const std::string& tag);

// One timestamped battery reading
struct Sample
{
  Timestamp timestamp;
  double capacity_percent;        // 0 - 100
  double power_watts;             // positive = charging, negative = discharging
  double voltage_volts;
  double energy_wh;
  double energy_full_wh;
  BatteryStatus status;
};

Sample makeSample(
  Timestamp timestamp,
  double capacity_percent,
  double power_watts,
  double voltage_volts,
  double energy_wh,
  double energy_full_wh,
  BatteryStatus status);

// Milliseconds since the Unix epoch
int64_t toEpochMillis(Timestamp timestamp);
Timestamp fromEpochMillis(int64_t millis);

// Seconds elapsed from reference to timestamp (negative if earlier)
double secondsBetween(Timestamp reference, Timestamp timestamp);

} // namespace battery_history

#endif // BATTERY_HISTORY__SAMPLE_HPP_
