#ifndef BATTERY_HISTORY__SESSION_TRACKER_HPP_
#define BATTERY_HISTORY__SESSION_TRACKER_HPP_

#include "battery_history/sample.hpp"
#include <cstddef>
#include <deque>
#include <memory>
#include <vector>

namespace battery_history
{

// A contiguous run of Charging samples
struct ChargeSession
{
  Timestamp start_time;
  Timestamp end_time;         // timestamp of the last sample in the session
  double start_capacity;
  double end_capacity;
  std::vector<Sample> samples;
  bool reached_threshold;
  bool completed;
};

class SessionTracker
{
public:
  static constexpr double COMPLETION_THRESHOLD_PERCENT = 90.0;
  static constexpr size_t MAX_COMPLETED_SESSIONS = 2;

  SessionTracker();
  ~SessionTracker() = default;

  // Advance the state machine with the next sample
  void onSample(const Sample& sample);

  // Completed sessions, oldest first
  const std::deque<ChargeSession>& completedSessions() const;

  // In-progress session, nullptr while idle
  const ChargeSession* activeSession() const;

  bool isCharging() const { return active_ != nullptr; }

  // Replace the completed list with sessions loaded from storage.
  // Entries that are not completed are skipped and only the newest
  // MAX_COMPLETED_SESSIONS are kept.
  void restore(const std::vector<ChargeSession>& sessions);

private:
  void startSession(const Sample& sample);
  void extendSession(const Sample& sample);
  void commitSession();

  std::unique_ptr<ChargeSession> active_;
  std::deque<ChargeSession> completed_;
};

} // namespace battery_history

#endif // BATTERY_HISTORY__SESSION_TRACKER_HPP_
