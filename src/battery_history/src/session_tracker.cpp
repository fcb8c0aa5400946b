#include "battery_history/session_tracker.hpp"
#include <utility>

namespace battery_history
{

SessionTracker::SessionTracker()
{
}

void SessionTracker::onSample(const Sample& sample)
{
  if (sample.status == BatteryStatus::Charging) {
    if (!active_) {
      startSession(sample);
    } else {
      extendSession(sample);
    }
    return;
  }

  // Any other status closes the run, flicker included
  if (active_) {
    commitSession();
  }
}

const std::deque<ChargeSession>& SessionTracker::completedSessions() const
{
  return completed_;
}

const ChargeSession* SessionTracker::activeSession() const
{
  return active_.get();
}

void SessionTracker::restore(const std::vector<ChargeSession>& sessions)
{
  completed_.clear();
  for (const auto& session : sessions) {
    if (!session.completed || session.samples.empty()) {
      continue;
    }
    completed_.push_back(session);
    if (completed_.size() > MAX_COMPLETED_SESSIONS) {
      completed_.pop_front();
    }
  }
}

void SessionTracker::startSession(const Sample& sample)
{
  active_ = std::make_unique<ChargeSession>();
  active_->start_time = sample.timestamp;
  active_->end_time = sample.timestamp;
  active_->start_capacity = sample.capacity_percent;
  active_->end_capacity = sample.capacity_percent;
  active_->samples.push_back(sample);
  active_->reached_threshold = sample.capacity_percent >= COMPLETION_THRESHOLD_PERCENT;
  active_->completed = false;
}

void SessionTracker::extendSession(const Sample& sample)
{
  active_->end_time = sample.timestamp;
  active_->end_capacity = sample.capacity_percent;
  active_->samples.push_back(sample);

  if (sample.capacity_percent >= COMPLETION_THRESHOLD_PERCENT) {
    active_->reached_threshold = true;
  }
}

void SessionTracker::commitSession()
{
  std::unique_ptr<ChargeSession> session = std::move(active_);

  // Partial charges are dropped
  if (!session->reached_threshold) {
    return;
  }

  session->completed = true;
  session->end_time = session->samples.back().timestamp;
  completed_.push_back(std::move(*session));

  while (completed_.size() > MAX_COMPLETED_SESSIONS) {
    completed_.pop_front();
  }
}

} // namespace battery_history
