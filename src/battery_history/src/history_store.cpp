#include "battery_history/history_store.hpp"
#include <iostream>

namespace battery_history
{

HistoryStore::HistoryStore(const std::string& storage_path)
: storage_(storage_path), samples_since_save_(0)
{
}

bool HistoryStore::load()
{
  samples_.clear();
  tracker_.restore(std::vector<ChargeSession>());
  samples_since_save_ = 0;

  HistoryDocument document;
  if (!storage_.read(document)) {
    return false;
  }

  samples_.assign(document.samples.begin(), document.samples.end());
  evictOverflow();
  tracker_.restore(document.completed_sessions);
  return true;
}

void HistoryStore::recordSample(const Sample& sample)
{
  tracker_.onSample(sample);

  samples_.push_back(sample);
  evictOverflow();

  samples_since_save_++;
}

bool HistoryStore::maybeAutosave()
{
  if (samples_since_save_ < AUTOSAVE_INTERVAL) {
    return false;
  }
  return saveNow();
}

bool HistoryStore::saveNow()
{
  // A failed write is superseded by the next periodic save
  samples_since_save_ = 0;

  if (!storage_.write(snapshot())) {
    std::cerr << "Failed to save battery history to " << storage_.path() << std::endl;
    return false;
  }
  return true;
}

std::vector<Sample> HistoryStore::visibleSamples(const ChartViewport& viewport) const
{
  auto range = viewport.visibleRange(samples_.size());
  return std::vector<Sample>(samples_.begin() + range.first, samples_.begin() + range.second);
}

const Sample* HistoryStore::latest() const
{
  if (samples_.empty()) {
    return nullptr;
  }
  return &samples_.back();
}

const std::deque<ChargeSession>& HistoryStore::completedSessions() const
{
  return tracker_.completedSessions();
}

HistoryDocument HistoryStore::snapshot() const
{
  HistoryDocument document;
  document.samples.assign(samples_.begin(), samples_.end());
  const auto& sessions = tracker_.completedSessions();
  document.completed_sessions.assign(sessions.begin(), sessions.end());
  return document;
}

void HistoryStore::evictOverflow()
{
  while (samples_.size() > MAX_SAMPLES) {
    samples_.pop_front();
  }
}

std::vector<Sample> visibleSlice(const std::vector<Sample>& data, const ChartViewport& viewport)
{
  auto range = viewport.visibleRange(data.size());
  return std::vector<Sample>(data.begin() + range.first, data.begin() + range.second);
}

} // namespace battery_history
