#ifndef BATTERY_HISTORY__HISTORY_STORE_HPP_
#define BATTERY_HISTORY__HISTORY_STORE_HPP_

#include "battery_history/chart_viewport.hpp"
#include "battery_history/history_storage.hpp"
#include "battery_history/sample.hpp"
#include "battery_history/session_tracker.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace battery_history
{

class HistoryStore
{
public:
  static constexpr size_t MAX_SAMPLES = 40000;        // ~55h at 5s intervals
  static constexpr size_t AUTOSAVE_INTERVAL = 60;     // ~5min at 5s intervals

  explicit HistoryStore(const std::string& storage_path);
  ~HistoryStore() = default;

  // Restore samples and completed sessions from storage.
  // Returns false and leaves the store empty if nothing usable was found.
  bool load();

  // Append a sample, evict the oldest beyond MAX_SAMPLES and feed the
  // session tracker
  void recordSample(const Sample& sample);

  // Persist once AUTOSAVE_INTERVAL samples were recorded since the last
  // save. Returns true only if a save happened and succeeded.
  bool maybeAutosave();

  // Persist now; failures are reported and swallowed
  bool saveNow();

  // Copy of the samples selected by the viewport
  std::vector<Sample> visibleSamples(const ChartViewport& viewport) const;

  const std::deque<Sample>& samples() const { return samples_; }
  size_t size() const { return samples_.size(); }
  bool empty() const { return samples_.empty(); }
  const Sample* latest() const;

  const SessionTracker& sessions() const { return tracker_; }
  const std::deque<ChargeSession>& completedSessions() const;

  size_t samplesSinceSave() const { return samples_since_save_; }
  const std::string& storagePath() const { return storage_.path(); }

private:
  HistoryDocument snapshot() const;
  void evictOverflow();

  HistoryStorage storage_;
  std::deque<Sample> samples_;
  SessionTracker tracker_;
  size_t samples_since_save_;
};

// Samples of [begin, end) selected by the viewport for a session's data
std::vector<Sample> visibleSlice(const std::vector<Sample>& data, const ChartViewport& viewport);

} // namespace battery_history

#endif // BATTERY_HISTORY__HISTORY_STORE_HPP_
