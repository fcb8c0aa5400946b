#ifndef BATTERY_MONITOR__MONITOR_CONTEXT_HPP_
#define BATTERY_MONITOR__MONITOR_CONTEXT_HPP_

#include "battery_history/chart_viewport.hpp"
#include "battery_history/history_store.hpp"
#include "battery_history/sample.hpp"
#include <string>
#include <vector>

namespace battery_monitor
{

// Which screen is shown; session_index is only meaningful for SessionDetail
struct View
{
  enum Kind
  {
    Dashboard,
    HistoryChart,
    SessionDetail
  };

  Kind kind;
  size_t session_index;

  static View dashboard() { return View{Dashboard, 0}; }
  static View historyChart() { return View{HistoryChart, 0}; }
  static View sessionDetail(size_t index) { return View{SessionDetail, index}; }

  bool operator==(const View& other) const
  {
    return kind == other.kind && (kind != SessionDetail || session_index == other.session_index);
  }
  bool operator!=(const View& other) const { return !(*this == other); }
};

enum class Command
{
  Quit,
  ShowDashboard,
  ShowHistory,
  ShowFirstSession,
  ShowSecondSession,
  ZoomIn,
  ZoomOut,
  PanLeft,
  PanRight,
  FitToData
};

// All mutable monitor state, owned by the event loop
class MonitorContext
{
public:
  MonitorContext(const std::string& storage_path, const std::string& battery_name);
  ~MonitorContext() = default;

  // Restore persisted history; false means we start empty
  bool loadHistory();

  // Record a live reading
  void recordSample(const battery_history::Sample& sample);

  // Apply a user command. Returns false once the loop should stop.
  bool apply(Command command);

  void switchToDashboard();
  void switchToHistory();
  // Ignored (returns false) if the session does not exist
  bool switchToSession(size_t index);

  const View& view() const { return view_; }

  // Viewport driven by the current view
  battery_history::ChartViewport& activeViewport();
  const battery_history::ChartViewport& activeViewport() const;

  // Length of the data the current view charts
  size_t activeDataSize() const;

  // Window of the active viewport over the data as it is now
  battery_history::ViewportWindow activeWindow() const;

  // Samples inside the active viewport
  std::vector<battery_history::Sample> visibleSamples() const;

  // One line describing the current view, for the status log
  std::string statusLine() const;

  battery_history::HistoryStore& history() { return history_; }
  const battery_history::HistoryStore& history() const { return history_; }

  const battery_history::ChartViewport& historyViewport() const { return history_viewport_; }
  const battery_history::ChartViewport& sessionViewport() const { return session_viewport_; }

  bool hasLiveSample() const { return has_live_sample_; }
  const battery_history::Sample& liveSample() const { return live_sample_; }

  const std::string& batteryName() const { return battery_name_; }
  bool running() const { return running_; }

private:
  const battery_history::ChargeSession* selectedSession() const;
  void fitActiveViewport();

  battery_history::HistoryStore history_;
  battery_history::ChartViewport history_viewport_;
  battery_history::ChartViewport session_viewport_;
  View view_;

  battery_history::Sample live_sample_;
  bool has_live_sample_;

  std::string battery_name_;
  bool running_;
};

// "2h 05m" or "42m"
std::string formatDuration(double seconds);

} // namespace battery_monitor

#endif // BATTERY_MONITOR__MONITOR_CONTEXT_HPP_
