#include "battery_monitor/monitor_context.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace battery_monitor
{

namespace
{

std::string formatStartTime(battery_history::Timestamp timestamp)
{
  std::time_t time = battery_history::Clock::to_time_t(timestamp);
  std::tm local;
  localtime_r(&time, &local);

  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M");
  return oss.str();
}

void appendWindow(std::ostringstream& oss, const battery_history::ChartViewport& viewport, size_t size)
{
  auto range = viewport.visibleRange(size);
  double zoom = size > 0 ?
    100.0 * static_cast<double>(range.second - range.first) / static_cast<double>(size) : 100.0;
  oss << " | samples " << range.first << "-" << range.second << " of " << size
      << " | zoom " << std::fixed << std::setprecision(0) << zoom << "%";
}

} // namespace

std::string formatDuration(double seconds)
{
  long long total = seconds > 0.0 ? static_cast<long long>(seconds) : 0;
  long long hours = total / 3600;
  long long minutes = (total % 3600) / 60;

  std::ostringstream oss;
  if (hours > 0) {
    oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m";
  } else {
    oss << minutes << "m";
  }
  return oss.str();
}

MonitorContext::MonitorContext(const std::string& storage_path, const std::string& battery_name)
: history_(storage_path),
  history_viewport_(true),
  session_viewport_(false),
  view_(View::dashboard()),
  has_live_sample_(false),
  battery_name_(battery_name),
  running_(true)
{
  live_sample_ = battery_history::makeSample(
    battery_history::Timestamp(), 0.0, 0.0, 0.0, 0.0, 0.0, battery_history::BatteryStatus::Unknown);
}

bool MonitorContext::loadHistory()
{
  bool restored = history_.load();
  history_viewport_.fitToData(history_.size());
  return restored;
}

void MonitorContext::recordSample(const battery_history::Sample& sample)
{
  live_sample_ = sample;
  has_live_sample_ = true;
  history_.recordSample(sample);
}

bool MonitorContext::apply(Command command)
{
  switch (command) {
    case Command::Quit:
      running_ = false;
      break;
    case Command::ShowDashboard:
      switchToDashboard();
      break;
    case Command::ShowHistory:
      switchToHistory();
      break;
    case Command::ShowFirstSession:
      switchToSession(0);
      break;
    case Command::ShowSecondSession:
      switchToSession(1);
      break;
    case Command::ZoomIn:
      activeViewport().setDataSize(activeDataSize());
      activeViewport().zoomIn();
      break;
    case Command::ZoomOut:
      activeViewport().setDataSize(activeDataSize());
      activeViewport().zoomOut();
      break;
    case Command::PanLeft:
      activeViewport().setDataSize(activeDataSize());
      activeViewport().panLeft();
      break;
    case Command::PanRight:
      activeViewport().setDataSize(activeDataSize());
      activeViewport().panRight();
      break;
    case Command::FitToData:
      if (view_.kind != View::Dashboard) {
        fitActiveViewport();
      }
      break;
  }
  return running_;
}

void MonitorContext::switchToDashboard()
{
  view_ = View::dashboard();
}

void MonitorContext::switchToHistory()
{
  view_ = View::historyChart();
  fitActiveViewport();
}

bool MonitorContext::switchToSession(size_t index)
{
  if (index >= history_.completedSessions().size()) {
    return false;
  }
  view_ = View::sessionDetail(index);
  fitActiveViewport();
  return true;
}

battery_history::ChartViewport& MonitorContext::activeViewport()
{
  if (view_.kind == View::SessionDetail) {
    return session_viewport_;
  }
  return history_viewport_;
}

const battery_history::ChartViewport& MonitorContext::activeViewport() const
{
  if (view_.kind == View::SessionDetail) {
    return session_viewport_;
  }
  return history_viewport_;
}

size_t MonitorContext::activeDataSize() const
{
  if (view_.kind == View::SessionDetail) {
    const battery_history::ChargeSession* session = selectedSession();
    return session ? session->samples.size() : 0;
  }
  return history_.size();
}

battery_history::ViewportWindow MonitorContext::activeWindow() const
{
  return activeViewport().currentWindow(activeDataSize());
}

std::vector<battery_history::Sample> MonitorContext::visibleSamples() const
{
  if (view_.kind == View::SessionDetail) {
    const battery_history::ChargeSession* session = selectedSession();
    if (!session) {
      return std::vector<battery_history::Sample>();
    }
    return battery_history::visibleSlice(session->samples, session_viewport_);
  }
  return history_.visibleSamples(history_viewport_);
}

std::string MonitorContext::statusLine() const
{
  std::ostringstream oss;

  switch (view_.kind) {
    case View::Dashboard:
      oss << battery_name_ << " | ";
      if (!has_live_sample_) {
        oss << "Waiting for first battery sample...";
      } else {
        oss << std::fixed << std::setprecision(1) << live_sample_.capacity_percent << "% "
            << battery_history::statusDisplayName(live_sample_.status) << " "
            << std::showpos << std::setprecision(2) << live_sample_.power_watts << std::noshowpos
            << " W " << std::setprecision(3) << live_sample_.voltage_volts << " V "
            << std::setprecision(2) << live_sample_.energy_wh << "/" << live_sample_.energy_full_wh
            << " Wh";
      }
      oss << " | " << history_.completedSessions().size() << " charge sessions (90%+) | "
          << history_.size() << " samples";
      break;

    case View::HistoryChart:
      oss << "History";
      appendWindow(oss, history_viewport_, history_.size());
      break;

    case View::SessionDetail:
    {
      const battery_history::ChargeSession* session = selectedSession();
      if (!session) {
        oss << "Session " << view_.session_index + 1 << " not found";
        break;
      }
      oss << "Session " << view_.session_index + 1 << " | " << std::fixed << std::setprecision(0)
          << session->start_capacity << "% -> " << session->end_capacity << "% | "
          << formatDuration(battery_history::secondsBetween(session->start_time, session->end_time))
          << " | started " << formatStartTime(session->start_time);
      appendWindow(oss, session_viewport_, session->samples.size());
      break;
    }
  }
  return oss.str();
}

const battery_history::ChargeSession* MonitorContext::selectedSession() const
{
  const auto& sessions = history_.completedSessions();
  if (view_.kind != View::SessionDetail || view_.session_index >= sessions.size()) {
    return nullptr;
  }
  return &sessions[view_.session_index];
}

void MonitorContext::fitActiveViewport()
{
  activeViewport().fitToData(activeDataSize());
}

} // namespace battery_monitor
