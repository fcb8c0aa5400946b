#ifndef BATTERY_HISTORY__CHART_VIEWPORT_HPP_
#define BATTERY_HISTORY__CHART_VIEWPORT_HPP_

#include <cstddef>
#include <utility>

namespace battery_history
{

struct ViewportWindow
{
  size_t start;
  size_t width;
  double zoom_level;   // 1.0 = all data visible
};

// Zoom/pan window over an ordered sequence of points.
//
// The viewport never sees the data itself, only its length. Commands clamp
// against the length given by fitToData()/setDataSize(); visibleRange()
// clamps again against the length passed at read time, so a window stays
// valid when the data shrinks (eviction) or grows between renders.
class ChartViewport
{
public:
  static constexpr double ZOOM_FACTOR = 0.7;
  static constexpr double PAN_FRACTION = 0.2;
  static constexpr size_t MIN_VISIBLE_POINTS = 12;
  static constexpr double FULL_RANGE_SNAP = 0.99;

  // A live viewport keeps its right edge on the newest point while the
  // window touches it, so fresh samples scroll into view.
  explicit ChartViewport(bool live = false);
  ~ChartViewport() = default;

  void zoomIn();
  void zoomOut();
  void panLeft();
  void panRight();

  // Show the full range [0, data_size)
  void fitToData(size_t data_size);

  // Update the length commands clamp against without moving the window
  void setDataSize(size_t data_size);

  // Half-open [begin, end) selected for data of the given length.
  // Non-empty whenever data_size > 0.
  std::pair<size_t, size_t> visibleRange(size_t data_size) const;

  // Window selected for data of the given length, same clamping as visibleRange()
  ViewportWindow currentWindow(size_t data_size) const;

  bool isLive() const { return live_; }
  bool showsFullRange() const { return full_range_; }

private:
  // Turn the full-range/follow flags into a concrete start_/width_
  void materialize();
  size_t minWidth(size_t data_size) const;
  void placeAround(double center, size_t new_width);

  bool live_;
  bool full_range_;
  bool follow_end_;
  size_t data_size_;
  size_t start_;
  size_t width_;
};

} // namespace battery_history

#endif // BATTERY_HISTORY__CHART_VIEWPORT_HPP_
