#include "battery_history/chart_viewport.hpp"
#include <algorithm>
#include <cmath>

namespace battery_history
{

ChartViewport::ChartViewport(bool live)
: live_(live), full_range_(true), follow_end_(live), data_size_(0), start_(0), width_(0)
{
}

void ChartViewport::zoomIn()
{
  if (data_size_ == 0) {
    return;
  }
  materialize();

  size_t new_width = std::max(
    minWidth(data_size_), static_cast<size_t>(std::floor(width_ * ZOOM_FACTOR)));
  if (new_width >= width_) {
    return; // already at the minimum
  }

  bool at_end = (start_ + width_ == data_size_);
  full_range_ = false;

  if (live_ && at_end) {
    start_ = data_size_ - new_width;
    width_ = new_width;
    follow_end_ = true;
  } else {
    placeAround(start_ + width_ / 2.0, new_width);
  }
}

void ChartViewport::zoomOut()
{
  if (data_size_ == 0) {
    return;
  }
  materialize();

  size_t new_width = static_cast<size_t>(std::ceil(width_ / ZOOM_FACTOR));
  if (new_width <= width_) {
    new_width = width_ + 1;
  }
  if (new_width >= FULL_RANGE_SNAP * data_size_) {
    fitToData(data_size_);
    return;
  }

  bool at_end = (start_ + width_ == data_size_);
  if (live_ && at_end) {
    start_ = data_size_ - new_width;
    width_ = new_width;
    follow_end_ = true;
  } else {
    placeAround(start_ + width_ / 2.0, new_width);
  }
}

void ChartViewport::panLeft()
{
  if (data_size_ == 0) {
    return;
  }
  materialize();
  if (width_ >= data_size_) {
    return;
  }

  size_t shift = std::max<size_t>(1, static_cast<size_t>(width_ * PAN_FRACTION));
  start_ = start_ > shift ? start_ - shift : 0;
  full_range_ = false;
  follow_end_ = false;
}

void ChartViewport::panRight()
{
  if (data_size_ == 0) {
    return;
  }
  materialize();
  if (width_ >= data_size_) {
    return;
  }

  size_t shift = std::max<size_t>(1, static_cast<size_t>(width_ * PAN_FRACTION));
  start_ = std::min(start_ + shift, data_size_ - width_);
  full_range_ = false;
  follow_end_ = live_ && (start_ + width_ == data_size_);
}

void ChartViewport::fitToData(size_t data_size)
{
  data_size_ = data_size;
  full_range_ = true;
  follow_end_ = live_;
  start_ = 0;
  width_ = data_size;
}

void ChartViewport::setDataSize(size_t data_size)
{
  data_size_ = data_size;
}

std::pair<size_t, size_t> ChartViewport::visibleRange(size_t data_size) const
{
  if (data_size == 0) {
    return std::make_pair(0, 0);
  }
  if (full_range_) {
    return std::make_pair(0, data_size);
  }

  size_t width = std::max(minWidth(data_size), std::min(width_, data_size));
  size_t start;
  if (follow_end_) {
    start = data_size - width;
  } else {
    start = std::min(start_, data_size - width);
  }
  return std::make_pair(start, start + width);
}

ViewportWindow ChartViewport::currentWindow(size_t data_size) const
{
  ViewportWindow window;
  auto range = visibleRange(data_size);
  window.start = range.first;
  window.width = range.second - range.first;
  window.zoom_level = data_size > 0 ?
    static_cast<double>(window.width) / static_cast<double>(data_size) : 1.0;
  return window;
}

void ChartViewport::materialize()
{
  auto range = visibleRange(data_size_);
  start_ = range.first;
  width_ = range.second - range.first;
}

size_t ChartViewport::minWidth(size_t data_size) const
{
  return std::max<size_t>(1, std::min(MIN_VISIBLE_POINTS, data_size));
}

void ChartViewport::placeAround(double center, size_t new_width)
{
  double start = std::round(center - new_width / 2.0);
  double max_start = static_cast<double>(data_size_ - new_width);
  start = std::max(0.0, std::min(max_start, start));

  start_ = static_cast<size_t>(start);
  width_ = new_width;
  follow_end_ = live_ && (start_ + width_ == data_size_);
}

} // namespace battery_history
