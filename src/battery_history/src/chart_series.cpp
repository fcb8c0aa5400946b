#include "battery_history/chart_series.hpp"
#include <algorithm>
#include <cmath>

namespace battery_history
{

std::vector<ChartPoint> chartSeries(
  const std::vector<Sample>& samples,
  Timestamp reference,
  SeriesField field)
{
  std::vector<ChartPoint> points;
  points.reserve(samples.size());

  for (const auto& sample : samples) {
    ChartPoint point;
    point.x = secondsBetween(reference, sample.timestamp);
    point.y = (field == SeriesField::Capacity) ? sample.capacity_percent : sample.power_watts;
    points.push_back(point);
  }
  return points;
}

AxisBounds capacityAxisBounds()
{
  AxisBounds bounds;
  bounds.min = 0.0;
  bounds.max = 100.0;
  return bounds;
}

AxisBounds powerAxisBounds(const std::vector<ChartPoint>& points)
{
  AxisBounds bounds;
  bounds.min = -0.5;
  bounds.max = 0.5;
  if (points.empty()) {
    return bounds;
  }

  double lowest = points.front().y;
  double highest = points.front().y;
  for (const auto& point : points) {
    lowest = std::min(lowest, point.y);
    highest = std::max(highest, point.y);
  }

  double margin = std::abs(highest - lowest) * 0.1 + 0.5;
  bounds.min = std::min(lowest - margin, -0.5);
  bounds.max = std::max(highest + margin, 0.5);
  return bounds;
}

} // namespace battery_history
