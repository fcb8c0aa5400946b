#ifndef BATTERY_HISTORY__CHART_SERIES_HPP_
#define BATTERY_HISTORY__CHART_SERIES_HPP_

#include "battery_history/sample.hpp"
#include <vector>

namespace battery_history
{

struct ChartPoint
{
  double x;   // seconds since the reference time
  double y;
};

struct AxisBounds
{
  double min;
  double max;
};

enum class SeriesField
{
  Capacity,
  Power
};

// Plot points for one field of the given samples
std::vector<ChartPoint> chartSeries(
  const std::vector<Sample>& samples,
  Timestamp reference,
  SeriesField field);

// Capacity axis is always 0 - 100
AxisBounds capacityAxisBounds();

// Power axis padded by 10% of the spread plus 0.5W, and always
// including [-0.5, 0.5] so the zero line stays visible
AxisBounds powerAxisBounds(const std::vector<ChartPoint>& points);

} // namespace battery_history

#endif // BATTERY_HISTORY__CHART_SERIES_HPP_
