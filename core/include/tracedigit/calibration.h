#pragma once

/// \file calibration.h
/// \brief Linear mapping from pixel rows to the chart's value axis.

#include <span>
#include <vector>

namespace TraceDigit {

/// Axis values at the bottom and the top edge of the intensity matrix.
struct AxisScale {
    double y_bottom = 0.0;
    double y_top    = 1.0;

    /// Equal endpoints map every row to the same value.
    bool IsDegenerate() const { return y_top == y_bottom; }
};

/// Count, mean and population standard deviation of calibrated values.
/// mean and stddev are NaN when count is 0.
struct SummaryStats {
    int count     = 0;
    double mean   = 0.0;
    double stddev = 0.0;
};

/// value = (1 - row / height) * (y_top - y_bottom) + y_bottom.
/// Row 0 maps to y_top and row == height to y_bottom.
/// Throws InputError if height <= 0.
double MapRowToValue(double row, int height, const AxisScale& scale);

/// MapRowToValue() for every row.
std::vector<double> MapRowsToValues(std::span<const int> rows, int height, const AxisScale& scale);

/// Inverse of MapRowToValue(). Throws InputError for a degenerate scale.
double MapValueToRow(double value, int height, const AxisScale& scale);

SummaryStats Summarize(std::span<const double> values);

} // namespace TraceDigit
