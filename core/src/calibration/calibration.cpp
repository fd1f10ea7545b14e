#include "tracedigit/calibration.h"
#include "tracedigit/error.h"

#include <cmath>
#include <limits>

namespace TraceDigit {

double MapRowToValue(double row, int height, const AxisScale& scale) {
    if (height <= 0) { throw InputError("MapRowToValue: height must be positive"); }
    const double fraction = 1.0 - row / static_cast<double>(height);
    return fraction * (scale.y_top - scale.y_bottom) + scale.y_bottom;
}

std::vector<double> MapRowsToValues(std::span<const int> rows, int height,
                                    const AxisScale& scale) {
    if (height <= 0) { throw InputError("MapRowsToValues: height must be positive"); }
    std::vector<double> values;
    values.reserve(rows.size());
    for (int r : rows) { values.push_back(MapRowToValue(static_cast<double>(r), height, scale)); }
    return values;
}

double MapValueToRow(double value, int height, const AxisScale& scale) {
    if (height <= 0) { throw InputError("MapValueToRow: height must be positive"); }
    if (scale.IsDegenerate()) { throw InputError("MapValueToRow: degenerate axis scale"); }
    const double fraction = (value - scale.y_bottom) / (scale.y_top - scale.y_bottom);
    return (1.0 - fraction) * static_cast<double>(height);
}

SummaryStats Summarize(std::span<const double> values) {
    SummaryStats stats;
    stats.count = static_cast<int>(values.size());
    if (values.empty()) {
        stats.mean   = std::numeric_limits<double>::quiet_NaN();
        stats.stddev = std::numeric_limits<double>::quiet_NaN();
        return stats;
    }

    double sum = 0.0;
    for (double v : values) { sum += v; }
    stats.mean = sum / static_cast<double>(values.size());

    double sq = 0.0;
    for (double v : values) {
        const double d = v - stats.mean;
        sq += d * d;
    }
    stats.stddev = std::sqrt(sq / static_cast<double>(values.size()));
    return stats;
}

} // namespace TraceDigit
