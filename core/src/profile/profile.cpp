#include "tracedigit/profile.h"
#include "tracedigit/error.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <opencv2/core.hpp>

#include <cmath>

namespace TraceDigit {

std::vector<double> BuildBrightnessProfile(const cv::Mat& intensity) {
    detail::RequireIntensityMatrix(intensity, "BuildBrightnessProfile");

    cv::Mat column_mean;
    cv::reduce(intensity, column_mean, 0, cv::REDUCE_AVG, CV_64F);

    const double* ptr = column_mean.ptr<double>(0);
    std::vector<double> profile(ptr, ptr + column_mean.cols);
    spdlog::debug("BuildBrightnessProfile: {}x{} -> {} column(s)", intensity.cols, intensity.rows,
                  profile.size());
    return profile;
}

SignalStats ComputeSignalStats(std::span<const double> signal) {
    if (signal.empty()) { throw InputError("ComputeSignalStats: signal is empty"); }

    double sum = 0.0;
    for (double v : signal) { sum += v; }
    const double mean = sum / static_cast<double>(signal.size());

    double sq = 0.0;
    for (double v : signal) {
        const double d = v - mean;
        sq += d * d;
    }

    SignalStats stats;
    stats.mean   = mean;
    stats.stddev = std::sqrt(sq / static_cast<double>(signal.size()));
    return stats;
}

} // namespace TraceDigit
