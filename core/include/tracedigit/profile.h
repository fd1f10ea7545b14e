#pragma once

/// \file profile.h
/// \brief Column-wise brightness profile of an intensity matrix.

#include <span>
#include <vector>

#include <opencv2/core.hpp>

namespace TraceDigit {

/// Mean and population standard deviation of a 1-D signal.
struct SignalStats {
    double mean   = 0.0;
    double stddev = 0.0;
};

/// Reduce an intensity matrix (CV_8UC1, H x W) to its per-column mean.
/// The result has exactly W elements. Throws InputError for an empty matrix,
/// zero width/height, or a matrix that is not single-channel 8-bit.
std::vector<double> BuildBrightnessProfile(const cv::Mat& intensity);

/// Mean and population (ddof = 0) standard deviation. Throws InputError if
/// \p signal is empty.
SignalStats ComputeSignalStats(std::span<const double> signal);

} // namespace TraceDigit
