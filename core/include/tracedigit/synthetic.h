#pragma once

/// \file synthetic.h
/// \brief Synthetic strip-chart images with Gaussian cycles at known columns.

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace TraceDigit {

/// Layout of a synthetic trace. Rows are measured upward from the bottom edge.
struct SyntheticTraceSpec {
    int width  = 650;
    int height = 400;

    std::vector<int> centers = {100, 250, 400, 550}; ///< Apex columns.
    double amplitude_rows    = 300.0; ///< Apex height above the baseline.
    double sigma_cols        = 15.0;  ///< Gaussian width of each bump.
    double baseline_rows     = 20.0;  ///< Trace height far from any bump.

    uint8_t value = 200; ///< Brightness of the trace; background is 0.
    bool filled   = true; ///< Fill below the trace; otherwise draw a line.
    int thickness = 3;    ///< Line thickness when not filled.
};

/// Top row (0 = image top) of the trace in column \p x.
int SyntheticTraceRow(const SyntheticTraceSpec& spec, int x);

/// Renders the trace into a CV_8UC1 image. Throws InputError for a
/// non-positive size or sigma.
cv::Mat RenderSyntheticTrace(const SyntheticTraceSpec& spec);

} // namespace TraceDigit
