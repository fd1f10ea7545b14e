#pragma once

/// \file digitize.h
/// \brief One-pass extraction of per-cycle samples from an intensity matrix.

#include "calibration.h"
#include "common.h"
#include "config.h"
#include "landmark.h"
#include "peaks.h"
#include "profile.h"
#include "segment.h"

#include <vector>

#include <opencv2/core.hpp>

namespace TraceDigit {

/// One calibrated output row.
struct CycleSample {
    int cycle        = 0; ///< 1-based number among surviving landmarks.
    int region_index = 0;
    int column       = 0;
    int row          = 0;
    double value     = 0.0;
};

/// Everything produced while digitizing one image.
struct DigitizeResult {
    DigitizeStatus status = DigitizeStatus::Ok;

    int width  = 0;
    int height = 0;

    PeakDetection detection;
    std::vector<int> boundaries; ///< peaks.size() + 1 values; empty when skipped.
    std::vector<Region> regions;
    std::vector<Landmark> landmarks;

    bool calibrated = false;
    AxisScale scale;
    bool degenerate_scale = false;
    std::vector<CycleSample> samples;
    SummaryStats summary;

    /// True when the image produced regions (status is not InsufficientPeaks).
    bool HasRegions() const { return status != DigitizeStatus::InsufficientPeaks; }
};

/// Profile, peaks, regions and landmarks. Samples stay empty until
/// ApplyCalibration() is called. Throws InputError for an invalid matrix.
DigitizeResult LocateCycles(const cv::Mat& intensity, const DigitizeConfig& cfg);

/// Fill samples and summary of \p result from its landmarks.
void ApplyCalibration(DigitizeResult& result, const AxisScale& scale);

/// LocateCycles() followed by ApplyCalibration().
DigitizeResult Digitize(const cv::Mat& intensity, const DigitizeConfig& cfg,
                        const AxisScale& scale);

} // namespace TraceDigit
