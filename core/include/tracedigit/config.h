/// \file config.h
/// \brief Tunable parameters for digitizing one strip-chart image.

#pragma once

#include "common.h"

#include <cstdint>
#include <string>

namespace TraceDigit {

/// Peak detector constants. Thresholds are relative to the profile statistics
/// so the same values work across images of different brightness.
struct PeakDetectorConfig {
    double distance_min      = 60.0; ///< Minimum spacing between accepted peaks (columns).
    double prominence_factor = 1.0;  ///< Minimum prominence = factor * profile stddev.
    double height_factor     = 0.3;  ///< Minimum height = mean + factor * profile stddev.
};

/// Landmark search constants.
struct LandmarkConfig {
    int intensity_threshold = 0; ///< A pixel counts as trace when value > threshold.
};

/// Preprocessing applied before the intensity matrix reaches the core.
struct PreprocessConfig {
    int target_width     = 1024; ///< Width after the initial resize (0 = keep native size).
    float upscale_factor = 2.0f; ///< Scale applied to the cropped region.

    uint8_t brightness_threshold = 5; ///< Gray values below this are zeroed.

    ResizeMethod resize_method  = ResizeMethod::Area;
    ResizeMethod upscale_method = ResizeMethod::Cubic;
};

/// Complete configuration passed explicitly to every stage.
struct DigitizeConfig {
    PeakDetectorConfig peaks;
    LandmarkConfig landmark;
    PreprocessConfig preprocess;

    /// Throws ConfigError if any value is outside its allowed range.
    void Validate() const;

    static DigitizeConfig LoadFromJson(const std::string& path);
    static DigitizeConfig FromJsonString(const std::string& json_str);

    void SaveToJson(const std::string& path) const;
    std::string ToJsonString() const;
};

} // namespace TraceDigit
