#include "tracedigit/digitize.h"
#include "tracedigit/error.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <cstddef>

namespace TraceDigit {

DigitizeResult LocateCycles(const cv::Mat& intensity, const DigitizeConfig& cfg) {
    detail::RequireIntensityMatrix(intensity, "LocateCycles");

    DigitizeResult result;
    result.width  = intensity.cols;
    result.height = intensity.rows;

    const std::vector<double> profile = BuildBrightnessProfile(intensity);
    result.detection                  = DetectPeaks(profile, cfg.peaks);

    if (result.detection.peaks.size() < 2) {
        result.status = DigitizeStatus::InsufficientPeaks;
        spdlog::warn("Too few peaks detected ({}), skipping image",
                     result.detection.peaks.size());
        return result;
    }

    result.boundaries = ComputeRegionBoundaries(result.detection.peaks, result.width);
    result.regions    = RegionsFromBoundaries(result.boundaries);
    result.landmarks =
        LocateLandmarks(intensity, result.regions, cfg.landmark.intensity_threshold);

    if (result.landmarks.empty()) {
        result.status = DigitizeStatus::NoLandmarks;
        spdlog::warn("No region contains a pixel above {}", cfg.landmark.intensity_threshold);
    }
    spdlog::info("LocateCycles: {}x{}, peaks={}, regions={}, landmarks={}", result.width,
                 result.height, result.detection.peaks.size(), result.regions.size(),
                 result.landmarks.size());
    return result;
}

void ApplyCalibration(DigitizeResult& result, const AxisScale& scale) {
    if (result.height <= 0) { throw InputError("ApplyCalibration: result has no image height"); }

    result.scale            = scale;
    result.calibrated       = true;
    result.degenerate_scale = scale.IsDegenerate();
    if (result.degenerate_scale) {
        spdlog::warn("Degenerate axis scale: y_bottom == y_top == {}, every value is constant",
                     scale.y_bottom);
    }

    result.samples.clear();
    result.samples.reserve(result.landmarks.size());
    std::vector<double> values;
    values.reserve(result.landmarks.size());
    for (std::size_t i = 0; i < result.landmarks.size(); ++i) {
        const Landmark& lm = result.landmarks[i];

        CycleSample s;
        s.cycle        = static_cast<int>(i) + 1;
        s.region_index = lm.region_index;
        s.column       = lm.column;
        s.row          = lm.row;
        s.value        = MapRowToValue(static_cast<double>(lm.row), result.height, scale);
        result.samples.push_back(s);
        values.push_back(s.value);
    }
    result.summary = Summarize(values);
}

DigitizeResult Digitize(const cv::Mat& intensity, const DigitizeConfig& cfg,
                        const AxisScale& scale) {
    DigitizeResult result = LocateCycles(intensity, cfg);
    if (result.HasRegions()) { ApplyCalibration(result, scale); }
    return result;
}

} // namespace TraceDigit
