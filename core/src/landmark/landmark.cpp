#include "tracedigit/landmark.h"
#include "tracedigit/error.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>

namespace TraceDigit {

namespace {

void RequireRegionInside(const Region& region, int width) {
    if (region.start < 0 || region.end > width || region.end < region.start) {
        throw InputError("LocateLandmark: region [" + std::to_string(region.start) + ", " +
                         std::to_string(region.end) + ") outside image width " +
                         std::to_string(width));
    }
}

// Rows are scanned top-down, so the first row holding a bright pixel is the
// topmost row over all columns, and its first bright column is the leftmost
// column reaching that row.
std::optional<Landmark> ScanRegion(const cv::Mat& intensity, const Region& region,
                                   int intensity_threshold) {
    for (int r = 0; r < intensity.rows; ++r) {
        const uint8_t* row = intensity.ptr<uint8_t>(r);
        for (int c = region.start; c < region.end; ++c) {
            if (row[c] > intensity_threshold) {
                Landmark lm;
                lm.region_index = region.index;
                lm.column       = c;
                lm.row          = r;
                return lm;
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<Landmark> LocateLandmark(const cv::Mat& intensity, const Region& region,
                                       int intensity_threshold) {
    detail::RequireIntensityMatrix(intensity, "LocateLandmark");
    RequireRegionInside(region, intensity.cols);
    return ScanRegion(intensity, region, intensity_threshold);
}

std::vector<Landmark> LocateLandmarks(const cv::Mat& intensity, std::span<const Region> regions,
                                      int intensity_threshold) {
    detail::RequireIntensityMatrix(intensity, "LocateLandmarks");

    std::vector<Landmark> landmarks;
    landmarks.reserve(regions.size());
    for (const Region& region : regions) {
        RequireRegionInside(region, intensity.cols);
        std::optional<Landmark> lm = ScanRegion(intensity, region, intensity_threshold);
        if (!lm) {
            spdlog::debug("LocateLandmarks: region {} [{}, {}) has no pixel above {}, skipped",
                          region.index, region.start, region.end, intensity_threshold);
            continue;
        }
        landmarks.push_back(*lm);
    }
    spdlog::debug("LocateLandmarks: {} of {} region(s) produced a landmark", landmarks.size(),
                  regions.size());
    return landmarks;
}

} // namespace TraceDigit
