#pragma once

/// \file landmark.h
/// \brief Topmost bright pixel of each cycle region.

#include "segment.h"

#include <optional>
#include <span>
#include <vector>

#include <opencv2/core.hpp>

namespace TraceDigit {

/// Representative pixel of one region. Row 0 is the top of the image.
struct Landmark {
    int region_index = 0;
    int column       = 0;
    int row          = 0;
};

/// Topmost pixel of \p region whose value is strictly greater than
/// \p intensity_threshold. Among columns sharing that row the leftmost wins.
/// Returns std::nullopt if the region holds no such pixel.
///
/// Throws InputError if \p intensity is not a non-empty CV_8UC1 matrix or
/// the region does not lie inside [0, intensity.cols].
std::optional<Landmark> LocateLandmark(const cv::Mat& intensity, const Region& region,
                                       int intensity_threshold);

/// LocateLandmark() over every region, skipping empty ones. The result is
/// ordered by region index.
std::vector<Landmark> LocateLandmarks(const cv::Mat& intensity, std::span<const Region> regions,
                                      int intensity_threshold);

} // namespace TraceDigit
