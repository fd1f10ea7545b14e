#include "tracedigit/segment.h"
#include "tracedigit/error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <string>

namespace TraceDigit {

namespace {

void ValidatePeaks(std::span<const int> peaks, int width, const char* where) {
    const std::string prefix = std::string(where) + ": ";
    if (peaks.size() < 2) {
        throw InputError(prefix + "need at least 2 peaks, got " + std::to_string(peaks.size()));
    }
    if (width <= 0) { throw InputError(prefix + "width must be positive"); }
    for (std::size_t i = 0; i < peaks.size(); ++i) {
        if (peaks[i] < 0 || peaks[i] >= width) {
            throw InputError(prefix + "peak " + std::to_string(peaks[i]) + " outside [0, " +
                             std::to_string(width) + ")");
        }
        if (i > 0 && peaks[i] <= peaks[i - 1]) {
            throw InputError(prefix + "peaks must be strictly increasing");
        }
    }
}

std::vector<int> BoundariesFromPeaks(std::span<const int> peaks, int width, const char* where) {
    ValidatePeaks(peaks, width, where);

    const std::size_t n = peaks.size();
    std::vector<int> boundaries;
    boundaries.reserve(n + 1);

    const int first_gap = peaks[1] - peaks[0];
    boundaries.push_back(std::max(0, peaks[0] - first_gap / 2));
    for (std::size_t i = 0; i + 1 < n; ++i) {
        boundaries.push_back((peaks[i] + peaks[i + 1]) / 2);
    }
    const int last_gap = peaks[n - 1] - peaks[n - 2];
    boundaries.push_back(std::min(width, peaks[n - 1] + last_gap / 2));

    if (!std::is_sorted(boundaries.begin(), boundaries.end())) {
        throw InternalError(std::string(where) + ": boundaries are not monotonic");
    }
    spdlog::debug("{}: {} peak(s) -> [{}, {})", where, n, boundaries.front(), boundaries.back());
    return boundaries;
}

} // namespace

std::vector<int> ComputeRegionBoundaries(std::span<const int> peaks, int width) {
    return BoundariesFromPeaks(peaks, width, "ComputeRegionBoundaries");
}

std::vector<Region> RegionsFromBoundaries(std::span<const int> boundaries) {
    std::vector<Region> regions;
    if (boundaries.size() < 2) { return regions; }
    regions.reserve(boundaries.size() - 1);
    for (std::size_t i = 0; i + 1 < boundaries.size(); ++i) {
        if (boundaries[i + 1] < boundaries[i]) {
            throw InputError("RegionsFromBoundaries: boundaries must be non-decreasing");
        }
        Region r;
        r.index = static_cast<int>(i);
        r.start = boundaries[i];
        r.end   = boundaries[i + 1];
        regions.push_back(r);
    }
    return regions;
}

std::vector<Region> SegmentRegions(std::span<const int> peaks, int width) {
    const std::vector<int> boundaries = BoundariesFromPeaks(peaks, width, "SegmentRegions");
    return RegionsFromBoundaries(boundaries);
}

} // namespace TraceDigit
