#pragma once

/// \file segment.h
/// \brief Partition of the image columns into one region per detected cycle.

#include <span>
#include <vector>

namespace TraceDigit {

/// Half-open column interval [start, end) covering one waveform cycle.
struct Region {
    int index = 0; ///< Position in the region sequence (0-based).
    int start = 0;
    int end   = 0;

    int Width() const { return end - start; }
    bool Empty() const { return end <= start; }
    bool Contains(int column) const { return column >= start && column < end; }
};

/// Region boundaries for \p peaks in an image \p width columns wide.
///
/// Interior boundaries are the midpoints of consecutive peaks. The outer two
/// extend half of the first/last inter-peak gap beyond the outermost peaks,
/// clamped to [0, width]. Returns peaks.size() + 1 non-decreasing values.
///
/// Throws InputError if fewer than two peaks are given, width <= 0, a peak
/// lies outside [0, width), or peaks are not strictly increasing.
std::vector<int> ComputeRegionBoundaries(std::span<const int> peaks, int width);

/// Regions [b[i], b[i+1]) built from ComputeRegionBoundaries().
std::vector<Region> SegmentRegions(std::span<const int> peaks, int width);

/// Regions from an already computed boundary sequence.
std::vector<Region> RegionsFromBoundaries(std::span<const int> boundaries);

} // namespace TraceDigit
