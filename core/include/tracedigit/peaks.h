#pragma once

/// \file peaks.h
/// \brief Periodic peak detection on a brightness profile.

#include "config.h"
#include "profile.h"

#include <limits>
#include <span>
#include <vector>

namespace TraceDigit {

/// Absolute filters for FindPeaks(). Defaults disable every filter except the
/// minimum distance of one sample.
struct PeakCriteria {
    double min_height     = -std::numeric_limits<double>::infinity();
    double min_prominence = 0.0;
    double distance_min   = 1.0; ///< Rounded up; must be >= 1.
};

/// Peaks of a profile plus the statistics that produced the thresholds.
struct PeakDetection {
    std::vector<int> peaks;          ///< Strictly increasing column indices.
    std::vector<double> prominences; ///< prominences[i] belongs to peaks[i].

    SignalStats profile_stats;
    double min_prominence = 0.0;
    double min_height     = 0.0;
};

/// Local maxima of \p x filtered by height, distance and prominence, applied
/// in that order.
///
/// A local maximum is a sample strictly higher than its left neighbour,
/// followed by a run of equal samples and then a strictly lower one; flat
/// tops report their midpoint. The distance filter keeps the highest peak of
/// any group closer than distance_min (leftmost wins between equal heights).
/// Throws InputError if criteria.distance_min < 1.
std::vector<int> FindPeaks(std::span<const double> x, const PeakCriteria& criteria = {},
                           std::vector<double>* prominences = nullptr);

/// Prominence of each peak in \p peaks: height above the higher of the two
/// minima that separate it from the nearest strictly higher sample on each
/// side (or from the array ends).
std::vector<double> PeakProminences(std::span<const double> x, std::span<const int> peaks);

/// Peak detection with thresholds derived from the profile itself:
/// prominence >= prominence_factor * stddev and
/// height >= mean + height_factor * stddev.
PeakDetection DetectPeaks(std::span<const double> profile, const PeakDetectorConfig& cfg);

} // namespace TraceDigit
