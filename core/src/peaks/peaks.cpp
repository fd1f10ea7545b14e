#include "tracedigit/peaks.h"
#include "tracedigit/error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>

namespace TraceDigit {

namespace {

std::vector<int> LocalMaxima(std::span<const double> x) {
    std::vector<int> maxima;
    const int n = static_cast<int>(x.size());
    if (n < 3) { return maxima; }

    const int i_max = n - 1;
    int i           = 1;
    while (i < i_max) {
        if (x[i - 1] < x[i]) {
            int i_ahead = i + 1;
            while (i_ahead < i_max && x[i_ahead] == x[i]) { ++i_ahead; }
            if (x[i_ahead] < x[i]) {
                const int left_edge  = i;
                const int right_edge = i_ahead - 1;
                maxima.push_back((left_edge + right_edge) / 2);
                i = i_ahead;
            }
        }
        ++i;
    }
    return maxima;
}

std::vector<int> SelectByDistance(std::span<const double> x, const std::vector<int>& peaks,
                                  int distance) {
    const std::size_t n = peaks.size();
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return x[peaks[a]] > x[peaks[b]];
    });

    std::vector<bool> keep(n, true);
    for (std::size_t j : order) {
        if (!keep[j]) { continue; }

        for (std::size_t k = j; k-- > 0;) {
            if (peaks[j] - peaks[k] >= distance) { break; }
            keep[k] = false;
        }
        for (std::size_t k = j + 1; k < n; ++k) {
            if (peaks[k] - peaks[j] >= distance) { break; }
            keep[k] = false;
        }
    }

    std::vector<int> kept;
    kept.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (keep[i]) { kept.push_back(peaks[i]); }
    }
    return kept;
}

} // namespace

std::vector<double> PeakProminences(std::span<const double> x, std::span<const int> peaks) {
    const int n = static_cast<int>(x.size());
    std::vector<double> prominences;
    prominences.reserve(peaks.size());

    for (int peak : peaks) {
        if (peak < 0 || peak >= n) {
            throw InputError("PeakProminences: peak " + std::to_string(peak) +
                             " outside signal of length " + std::to_string(n));
        }
        const double top = x[peak];

        double left_min = top;
        for (int i = peak; i >= 0 && x[i] <= top; --i) { left_min = std::min(left_min, x[i]); }

        double right_min = top;
        for (int i = peak; i < n && x[i] <= top; ++i) { right_min = std::min(right_min, x[i]); }

        prominences.push_back(top - std::max(left_min, right_min));
    }
    return prominences;
}

std::vector<int> FindPeaks(std::span<const double> x, const PeakCriteria& criteria,
                           std::vector<double>* prominences) {
    if (!(criteria.distance_min >= 1.0)) {
        throw InputError("FindPeaks: distance_min must be >= 1");
    }
    // Any spacing beyond the signal length already keeps a single peak.
    const double max_distance = static_cast<double>(std::max<std::size_t>(x.size(), 2));
    const int distance =
        static_cast<int>(std::ceil(std::min(criteria.distance_min, max_distance)));

    std::vector<int> peaks = LocalMaxima(x);
    const std::size_t n_maxima = peaks.size();

    std::erase_if(peaks, [&](int p) { return x[p] < criteria.min_height; });
    const std::size_t n_height = peaks.size();

    if (distance > 1 && peaks.size() > 1) { peaks = SelectByDistance(x, peaks, distance); }
    const std::size_t n_distance = peaks.size();

    std::vector<double> prom = PeakProminences(x, peaks);
    std::vector<int> kept;
    std::vector<double> kept_prom;
    kept.reserve(peaks.size());
    kept_prom.reserve(peaks.size());
    for (std::size_t i = 0; i < peaks.size(); ++i) {
        if (prom[i] >= criteria.min_prominence) {
            kept.push_back(peaks[i]);
            kept_prom.push_back(prom[i]);
        }
    }

    spdlog::debug("FindPeaks: maxima={}, after height={}, after distance={}, after prominence={}",
                  n_maxima, n_height, n_distance, kept.size());

    if (prominences) { *prominences = std::move(kept_prom); }
    return kept;
}

PeakDetection DetectPeaks(std::span<const double> profile, const PeakDetectorConfig& cfg) {
    PeakDetection det;
    det.profile_stats  = ComputeSignalStats(profile);
    det.min_prominence = cfg.prominence_factor * det.profile_stats.stddev;
    det.min_height     = det.profile_stats.mean + cfg.height_factor * det.profile_stats.stddev;

    PeakCriteria criteria;
    criteria.min_height     = det.min_height;
    criteria.min_prominence = det.min_prominence;
    criteria.distance_min   = cfg.distance_min;

    det.peaks = FindPeaks(profile, criteria, &det.prominences);
    spdlog::debug("DetectPeaks: mean={:.3f}, std={:.3f}, min_height={:.3f}, "
                  "min_prominence={:.3f}, peaks={}",
                  det.profile_stats.mean, det.profile_stats.stddev, det.min_height,
                  det.min_prominence, det.peaks.size());
    return det;
}

} // namespace TraceDigit
