#include "tracedigit/synthetic.h"
#include "tracedigit/error.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace TraceDigit {

namespace {

void ValidateSpec(const SyntheticTraceSpec& spec) {
    if (spec.width <= 0 || spec.height <= 0) {
        throw InputError("RenderSyntheticTrace: size must be positive");
    }
    if (!(spec.sigma_cols > 0.0)) {
        throw InputError("RenderSyntheticTrace: sigma_cols must be positive");
    }
    if (spec.thickness <= 0) {
        throw InputError("RenderSyntheticTrace: thickness must be positive");
    }
}

} // namespace

int SyntheticTraceRow(const SyntheticTraceSpec& spec, int x) {
    double level = 0.0;
    for (int c : spec.centers) {
        const double d = static_cast<double>(x - c) / spec.sigma_cols;
        level          = std::max(level, std::exp(-0.5 * d * d));
    }
    const double height_rows = spec.baseline_rows + spec.amplitude_rows * level;
    const long row           = std::lround(static_cast<double>(spec.height) - height_rows);
    return static_cast<int>(std::clamp<long>(row, 0, spec.height - 1));
}

cv::Mat RenderSyntheticTrace(const SyntheticTraceSpec& spec) {
    ValidateSpec(spec);

    cv::Mat img(spec.height, spec.width, CV_8UC1, cv::Scalar(0));
    if (spec.filled) {
        for (int x = 0; x < spec.width; ++x) {
            const int top = SyntheticTraceRow(spec, x);
            img.colRange(x, x + 1).rowRange(top, spec.height).setTo(cv::Scalar(spec.value));
        }
    } else {
        std::vector<cv::Point> curve;
        curve.reserve(static_cast<size_t>(spec.width));
        for (int x = 0; x < spec.width; ++x) { curve.emplace_back(x, SyntheticTraceRow(spec, x)); }
        cv::polylines(img, curve, false, cv::Scalar(spec.value), spec.thickness, cv::LINE_8);
    }

    spdlog::debug("RenderSyntheticTrace: {}x{}, {} bump(s), filled={}", spec.width, spec.height,
                  spec.centers.size(), spec.filled);
    return img;
}

} // namespace TraceDigit
