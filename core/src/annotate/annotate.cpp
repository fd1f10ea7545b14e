#include "tracedigit/annotate.h"
#include "tracedigit/error.h"
#include "detail/cv_utils.h"

#include <opencv2/imgproc.hpp>

#include <cstddef>
#include <string>

namespace TraceDigit {

cv::Mat AnnotateResult(const cv::Mat& image, const DigitizeResult& result,
                       const AnnotateStyle& style) {
    if (image.empty()) { throw InputError("AnnotateResult: image is empty"); }
    if (image.cols != result.width || image.rows != result.height) {
        throw InputError("AnnotateResult: image is " + std::to_string(image.cols) + "x" +
                         std::to_string(image.rows) + " but result is " +
                         std::to_string(result.width) + "x" + std::to_string(result.height));
    }

    cv::Mat canvas = detail::EnsureBgr(image).clone();
    const int h    = canvas.rows;

    if (style.draw_peaks) {
        for (int p : result.detection.peaks) {
            cv::line(canvas, cv::Point(p, h - 12), cv::Point(p, h - 1), style.peak, 1);
        }
    }

    for (std::size_t i = 0; i < result.landmarks.size(); ++i) {
        const Landmark& lm = result.landmarks[i];
        const cv::Point pt(lm.column, lm.row);
        cv::circle(canvas, pt, style.landmark_radius, style.landmark, cv::FILLED);
        cv::putText(canvas, std::to_string(i + 1), cv::Point(lm.column - 10, lm.row - 10),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, style.landmark_text, 1, cv::LINE_AA);
    }

    for (int b : result.boundaries) {
        cv::line(canvas, cv::Point(b, 0), cv::Point(b, h), style.boundary, 1);
    }
    for (const Region& r : result.regions) {
        const int label_x = (r.start + r.end) / 2;
        cv::putText(canvas, std::to_string(r.index + 1), cv::Point(label_x - 5, 20),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, style.region_text, 2, cv::LINE_AA);
    }
    return canvas;
}

} // namespace TraceDigit
