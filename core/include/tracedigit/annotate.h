#pragma once

/// \file annotate.h
/// \brief Overlay of peaks, regions and landmarks for visual inspection.

#include "digitize.h"

#include <opencv2/core.hpp>

namespace TraceDigit {

/// Drawing options. Colors are BGR.
struct AnnotateStyle {
    int landmark_radius      = 5;
    cv::Scalar landmark      = cv::Scalar(255, 0, 0);
    cv::Scalar landmark_text = cv::Scalar(0, 255, 255);
    cv::Scalar boundary      = cv::Scalar(0, 255, 0);
    cv::Scalar region_text   = cv::Scalar(255, 0, 255);
    bool draw_peaks          = false;
    cv::Scalar peak          = cv::Scalar(0, 0, 255);
};

/// Copy of \p image with landmark dots and cycle numbers, region boundary
/// lines and region numbers drawn on it. \p image must have the size of the
/// intensity matrix the result came from; grayscale input is converted to BGR.
cv::Mat AnnotateResult(const cv::Mat& image, const DigitizeResult& result,
                       const AnnotateStyle& style = {});

} // namespace TraceDigit
