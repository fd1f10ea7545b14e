/// \file detail/cv_utils.h
/// \brief Internal OpenCV utility functions shared across core modules.

#pragma once

#include "tracedigit/error.h"

#include <opencv2/imgproc.hpp>

#include <string>

namespace TraceDigit::detail {

/// Throws InputError unless \p m is a non-empty single-channel 8-bit matrix.
inline void RequireIntensityMatrix(const cv::Mat& m, const char* where) {
    if (m.empty() || m.rows <= 0 || m.cols <= 0) {
        throw InputError(std::string(where) + ": intensity matrix is empty");
    }
    if (m.type() != CV_8UC1) {
        throw InputError(std::string(where) + ": intensity matrix must be CV_8UC1, got " +
                         std::to_string(m.channels()) + " channel(s), depth " +
                         std::to_string(m.depth()));
    }
}

/// Ensure the input image is in BGR CV_8U format.
/// Handles BGRA (4-channel), grayscale (1-channel), and BGR (3-channel) inputs.
/// Converts higher bit-depth images to 8-bit.
/// Returns an empty Mat if input is empty.
inline cv::Mat EnsureBgr(const cv::Mat& src) {
    if (src.empty()) { return cv::Mat(); }

    cv::Mat img = src;
    if (img.depth() != CV_8U) {
        double scale = (img.depth() == CV_16U || img.depth() == CV_16S) ? 1.0 / 256.0 : 1.0;
        img.convertTo(img, CV_8U, scale);
    }

    if (img.channels() == 3) { return img; }
    if (img.channels() == 4) {
        cv::Mat bgr;
        cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
        return bgr;
    }
    if (img.channels() == 1) {
        cv::Mat bgr;
        cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
        return bgr;
    }
    throw InputError("Unsupported image channel count: " + std::to_string(img.channels()));
}

} // namespace TraceDigit::detail
