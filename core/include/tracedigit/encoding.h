/// \file encoding.h
/// \brief Image encoding and file output.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace TraceDigit {

/// Encodes an OpenCV image to JPEG format.
/// \param image Input image (BGR or grayscale)
/// \param quality JPEG quality [1,100] (default: 95)
/// \return JPEG-encoded image data
std::vector<uint8_t> EncodeJpeg(const cv::Mat& image, int quality = 95);

/// Writes an image to \p path, format chosen by extension.
/// Throws InputError for an empty image or path, IOError if writing fails.
void SaveImage(const cv::Mat& image, const std::string& path);

} // namespace TraceDigit
