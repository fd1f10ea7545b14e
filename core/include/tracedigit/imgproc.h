#pragma once

/// \file imgproc.h
/// \brief Image preprocessing: resize, crop, upscale, grayscale and brightness floor.

#include "config.h"

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace TraceDigit {

/// Result of image preprocessing.
struct ImgProcResult {
    std::string name;

    cv::Mat resized;   ///< Input resized to the target width, CV_8UC3 BGR.
    cv::Rect roi;      ///< Crop rectangle actually applied, in resized coordinates.
    cv::Mat cropped;   ///< resized(roi), CV_8UC3 BGR.
    cv::Mat upscaled;  ///< cropped scaled by upscale_factor, CV_8UC3 BGR.
    cv::Mat intensity; ///< Gray upscaled image with the brightness floor applied, CV_8UC1.

    int width() const { return intensity.cols; }
    int height() const { return intensity.rows; }
};

/// Image preprocessor producing the intensity matrix consumed by Digitize().
class ImgProc {
public:
    explicit ImgProc(const PreprocessConfig& config = {});

    /// Process an image from a file path. An empty \p roi selects the whole
    /// resized image.
    ImgProcResult Run(const std::string& path, const cv::Rect& roi = cv::Rect()) const;

    /// Process an already-loaded cv::Mat.
    ImgProcResult Run(const cv::Mat& input, const cv::Rect& roi = cv::Rect(),
                      const std::string& name = "") const;

    /// Process an image from an in-memory buffer (PNG, JPEG, etc.).
    ImgProcResult RunFromBuffer(const std::vector<uint8_t>& buffer,
                                const cv::Rect& roi = cv::Rect(),
                                const std::string& name = "") const;

    /// Read-only access to the current configuration.
    const PreprocessConfig& config() const { return config_; }

private:
    PreprocessConfig config_;

    void Resize(const cv::Mat& input, cv::Mat& resized) const;
    cv::Rect ClipRoi(const cv::Rect& roi, const cv::Size& size) const;
    void Upscale(const cv::Mat& cropped, cv::Mat& upscaled) const;
    void ToIntensity(const cv::Mat& bgr, cv::Mat& intensity) const;
};

} // namespace TraceDigit
