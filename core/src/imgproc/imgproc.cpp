#include "tracedigit/imgproc.h"
#include "tracedigit/error.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>

namespace TraceDigit {

namespace {

static auto ToCvMethod(ResizeMethod method) {
    switch (method) {
    case ResizeMethod::Nearest:
        return cv::INTER_NEAREST;
    case ResizeMethod::Area:
        return cv::INTER_AREA;
    case ResizeMethod::Linear:
        return cv::INTER_LINEAR;
    case ResizeMethod::Cubic:
        return cv::INTER_CUBIC;
    }
    return cv::INTER_AREA;
}

static std::string PathStem(const std::string& path) {
    if (path.empty()) { return {}; }
    std::filesystem::path p(path);
    std::string stem = p.stem().string();
    if (!stem.empty()) { return stem; }
    return p.filename().string();
}

} // namespace

ImgProc::ImgProc(const PreprocessConfig& config) : config_(config) {}

ImgProcResult ImgProc::Run(const std::string& path, const cv::Rect& roi) const {
    spdlog::info("ImgProc: loading image from file: {}", path);
    cv::Mat input = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (input.empty()) { throw IOError("Failed to read image: " + path); }
    spdlog::info("ImgProc: loaded {}x{}, {} channel(s)", input.cols, input.rows, input.channels());
    return Run(input, roi, PathStem(path));
}

ImgProcResult ImgProc::Run(const cv::Mat& input, const cv::Rect& roi,
                           const std::string& name) const {
    if (input.empty()) { throw InputError("ImgProc::Run: input image is empty"); }

    ImgProcResult result;
    result.name = name;

    cv::Mat bgr = detail::EnsureBgr(input);
    Resize(bgr, result.resized);

    result.roi     = ClipRoi(roi, result.resized.size());
    result.cropped = result.resized(result.roi).clone();

    Upscale(result.cropped, result.upscaled);
    ToIntensity(result.upscaled, result.intensity);
    return result;
}

ImgProcResult ImgProc::RunFromBuffer(const std::vector<uint8_t>& buffer, const cv::Rect& roi,
                                     const std::string& name) const {
    if (buffer.empty()) { throw InputError("ImgProc::RunFromBuffer: buffer is empty"); }
    spdlog::info("ImgProc: decoding image from buffer ({} bytes, name={})", buffer.size(), name);
    cv::Mat input = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    if (input.empty()) {
        throw IOError("ImgProc::RunFromBuffer: failed to decode image");
    }
    spdlog::info("ImgProc: decoded {}x{}, {} channel(s)", input.cols, input.rows, input.channels());
    return Run(input, roi, name);
}

void ImgProc::Resize(const cv::Mat& input, cv::Mat& resized) const {
    if (config_.target_width <= 0 || config_.target_width == input.cols) {
        resized = input;
        return;
    }

    const double scale      = static_cast<double>(config_.target_width) / input.cols;
    const int target_height = std::max(1, static_cast<int>(input.rows * scale));
    cv::Size target_size(config_.target_width, target_height);
    cv::resize(input, resized, target_size, 0.0, 0.0, ToCvMethod(config_.resize_method));
    spdlog::info("ImgProc: resize {}x{} -> {}x{} (scale={:.3f})", input.cols, input.rows,
                 target_size.width, target_size.height, scale);
}

cv::Rect ImgProc::ClipRoi(const cv::Rect& roi, const cv::Size& size) const {
    const cv::Rect full(0, 0, size.width, size.height);
    if (roi.width <= 0 || roi.height <= 0) { return full; }

    const cv::Rect clipped = roi & full;
    if (clipped.empty()) {
        throw InputError("ImgProc: ROI (" + std::to_string(roi.x) + "," + std::to_string(roi.y) +
                         "," + std::to_string(roi.width) + "," + std::to_string(roi.height) +
                         ") does not overlap the " + std::to_string(size.width) + "x" +
                         std::to_string(size.height) + " image");
    }
    if (clipped != roi) {
        spdlog::warn("ImgProc: ROI clipped to ({},{},{},{})", clipped.x, clipped.y, clipped.width,
                     clipped.height);
    }
    return clipped;
}

void ImgProc::Upscale(const cv::Mat& cropped, cv::Mat& upscaled) const {
    const double f = static_cast<double>(config_.upscale_factor);
    if (f == 1.0) {
        upscaled = cropped.clone();
        return;
    }
    cv::resize(cropped, upscaled, cv::Size(), f, f, ToCvMethod(config_.upscale_method));
    if (upscaled.empty()) { throw InputError("ImgProc: upscale produced an empty image"); }
    spdlog::debug("ImgProc: upscale {}x{} -> {}x{}", cropped.cols, cropped.rows, upscaled.cols,
                  upscaled.rows);
}

void ImgProc::ToIntensity(const cv::Mat& bgr, cv::Mat& intensity) const {
    cv::cvtColor(bgr, intensity, cv::COLOR_BGR2GRAY);
    if (config_.brightness_threshold > 0) {
        // THRESH_TOZERO keeps values > thresh, so pass floor - 1.
        cv::threshold(intensity, intensity, config_.brightness_threshold - 1, 0,
                      cv::THRESH_TOZERO);
    }
}

} // namespace TraceDigit
