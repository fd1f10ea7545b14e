#include "tracedigit/encoding.h"
#include "tracedigit/error.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>

#include <algorithm>

namespace TraceDigit {

std::vector<uint8_t> EncodeJpeg(const cv::Mat& image, int quality) {
    if (image.empty()) { throw InputError("EncodeJpeg: image is empty"); }
    quality = std::clamp(quality, 1, 100);
    std::vector<uint8_t> buf;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    if (!cv::imencode(".jpg", image, buf, params)) {
        throw IOError("EncodeJpeg: cv::imencode failed");
    }
    spdlog::debug("EncodeJpeg: {}x{} (q={}) -> {} bytes", image.cols, image.rows, quality,
                  buf.size());
    return buf;
}

void SaveImage(const cv::Mat& image, const std::string& path) {
    if (image.empty()) { throw InputError("SaveImage: image is empty"); }
    if (path.empty()) { throw InputError("SaveImage: path is empty"); }
    bool ok = false;
    try {
        ok = cv::imwrite(path, image);
    } catch (const cv::Exception& e) {
        throw IOError("SaveImage: " + path + ": " + e.what());
    }
    if (!ok) { throw IOError("SaveImage: failed to write " + path); }
    spdlog::debug("SaveImage: {}x{} -> {}", image.cols, image.rows, path);
}

} // namespace TraceDigit
