/// \file pipeline.h
/// \brief Per-image pipeline from an image file to samples, tables and overlay.

#pragma once

#include "calibration.h"
#include "config.h"
#include "digitize.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace TraceDigit {

/// Pipeline stage.
enum class DigitizeStage : uint8_t {
    Preprocessing, ///< Loading, resizing, cropping and thresholding the image.
    Locating,      ///< Profile, peaks, regions and landmarks.
    Calibrating,   ///< Obtaining the axis scale and mapping rows to values.
    Exporting,     ///< Writing tables, overlay and JSON.
};

/// Progress callback function type.
/// \param stage Current pipeline stage
/// \param progress Progress value [0.0, 1.0] within the current stage
using ProgressCallback = std::function<void(DigitizeStage stage, float progress)>;

/// Supplies the axis scale once landmarks are known (e.g. by prompting an
/// operator). Returning std::nullopt aborts the image with InputError.
using ScaleProvider =
    std::function<std::optional<AxisScale>(const std::string& name, const DigitizeResult& result)>;

/// Per-image overrides read from a `<stem>.trace.json` file next to the image.
struct ImageSidecar {
    std::optional<cv::Rect> roi;
    std::optional<AxisScale> scale;
};

/// Request parameters for digitizing one image.
struct DigitizeRequest {
    // Image input (buffer takes priority if non-empty)
    std::string image_path; ///< Path to input image file (ignored if image_buffer is non-empty).
    std::vector<uint8_t> image_buffer; ///< Encoded image data (takes priority over image_path).
    std::string image_name; ///< Name used for output files when loading from buffer.

    cv::Rect roi; ///< Crop rectangle in resized-image coordinates (empty = whole image).

    DigitizeConfig config;

    // Axis scale (fixed scale takes priority over the provider)
    std::optional<AxisScale> scale;
    ScaleProvider scale_provider;

    // Output control (empty output_dir = don't write files, only return buffers)
    std::string output_dir;
    bool generate_annotation = true; ///< Render the labeled overlay into the outcome.
    bool write_cropped       = true; ///< Write <name>_cropped.jpg.
    bool write_json          = false; ///< Write <name>.json with the full result.
};

/// Result of digitizing one image.
struct DigitizeOutcome {
    std::string name;
    DigitizeResult result;

    /// Labeled overlay, filled when generate_annotation is set and no
    /// output_dir is given (otherwise it is written as <name>_labeled.jpg).
    std::vector<uint8_t> annotated_jpg;
    std::vector<std::string> written_files;

    bool Skipped() const { return result.status == DigitizeStatus::InsufficientPeaks; }
};

/// Runs preprocessing, digitizing, calibration and export for one image.
/// Throws InputError / IOError on failures that abort this image;
/// InsufficientPeaks is reported through the outcome status instead.
DigitizeOutcome ProcessImage(const DigitizeRequest& request, ProgressCallback progress = nullptr);

/// Resolves image file paths from input paths (files or directories).
/// Directories contribute their regular files whose lower-cased extension is
/// in \p extensions; the result is sorted and free of duplicates.
std::vector<std::string> ResolveImagePaths(const std::vector<std::string>& input_paths,
                                           const std::vector<std::string>& extensions = {".jpg"});

/// Path of the sidecar file for \p image_path (`<dir>/<stem>.trace.json`).
std::string SidecarPath(const std::string& image_path);

/// Loads a sidecar file: `{"roi": [x, y, w, h], "y_bottom": b, "y_top": t}`.
/// Every key is optional; y_bottom and y_top must appear together.
ImageSidecar LoadSidecar(const std::string& path);

} // namespace TraceDigit
