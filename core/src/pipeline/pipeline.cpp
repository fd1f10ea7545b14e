#include "tracedigit/pipeline.h"
#include "tracedigit/annotate.h"
#include "tracedigit/encoding.h"
#include "tracedigit/error.h"
#include "tracedigit/imgproc.h"
#include "tracedigit/report.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>

namespace TraceDigit {
namespace {

namespace fs = std::filesystem;

void NotifyProgress(const ProgressCallback& cb, DigitizeStage stage, float progress) {
    if (cb) { cb(stage, progress); }
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

AxisScale ResolveScale(const DigitizeRequest& request, const std::string& name,
                       const DigitizeResult& result) {
    if (request.scale) { return *request.scale; }
    if (request.scale_provider) {
        std::optional<AxisScale> scale = request.scale_provider(name, result);
        if (scale) { return *scale; }
        throw InputError("No axis scale supplied for " + name);
    }
    throw InputError("DigitizeRequest has neither a scale nor a scale provider");
}

std::string OutputPath(const std::string& dir, const std::string& name, const std::string& suffix) {
    return (fs::path(dir) / (name + suffix)).string();
}

} // namespace

std::vector<std::string> ResolveImagePaths(const std::vector<std::string>& input_paths,
                                           const std::vector<std::string>& extensions) {
    if (input_paths.empty()) { throw InputError("No image paths provided"); }

    std::set<std::string> wanted;
    for (const std::string& ext : extensions) { wanted.insert(Lower(ext)); }

    spdlog::debug("ResolveImagePaths: {} input path(s)", input_paths.size());
    std::set<std::string> unique_paths;
    for (const std::string& raw_path : input_paths) {
        const fs::path p(raw_path);
        if (fs::is_regular_file(p)) {
            spdlog::debug("  file: {}", p.string());
            unique_paths.insert(p.string());
            continue;
        }
        if (fs::is_directory(p)) {
            spdlog::debug("  directory: {}", p.string());
            for (const auto& entry : fs::directory_iterator(p)) {
                if (!entry.is_regular_file()) { continue; }
                if (wanted.count(Lower(entry.path().extension().string())) > 0) {
                    unique_paths.insert(entry.path().string());
                }
            }
            continue;
        }
        throw IOError("Invalid image path: " + raw_path);
    }

    if (unique_paths.empty()) { throw IOError("No image files found from provided inputs"); }
    spdlog::debug("ResolveImagePaths: resolved {} unique file(s)", unique_paths.size());
    return std::vector<std::string>(unique_paths.begin(), unique_paths.end());
}

std::string SidecarPath(const std::string& image_path) {
    const fs::path p(image_path);
    return (p.parent_path() / (p.stem().string() + ".trace.json")).string();
}

ImageSidecar LoadSidecar(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) { throw IOError("Failed to open file: " + path); }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError("Failed to parse sidecar " + path + ": " + e.what());
    }
    if (!j.is_object()) { throw FormatError("Sidecar root must be an object: " + path); }

    ImageSidecar sidecar;
    try {
        if (j.contains("roi")) {
            const auto& roi = j.at("roi");
            if (!roi.is_array() || roi.size() != 4) {
                throw FormatError("roi must be an array [x, y, w, h]");
            }
            sidecar.roi = cv::Rect(roi.at(0).get<int>(), roi.at(1).get<int>(),
                                   roi.at(2).get<int>(), roi.at(3).get<int>());
        }
        const bool has_bottom = j.contains("y_bottom");
        const bool has_top    = j.contains("y_top");
        if (has_bottom != has_top) {
            throw FormatError("y_bottom and y_top must be given together: " + path);
        }
        if (has_bottom) {
            AxisScale scale;
            scale.y_bottom = j.at("y_bottom").get<double>();
            scale.y_top    = j.at("y_top").get<double>();
            sidecar.scale  = scale;
        }
    } catch (const nlohmann::json::type_error& e) {
        throw FormatError("Sidecar value has wrong type in " + path + ": " + e.what());
    }
    return sidecar;
}

DigitizeOutcome ProcessImage(const DigitizeRequest& request, ProgressCallback progress) {
    request.config.Validate();

    // === 1. Preprocess ===
    NotifyProgress(progress, DigitizeStage::Preprocessing, 0.0f);

    ImgProc imgproc(request.config.preprocess);
    ImgProcResult img;
    if (!request.image_buffer.empty()) {
        img = imgproc.RunFromBuffer(request.image_buffer, request.roi, request.image_name);
    } else if (!request.image_path.empty()) {
        img = imgproc.Run(request.image_path, request.roi);
    } else {
        throw InputError("No image input provided (neither path nor buffer)");
    }

    DigitizeOutcome outcome;
    outcome.name = img.name.empty() ? "image" : img.name;

    const bool write_files = !request.output_dir.empty();
    if (write_files) { fs::create_directories(request.output_dir); }
    if (write_files && request.write_cropped) {
        const std::string path = OutputPath(request.output_dir, outcome.name, "_cropped.jpg");
        SaveImage(img.cropped, path);
        outcome.written_files.push_back(path);
        spdlog::info("Cropped image saved to {}", path);
    }

    NotifyProgress(progress, DigitizeStage::Preprocessing, 1.0f);
    spdlog::info("Stage: preprocessing completed, intensity={}x{}", img.width(), img.height());

    // === 2. Locate cycles ===
    NotifyProgress(progress, DigitizeStage::Locating, 0.0f);
    outcome.result = LocateCycles(img.intensity, request.config);
    NotifyProgress(progress, DigitizeStage::Locating, 1.0f);

    if (outcome.Skipped()) {
        spdlog::warn("{}: too few peaks detected, skipping this image", outcome.name);
        return outcome;
    }

    // === 3. Calibrate ===
    NotifyProgress(progress, DigitizeStage::Calibrating, 0.0f);
    ApplyCalibration(outcome.result, ResolveScale(request, outcome.name, outcome.result));
    NotifyProgress(progress, DigitizeStage::Calibrating, 1.0f);
    spdlog::info("Stage: calibrating completed, samples={}, mean={:.4f}, std={:.4f}",
                 outcome.result.summary.count, outcome.result.summary.mean,
                 outcome.result.summary.stddev);

    // === 4. Export ===
    NotifyProgress(progress, DigitizeStage::Exporting, 0.0f);

    cv::Mat labeled;
    if (request.generate_annotation) {
        labeled = AnnotateResult(img.upscaled, outcome.result);
        if (!write_files) { outcome.annotated_jpg = EncodeJpeg(labeled); }
    }

    if (write_files) {
        if (!labeled.empty()) {
            const std::string path = OutputPath(request.output_dir, outcome.name, "_labeled.jpg");
            SaveImage(labeled, path);
            outcome.written_files.push_back(path);
        }

        const std::string csv_path = OutputPath(request.output_dir, outcome.name, ".csv");
        WriteTextFile(csv_path, SamplesToCsv(outcome.result));
        outcome.written_files.push_back(csv_path);

        const std::string stats_path = OutputPath(request.output_dir, outcome.name, "_stats.csv");
        WriteTextFile(stats_path, SummaryToCsv(outcome.result.summary));
        outcome.written_files.push_back(stats_path);

        if (request.write_json) {
            const std::string json_path = OutputPath(request.output_dir, outcome.name, ".json");
            WriteTextFile(json_path, ResultToJsonString(outcome.result));
            outcome.written_files.push_back(json_path);
        }
    }

    NotifyProgress(progress, DigitizeStage::Exporting, 1.0f);
    spdlog::info("Done: {} ({} file(s) written)", outcome.name, outcome.written_files.size());
    return outcome;
}

} // namespace TraceDigit
