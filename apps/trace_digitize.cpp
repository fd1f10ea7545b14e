#include "tracedigit/logging.h"
#include "tracedigit/pipeline.h"
#include "tracedigit/version.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace TraceDigit;

namespace {

struct Options {
    std::vector<std::string> inputs;
    std::string out_dir     = "output";
    std::string config_path;
    std::string save_config_path;
    std::vector<std::string> extensions;

    std::optional<cv::Rect> roi;

    bool y_bottom_set = false;
    double y_bottom   = 0.0;
    bool y_top_set    = false;
    double y_top      = 0.0;
    bool prompt       = false;
    bool use_sidecar  = true;

    bool write_json   = false;
    bool annotate     = true;

    bool distance_set  = false;
    double distance    = 0.0;
    bool prom_set      = false;
    double prominence  = 0.0;
    bool height_set    = false;
    double height      = 0.0;
    bool thresh_set    = false;
    int threshold      = 0;
    bool width_set     = false;
    int target_width   = 0;
    bool upscale_set   = false;
    float upscale      = 0.0f;
    bool floor_set     = false;
    int floor          = 0;

    std::string log_level = "info";
};

void PrintUsage(const char* exe) {
    std::printf(
        "Usage: %s [options] INPUT [INPUT ...]\n"
        "INPUT is an image file or a directory (scanned for --ext files).\n"
        "Options:\n"
        "  --out DIR              Output directory (default: output)\n"
        "  --config PATH          JSON configuration file\n"
        "  --save-config PATH     Write the effective configuration and exit\n"
        "  --ext .EXT             Image extension to collect from directories (repeatable, default .jpg)\n"
        "  --roi X,Y,W,H          Crop rectangle after resizing (default: whole image)\n"
        "  --y-bottom V           Axis value at the bottom edge of the crop\n"
        "  --y-top V              Axis value at the top edge of the crop\n"
        "                         (without a scale from flags or sidecar the tool prompts)\n"
        "  --prompt               Ask for the axis values on the console even if known\n"
        "  --no-sidecar           Ignore <stem>.trace.json files next to the images\n"
        "  --json                 Also write <stem>.json with the full result\n"
        "  --no-annotate          Do not render <stem>_labeled.jpg\n"
        "  --distance N           Minimum peak spacing in columns (default 60)\n"
        "  --prominence F         Prominence factor (default 1.0)\n"
        "  --height F             Height factor (default 0.3)\n"
        "  --threshold N          Landmark intensity threshold (default 0)\n"
        "  --target-width N       Resize width before cropping (default 1024, 0 = keep)\n"
        "  --upscale F            Upscale factor after cropping (default 2)\n"
        "  --floor N              Brightness floor, darker pixels are zeroed (default 5)\n"
        "  --log-level LEVEL      Log level: trace/debug/info/warn/error/off (default: info)\n"
        "  --version              Print version and exit\n",
        exe);
}

bool ParseInt(const char* s, int& out) {
    if (!s) { return false; }
    try {
        size_t idx = 0;
        int value  = std::stoi(s, &idx, 10);
        if (idx != std::string(s).size()) { return false; }
        out = value;
        return true;
    } catch (const std::exception&) { return false; }
}

bool ParseDouble(const char* s, double& out) {
    if (!s) { return false; }
    try {
        size_t idx   = 0;
        double value = std::stod(s, &idx);
        if (idx != std::string(s).size()) { return false; }
        out = value;
        return true;
    } catch (const std::exception&) { return false; }
}

bool ParseRoi(const char* s, cv::Rect& out) {
    if (!s) { return false; }
    std::stringstream ss(s);
    std::string item;
    int values[4];
    int n = 0;
    while (std::getline(ss, item, ',')) {
        if (n >= 4 || !ParseInt(item.c_str(), values[n])) { return false; }
        ++n;
    }
    if (n != 4 || values[2] <= 0 || values[3] <= 0) { return false; }
    out = cv::Rect(values[0], values[1], values[2], values[3]);
    return true;
}

bool ParseArgs(int argc, char** argv, Options& opt, bool& exit_ok) {
    exit_ok = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--out" && i + 1 < argc) {
            opt.out_dir = argv[++i];
            continue;
        }
        if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
            continue;
        }
        if (arg == "--save-config" && i + 1 < argc) {
            opt.save_config_path = argv[++i];
            continue;
        }
        if (arg == "--ext" && i + 1 < argc) {
            std::string ext = argv[++i];
            if (!ext.empty() && ext[0] != '.') { ext = "." + ext; }
            opt.extensions.push_back(ext);
            continue;
        }
        if (arg == "--roi" && i + 1 < argc) {
            cv::Rect roi;
            if (!ParseRoi(argv[++i], roi)) {
                std::fprintf(stderr, "Invalid --roi value, expected X,Y,W,H\n");
                return false;
            }
            opt.roi = roi;
            continue;
        }
        if (arg == "--y-bottom" && i + 1 < argc) {
            if (!ParseDouble(argv[++i], opt.y_bottom)) {
                std::fprintf(stderr, "Invalid --y-bottom value\n");
                return false;
            }
            opt.y_bottom_set = true;
            continue;
        }
        if (arg == "--y-top" && i + 1 < argc) {
            if (!ParseDouble(argv[++i], opt.y_top)) {
                std::fprintf(stderr, "Invalid --y-top value\n");
                return false;
            }
            opt.y_top_set = true;
            continue;
        }
        if (arg == "--prompt") {
            opt.prompt = true;
            continue;
        }
        if (arg == "--no-sidecar") {
            opt.use_sidecar = false;
            continue;
        }
        if (arg == "--json") {
            opt.write_json = true;
            continue;
        }
        if (arg == "--no-annotate") {
            opt.annotate = false;
            continue;
        }
        if (arg == "--distance" && i + 1 < argc) {
            if (!ParseDouble(argv[++i], opt.distance) || opt.distance < 1.0) {
                std::fprintf(stderr, "Invalid --distance value\n");
                return false;
            }
            opt.distance_set = true;
            continue;
        }
        if (arg == "--prominence" && i + 1 < argc) {
            if (!ParseDouble(argv[++i], opt.prominence) || opt.prominence < 0.0) {
                std::fprintf(stderr, "Invalid --prominence value\n");
                return false;
            }
            opt.prom_set = true;
            continue;
        }
        if (arg == "--height" && i + 1 < argc) {
            if (!ParseDouble(argv[++i], opt.height)) {
                std::fprintf(stderr, "Invalid --height value\n");
                return false;
            }
            opt.height_set = true;
            continue;
        }
        if (arg == "--threshold" && i + 1 < argc) {
            if (!ParseInt(argv[++i], opt.threshold) || opt.threshold < 0 || opt.threshold > 255) {
                std::fprintf(stderr, "Invalid --threshold value\n");
                return false;
            }
            opt.thresh_set = true;
            continue;
        }
        if (arg == "--target-width" && i + 1 < argc) {
            if (!ParseInt(argv[++i], opt.target_width) || opt.target_width < 0) {
                std::fprintf(stderr, "Invalid --target-width value\n");
                return false;
            }
            opt.width_set = true;
            continue;
        }
        if (arg == "--upscale" && i + 1 < argc) {
            double f = 0.0;
            if (!ParseDouble(argv[++i], f) || f <= 0.0) {
                std::fprintf(stderr, "Invalid --upscale value\n");
                return false;
            }
            opt.upscale     = static_cast<float>(f);
            opt.upscale_set = true;
            continue;
        }
        if (arg == "--floor" && i + 1 < argc) {
            if (!ParseInt(argv[++i], opt.floor) || opt.floor < 0 || opt.floor > 255) {
                std::fprintf(stderr, "Invalid --floor value\n");
                return false;
            }
            opt.floor_set = true;
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            opt.log_level = argv[++i];
            continue;
        }
        if (arg == "--version") {
            std::printf("trace_digitize %s\n", TRACEDIGIT_VERSION_STRING);
            exit_ok = true;
            return false;
        }
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            exit_ok = true;
            return false;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return false;
        }
        opt.inputs.push_back(arg);
    }
    if (opt.y_bottom_set != opt.y_top_set) {
        std::fprintf(stderr, "--y-bottom and --y-top must be given together\n");
        return false;
    }
    return true;
}

DigitizeConfig BuildConfig(const Options& opt) {
    DigitizeConfig cfg;
    if (!opt.config_path.empty()) { cfg = DigitizeConfig::LoadFromJson(opt.config_path); }
    if (opt.distance_set) { cfg.peaks.distance_min = opt.distance; }
    if (opt.prom_set) { cfg.peaks.prominence_factor = opt.prominence; }
    if (opt.height_set) { cfg.peaks.height_factor = opt.height; }
    if (opt.thresh_set) { cfg.landmark.intensity_threshold = opt.threshold; }
    if (opt.width_set) { cfg.preprocess.target_width = opt.target_width; }
    if (opt.upscale_set) { cfg.preprocess.upscale_factor = opt.upscale; }
    if (opt.floor_set) { cfg.preprocess.brightness_threshold = static_cast<uint8_t>(opt.floor); }
    cfg.Validate();
    return cfg;
}

std::optional<double> PromptValue(const std::string& question) {
    for (;;) {
        std::cout << question << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) { return std::nullopt; }
        double value = 0.0;
        if (ParseDouble(line.c_str(), value)) { return value; }
        std::cout << "Not a number: " << line << "\n";
    }
}

std::optional<AxisScale> PromptScale(const std::string& name, const DigitizeResult& result) {
    std::cout << name << ": " << result.landmarks.size() << " cycle(s) located\n";
    std::optional<double> bottom =
        PromptValue("Enter the Y-axis value at the bottom of the image [" + name + "]: ");
    if (!bottom) { return std::nullopt; }
    std::optional<double> top =
        PromptValue("Enter the Y-axis value at the top of the image [" + name + "]: ");
    if (!top) { return std::nullopt; }

    AxisScale scale;
    scale.y_bottom = *bottom;
    scale.y_top    = *top;
    return scale;
}

} // namespace

int main(int argc, char** argv) {
    Options opt;
    bool exit_ok = false;
    if (!ParseArgs(argc, argv, opt, exit_ok)) { return exit_ok ? 0 : 1; }

    InitLogging(ParseLogLevel(opt.log_level));

    DigitizeConfig cfg;
    try {
        cfg = BuildConfig(opt);
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    if (!opt.save_config_path.empty()) {
        try {
            cfg.SaveToJson(opt.save_config_path);
        } catch (const std::exception& e) {
            spdlog::error("Failed to save configuration: {}", e.what());
            return 1;
        }
        return 0;
    }

    if (opt.inputs.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    std::vector<std::string> images;
    try {
        images = opt.extensions.empty() ? ResolveImagePaths(opt.inputs)
                                        : ResolveImagePaths(opt.inputs, opt.extensions);
    } catch (const std::exception& e) {
        spdlog::error("Failed to collect images: {}", e.what());
        return 1;
    }
    spdlog::info("Found {} image(s)", images.size());

    int processed = 0;
    int skipped   = 0;
    int failed    = 0;
    for (const std::string& image_path : images) {
        spdlog::info("Processing: {}", std::filesystem::path(image_path).filename().string());
        try {
            DigitizeRequest req;
            req.image_path  = image_path;
            req.config      = cfg;
            req.output_dir  = opt.out_dir;
            req.write_json  = opt.write_json;
            req.generate_annotation = opt.annotate;

            if (opt.use_sidecar) {
                const std::string sidecar_path = SidecarPath(image_path);
                if (std::filesystem::is_regular_file(sidecar_path)) {
                    ImageSidecar sidecar = LoadSidecar(sidecar_path);
                    if (sidecar.roi) { req.roi = *sidecar.roi; }
                    if (sidecar.scale) { req.scale = sidecar.scale; }
                    spdlog::debug("Sidecar applied: {}", sidecar_path);
                }
            }
            if (opt.roi) { req.roi = *opt.roi; }
            if (opt.y_bottom_set) { req.scale = AxisScale{opt.y_bottom, opt.y_top}; }
            if (opt.prompt) { req.scale.reset(); }
            if (!req.scale) { req.scale_provider = PromptScale; }

            DigitizeOutcome outcome = ProcessImage(req);
            if (outcome.Skipped()) {
                ++skipped;
                continue;
            }
            ++processed;
            for (const std::string& path : outcome.written_files) {
                spdlog::info("  wrote {}", path);
            }
        } catch (const std::exception& e) {
            ++failed;
            spdlog::error("Failed: {}: {}", image_path, e.what());
        }
    }

    spdlog::info("All images processed: ok={}, skipped={}, failed={}", processed, skipped, failed);
    return failed > 0 ? 2 : 0;
}
