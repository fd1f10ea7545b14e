#include "tracedigit/logging.h"
#include "tracedigit/encoding.h"
#include "tracedigit/synthetic.h"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

using namespace TraceDigit;

namespace {

void PrintUsage(const char* exe) {
    std::printf("Usage: %s [--out trace.png] [--width N] [--height N] [--centers 100,250,...]\n"
                "          [--amplitude ROWS] [--sigma COLS] [--baseline ROWS] [--line N]\n"
                "Defaults: --out synthetic_trace.png --width 650 --height 400\n"
                "          --centers 100,250,400,550 --amplitude 300 --sigma 15 --baseline 20\n"
                "          --line draws a trace of the given thickness instead of a filled area\n",
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

bool ParseCenters(const char* s, std::vector<int>& out) {
    if (!s) { return false; }
    std::vector<int> centers;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        int c = 0;
        if (!ParseInt(item.c_str(), c)) { return false; }
        centers.push_back(c);
    }
    if (centers.empty()) { return false; }
    out = centers;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    SyntheticTraceSpec spec;
    std::string out_path  = "synthetic_trace.png";
    std::string log_level = "info";

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--out" && i + 1 < argc) {
            out_path = argv[i + 1];
            i++;
            continue;
        }
        if (arg == "--width" && i + 1 < argc) {
            if (!ParseInt(argv[i + 1], spec.width) || spec.width <= 0) {
                std::fprintf(stderr, "Invalid --width value\n");
                return 1;
            }
            i++;
            continue;
        }
        if (arg == "--height" && i + 1 < argc) {
            if (!ParseInt(argv[i + 1], spec.height) || spec.height <= 0) {
                std::fprintf(stderr, "Invalid --height value\n");
                return 1;
            }
            i++;
            continue;
        }
        if (arg == "--centers" && i + 1 < argc) {
            if (!ParseCenters(argv[i + 1], spec.centers)) {
                std::fprintf(stderr, "Invalid --centers value\n");
                return 1;
            }
            i++;
            continue;
        }
        if (arg == "--amplitude" && i + 1 < argc) {
            if (!ParseDouble(argv[i + 1], spec.amplitude_rows)) {
                std::fprintf(stderr, "Invalid --amplitude value\n");
                return 1;
            }
            i++;
            continue;
        }
        if (arg == "--sigma" && i + 1 < argc) {
            if (!ParseDouble(argv[i + 1], spec.sigma_cols) || spec.sigma_cols <= 0.0) {
                std::fprintf(stderr, "Invalid --sigma value\n");
                return 1;
            }
            i++;
            continue;
        }
        if (arg == "--baseline" && i + 1 < argc) {
            if (!ParseDouble(argv[i + 1], spec.baseline_rows)) {
                std::fprintf(stderr, "Invalid --baseline value\n");
                return 1;
            }
            i++;
            continue;
        }
        if (arg == "--line" && i + 1 < argc) {
            if (!ParseInt(argv[i + 1], spec.thickness) || spec.thickness <= 0) {
                std::fprintf(stderr, "Invalid --line value\n");
                return 1;
            }
            spec.filled = false;
            i++;
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[i + 1];
            i++;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
        std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
        PrintUsage(argv[0]);
        return 1;
    }

    InitLogging(ParseLogLevel(log_level));

    try {
        cv::Mat img = RenderSyntheticTrace(spec);
        SaveImage(img, out_path);
        spdlog::info("Saved synthetic trace ({}x{}, {} cycle(s)) to {}", spec.width, spec.height,
                     spec.centers.size(), out_path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to generate trace: {}", e.what());
        return 1;
    }
    return 0;
}
