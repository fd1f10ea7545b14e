#include "tracedigit/report.h"
#include "tracedigit/error.h"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstddef>
#include <fstream>
#include <iterator>

namespace TraceDigit {

using nlohmann::json;

namespace {

std::string FormatNumber(double v) {
    if (std::isnan(v)) { return {}; }
    return fmt::format("{}", v);
}

json NumberOrNull(double v) {
    if (!std::isfinite(v)) { return nullptr; }
    return v;
}

} // namespace

std::string SamplesToCsv(const DigitizeResult& result) {
    std::string out;
    fmt::format_to(std::back_inserter(out),
                   "Cycle #,Y Position (pixels),Converted Y Position ({}-{} scale)\n",
                   result.scale.y_bottom, result.scale.y_top);
    for (const CycleSample& s : result.samples) {
        fmt::format_to(std::back_inserter(out), "{},{},{}\n", s.cycle, s.row,
                       FormatNumber(s.value));
    }
    return out;
}

std::string SummaryToCsv(const SummaryStats& summary) {
    std::string out = "Statistic,Value\n";
    out += "Mean," + FormatNumber(summary.mean) + "\n";
    out += "Std," + FormatNumber(summary.stddev) + "\n";
    return out;
}

std::string ResultToJsonString(const DigitizeResult& result, int indent) {
    json j;
    j["status"] = ToStatusString(result.status);
    j["width"]  = result.width;
    j["height"] = result.height;

    const PeakDetection& det          = result.detection;
    j["profile"]["mean"]              = det.profile_stats.mean;
    j["profile"]["stddev"]            = det.profile_stats.stddev;
    j["profile"]["min_height"]        = det.min_height;
    j["profile"]["min_prominence"]    = det.min_prominence;

    j["peaks"] = json::array();
    for (std::size_t i = 0; i < det.peaks.size(); ++i) {
        json p;
        p["column"]     = det.peaks[i];
        p["prominence"] = i < det.prominences.size() ? det.prominences[i] : 0.0;
        j["peaks"].push_back(p);
    }

    j["boundaries"] = result.boundaries;

    j["landmarks"] = json::array();
    for (const Landmark& lm : result.landmarks) {
        j["landmarks"].push_back(
            {{"region", lm.region_index}, {"column", lm.column}, {"row", lm.row}});
    }

    if (result.calibrated) {
        j["scale"]["y_bottom"]   = result.scale.y_bottom;
        j["scale"]["y_top"]      = result.scale.y_top;
        j["scale"]["degenerate"] = result.degenerate_scale;

        j["samples"] = json::array();
        for (const CycleSample& s : result.samples) {
            j["samples"].push_back({{"cycle", s.cycle},
                                    {"region", s.region_index},
                                    {"column", s.column},
                                    {"row", s.row},
                                    {"value", s.value}});
        }

        j["summary"]["count"]  = result.summary.count;
        j["summary"]["mean"]   = NumberOrNull(result.summary.mean);
        j["summary"]["stddev"] = NumberOrNull(result.summary.stddev);
    }
    return j.dump(indent);
}

void WriteTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) { throw IOError("Failed to open file: " + path); }
    out << content;
    if (!out.good()) { throw IOError("Failed to write file: " + path); }
    spdlog::debug("WriteTextFile: {} bytes -> {}", content.size(), path);
}

} // namespace TraceDigit
