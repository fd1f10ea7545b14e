#include "tracedigit/config.h"
#include "tracedigit/error.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <string>

namespace TraceDigit {

using nlohmann::json;

static ResizeMethod ParseResizeMethod(const json& j, const char* key, ResizeMethod fallback) {
    if (!j.contains(key)) { return fallback; }
    const auto& value = j.at(key);
    if (!value.is_string()) { throw FormatError(std::string(key) + " must be a string"); }
    return FromResizeMethodString(value.get<std::string>());
}

static const json& SectionOrEmpty(const json& j, const char* key) {
    static const json kEmpty = json::object();
    if (!j.contains(key)) { return kEmpty; }
    const auto& section = j.at(key);
    if (!section.is_object()) { throw FormatError(std::string(key) + " must be an object"); }
    return section;
}

static DigitizeConfig ConfigFromJson(const json& j) {
    if (!j.is_object()) { throw FormatError("config root must be an object"); }

    DigitizeConfig cfg;
    try {
        const json& peaks           = SectionOrEmpty(j, "peaks");
        cfg.peaks.distance_min      = peaks.value("distance_min", cfg.peaks.distance_min);
        cfg.peaks.prominence_factor = peaks.value("prominence_factor", cfg.peaks.prominence_factor);
        cfg.peaks.height_factor     = peaks.value("height_factor", cfg.peaks.height_factor);

        const json& landmark = SectionOrEmpty(j, "landmark");
        cfg.landmark.intensity_threshold =
            landmark.value("intensity_threshold", cfg.landmark.intensity_threshold);

        const json& pre = SectionOrEmpty(j, "preprocess");
        cfg.preprocess.target_width   = pre.value("target_width", cfg.preprocess.target_width);
        cfg.preprocess.upscale_factor = pre.value("upscale_factor", cfg.preprocess.upscale_factor);

        const int floor = pre.value("brightness_threshold",
                                    static_cast<int>(cfg.preprocess.brightness_threshold));
        if (floor < 0 || floor > 255) {
            throw ConfigError("brightness_threshold out of range: " + std::to_string(floor));
        }
        cfg.preprocess.brightness_threshold = static_cast<uint8_t>(floor);
        cfg.preprocess.resize_method =
            ParseResizeMethod(pre, "resize_method", cfg.preprocess.resize_method);
        cfg.preprocess.upscale_method =
            ParseResizeMethod(pre, "upscale_method", cfg.preprocess.upscale_method);
    } catch (const json::type_error& e) {
        throw FormatError(std::string("config value has wrong type: ") + e.what());
    }

    cfg.Validate();
    return cfg;
}

static json ConfigToJson(const DigitizeConfig& cfg) {
    json j;
    j["peaks"]["distance_min"]      = cfg.peaks.distance_min;
    j["peaks"]["prominence_factor"] = cfg.peaks.prominence_factor;
    j["peaks"]["height_factor"]     = cfg.peaks.height_factor;

    j["landmark"]["intensity_threshold"] = cfg.landmark.intensity_threshold;

    j["preprocess"]["target_width"]         = cfg.preprocess.target_width;
    j["preprocess"]["upscale_factor"]       = cfg.preprocess.upscale_factor;
    j["preprocess"]["brightness_threshold"] = cfg.preprocess.brightness_threshold;
    j["preprocess"]["resize_method"]        = ToResizeMethodString(cfg.preprocess.resize_method);
    j["preprocess"]["upscale_method"]       = ToResizeMethodString(cfg.preprocess.upscale_method);
    return j;
}

void DigitizeConfig::Validate() const {
    if (!std::isfinite(peaks.distance_min) || peaks.distance_min < 1.0) {
        throw ConfigError("peaks.distance_min must be >= 1");
    }
    if (!std::isfinite(peaks.prominence_factor) || peaks.prominence_factor < 0.0) {
        throw ConfigError("peaks.prominence_factor must be >= 0");
    }
    if (!std::isfinite(peaks.height_factor)) {
        throw ConfigError("peaks.height_factor must be finite");
    }
    if (landmark.intensity_threshold < 0 || landmark.intensity_threshold > 255) {
        throw ConfigError("landmark.intensity_threshold must be in [0, 255]");
    }
    if (preprocess.target_width < 0) {
        throw ConfigError("preprocess.target_width must be >= 0");
    }
    if (!std::isfinite(preprocess.upscale_factor) || preprocess.upscale_factor <= 0.0f) {
        throw ConfigError("preprocess.upscale_factor must be > 0");
    }
}

DigitizeConfig DigitizeConfig::LoadFromJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) { throw IOError("Failed to open file: " + path); }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw FormatError("Failed to parse config " + path + ": " + e.what());
    }
    DigitizeConfig cfg = ConfigFromJson(j);
    spdlog::info("Config loaded: distance_min={}, prominence_factor={}, height_factor={}, "
                 "intensity_threshold={}, path={}",
                 cfg.peaks.distance_min, cfg.peaks.prominence_factor, cfg.peaks.height_factor,
                 cfg.landmark.intensity_threshold, path);
    return cfg;
}

DigitizeConfig DigitizeConfig::FromJsonString(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("Failed to parse config: ") + e.what());
    }
    return ConfigFromJson(j);
}

void DigitizeConfig::SaveToJson(const std::string& path) const {
    json j = ConfigToJson(*this);
    std::ofstream out(path);
    if (!out.is_open()) { throw IOError("Failed to open file: " + path); }
    out << j.dump(4);
    if (!out.good()) { throw IOError("Failed to write json: " + path); }
    spdlog::info("Config saved: path={}", path);
}

std::string DigitizeConfig::ToJsonString() const { return ConfigToJson(*this).dump(4); }

} // namespace TraceDigit
