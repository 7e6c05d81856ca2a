#include "xrd_match/config/configuration.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/types.hpp"

#include <cmath>
#include <fstream>

namespace xrd_match::config {

static bool in_range(double v, double lo, double hi) {
    return std::isfinite(v) && v >= lo && v <= hi;
}

const std::vector<std::string>& default_symbol_pool() {
    static const std::vector<std::string> pool = {
        "①", "②", "③", "④", "⑤", "⑥", "⑦", "⑧", "⑨", "⑩",
        "⑪", "⑫", "⑬", "⑭", "⑮", "⑯", "⑰", "⑱", "⑲", "⑳"};
    return pool;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top-level YAML node must be a mapping");
    }

    try {
        if (node["detection"]) {
            auto d = node["detection"];
            if (d["height"]) cfg.detection.height = d["height"].as<double>();
            if (d["distance"]) cfg.detection.distance = d["distance"].as<int>();
            if (d["prominence"]) cfg.detection.prominence = d["prominence"].as<double>();
            if (d["width"]) cfg.detection.width = d["width"].as<double>();
            if (d["adaptive"]) {
                auto a = d["adaptive"];
                if (a["enabled"]) cfg.detection.adaptive.enabled = a["enabled"].as<bool>();
                if (a["sigma_factor"]) cfg.detection.adaptive.sigma_factor = a["sigma_factor"].as<double>();
                if (a["height_fraction"]) cfg.detection.adaptive.height_fraction = a["height_fraction"].as<double>();
                if (a["prominence_fraction"]) {
                    cfg.detection.adaptive.prominence_fraction = a["prominence_fraction"].as<double>();
                }
            }
        }

        if (node["matching"]) {
            auto m = node["matching"];
            if (m["tolerance"]) cfg.matching.tolerance = m["tolerance"].as<double>();
            if (m["policy"]) cfg.matching.policy = m["policy"].as<std::string>();
        }

        if (node["cleaning"]) {
            auto c = node["cleaning"];
            if (c["enabled"]) cfg.cleaning.enabled = c["enabled"].as<bool>();
            if (c["angle_min"]) cfg.cleaning.angle_min = c["angle_min"].as<double>();
            if (c["angle_max"]) cfg.cleaning.angle_max = c["angle_max"].as<double>();
            if (c["intensity_threshold"]) cfg.cleaning.intensity_threshold = c["intensity_threshold"].as<double>();
            if (c["smooth_window"]) cfg.cleaning.smooth_window = c["smooth_window"].as<int>();
        }

        if (node["reference"]) {
            auto r = node["reference"];
            if (r["format"]) cfg.reference.format = r["format"].as<std::string>();
            if (r["pattern"]) cfg.reference.pattern = r["pattern"].as<std::string>();
            if (r["symbols"] && r["symbols"].IsSequence()) {
                cfg.reference.symbols.clear();
                for (const auto& s : r["symbols"]) {
                    cfg.reference.symbols.push_back(s.as<std::string>());
                }
            }
            if (r["card_intensity_threshold"]) {
                cfg.reference.card_intensity_threshold = r["card_intensity_threshold"].as<double>();
            }
            if (r["card_symbol"]) cfg.reference.card_symbol = r["card_symbol"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["write_report"]) cfg.output.write_report = o["write_report"].as<bool>();
            if (o["write_matches_csv"]) cfg.output.write_matches_csv = o["write_matches_csv"].as<bool>();
            if (o["write_peaks_csv"]) cfg.output.write_peaks_csv = o["write_peaks_csv"].as<bool>();
        }

        // Flat keys as written by the desktop front-end; they override the sections.
        if (node["peak_height"]) cfg.detection.height = node["peak_height"].as<double>();
        if (node["peak_distance"]) cfg.detection.distance = node["peak_distance"].as<int>();
        if (node["peak_prominence"]) cfg.detection.prominence = node["peak_prominence"].as<double>();
        if (node["peak_width"]) cfg.detection.width = node["peak_width"].as<double>();
        if (node["match_tolerance"]) cfg.matching.tolerance = node["match_tolerance"].as<double>();
        if (node["angle_min"]) cfg.cleaning.angle_min = node["angle_min"].as<double>();
        if (node["angle_max"]) cfg.cleaning.angle_max = node["angle_max"].as<double>();
        if (node["intensity_threshold"]) cfg.cleaning.intensity_threshold = node["intensity_threshold"].as<double>();
        if (node["smooth_window"]) cfg.cleaning.smooth_window = node["smooth_window"].as<int>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["detection"]["height"] = detection.height;
    node["detection"]["distance"] = detection.distance;
    node["detection"]["prominence"] = detection.prominence;
    node["detection"]["width"] = detection.width;
    node["detection"]["adaptive"]["enabled"] = detection.adaptive.enabled;
    node["detection"]["adaptive"]["sigma_factor"] = detection.adaptive.sigma_factor;
    node["detection"]["adaptive"]["height_fraction"] = detection.adaptive.height_fraction;
    node["detection"]["adaptive"]["prominence_fraction"] = detection.adaptive.prominence_fraction;

    node["matching"]["tolerance"] = matching.tolerance;
    node["matching"]["policy"] = matching.policy;

    node["cleaning"]["enabled"] = cleaning.enabled;
    node["cleaning"]["angle_min"] = cleaning.angle_min;
    node["cleaning"]["angle_max"] = cleaning.angle_max;
    node["cleaning"]["intensity_threshold"] = cleaning.intensity_threshold;
    node["cleaning"]["smooth_window"] = cleaning.smooth_window;

    node["reference"]["format"] = reference.format;
    node["reference"]["pattern"] = reference.pattern;
    for (const auto& s : reference.symbols) {
        node["reference"]["symbols"].push_back(s);
    }
    node["reference"]["card_intensity_threshold"] = reference.card_intensity_threshold;
    node["reference"]["card_symbol"] = reference.card_symbol;

    node["output"]["write_report"] = output.write_report;
    node["output"]["write_matches_csv"] = output.write_matches_csv;
    node["output"]["write_peaks_csv"] = output.write_peaks_csv;

    return node;
}

std::vector<std::string> Config::symbol_pool() const {
    if (!reference.symbols.empty()) {
        return reference.symbols;
    }
    return default_symbol_pool();
}

void Config::validate() const {
    if (!in_range(detection.height, 0.0, 1.0e12)) {
        throw ValidationError("detection.height must be >= 0");
    }
    if (detection.distance < 1) {
        throw ValidationError("detection.distance must be >= 1");
    }
    if (!in_range(detection.prominence, 0.0, 1.0e12)) {
        throw ValidationError("detection.prominence must be >= 0");
    }
    if (!in_range(detection.width, 0.0, 1.0e6)) {
        throw ValidationError("detection.width must be >= 0");
    }
    if (!in_range(detection.adaptive.sigma_factor, 0.0, 100.0)) {
        throw ValidationError("detection.adaptive.sigma_factor must be in [0,100]");
    }
    if (!in_range(detection.adaptive.height_fraction, 0.0, 1.0)) {
        throw ValidationError("detection.adaptive.height_fraction must be in [0,1]");
    }
    if (!in_range(detection.adaptive.prominence_fraction, 0.0, 1.0)) {
        throw ValidationError("detection.adaptive.prominence_fraction must be in [0,1]");
    }

    if (!std::isfinite(matching.tolerance) || matching.tolerance <= 0.0) {
        throw ValidationError("matching.tolerance must be > 0");
    }
    if (!string_to_match_policy(matching.policy)) {
        throw ValidationError("matching.policy must be 'phase_first' or 'peak_first'");
    }

    if (!in_range(cleaning.angle_min, 0.0, 180.0) || !in_range(cleaning.angle_max, 0.0, 180.0)) {
        throw ValidationError("cleaning.angle_min/angle_max must be in [0,180]");
    }
    if (cleaning.angle_min >= cleaning.angle_max) {
        throw ValidationError("cleaning.angle_min must be < cleaning.angle_max");
    }
    if (!in_range(cleaning.intensity_threshold, 0.0, 1.0e12)) {
        throw ValidationError("cleaning.intensity_threshold must be >= 0");
    }
    if (cleaning.smooth_window < 1) {
        throw ValidationError("cleaning.smooth_window must be >= 1");
    }

    if (reference.format != "auto" && reference.format != "raw" && reference.format != "extracted") {
        throw ValidationError("reference.format must be 'auto', 'raw' or 'extracted'");
    }
    if (reference.pattern.empty()) {
        throw ValidationError("reference.pattern must not be empty");
    }
    for (const auto& s : reference.symbols) {
        if (s.empty()) {
            throw ValidationError("reference.symbols must not contain empty entries");
        }
    }
    if (!in_range(reference.card_intensity_threshold, 0.0, 1.0e12)) {
        throw ValidationError("reference.card_intensity_threshold must be >= 0");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "detection": {
      "type": "object",
      "properties": {
        "height": {"type": "number", "minimum": 0},
        "distance": {"type": "integer", "minimum": 1},
        "prominence": {"type": "number", "minimum": 0},
        "width": {"type": "number", "minimum": 0},
        "adaptive": {
          "type": "object",
          "properties": {
            "enabled": {"type": "boolean"},
            "sigma_factor": {"type": "number", "minimum": 0, "maximum": 100},
            "height_fraction": {"type": "number", "minimum": 0, "maximum": 1},
            "prominence_fraction": {"type": "number", "minimum": 0, "maximum": 1}
          }
        }
      }
    },
    "matching": {
      "type": "object",
      "properties": {
        "tolerance": {"type": "number", "exclusiveMinimum": 0},
        "policy": {"type": "string", "enum": ["phase_first", "peak_first"]}
      }
    },
    "cleaning": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "angle_min": {"type": "number", "minimum": 0, "maximum": 180},
        "angle_max": {"type": "number", "minimum": 0, "maximum": 180},
        "intensity_threshold": {"type": "number", "minimum": 0},
        "smooth_window": {"type": "integer", "minimum": 1}
      }
    },
    "reference": {
      "type": "object",
      "properties": {
        "format": {"type": "string", "enum": ["auto", "raw", "extracted"]},
        "pattern": {"type": "string"},
        "symbols": {"type": "array", "items": {"type": "string"}},
        "card_intensity_threshold": {"type": "number", "minimum": 0},
        "card_symbol": {"type": "string"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "write_report": {"type": "boolean"},
        "write_matches_csv": {"type": "boolean"},
        "write_peaks_csv": {"type": "boolean"}
      }
    },
    "peak_height": {"type": "number", "minimum": 0},
    "peak_distance": {"type": "integer", "minimum": 1},
    "peak_prominence": {"type": "number", "minimum": 0},
    "peak_width": {"type": "number", "minimum": 0},
    "match_tolerance": {"type": "number", "exclusiveMinimum": 0},
    "angle_min": {"type": "number", "minimum": 0, "maximum": 180},
    "angle_max": {"type": "number", "minimum": 0, "maximum": 180},
    "intensity_threshold": {"type": "number", "minimum": 0},
    "smooth_window": {"type": "integer", "minimum": 1}
  }
})";
}

} // namespace xrd_match::config
