#include "particle_sizer/config/configuration.hpp"
#include "particle_sizer/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace particle_sizer::config {

static void read_rect(const YAML::Node& n, Rect& out) {
    if (!n) return;
    if (n.IsMap()) {
        if (n["x"]) out.x = n["x"].as<int>();
        if (n["y"]) out.y = n["y"].as<int>();
        if (n["width"]) out.width = n["width"].as<int>();
        if (n["height"]) out.height = n["height"].as<int>();
    } else if (n.IsSequence() && n.size() == 4) {
        out.x = n[0].as<int>();
        out.y = n[1].as<int>();
        out.width = n[2].as<int>();
        out.height = n[3].as<int>();
    } else {
        throw ConfigError("calibration.selection must be a map {x, y, width, height} or [x, y, width, height]");
    }
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

    try {
        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["mode"]) cfg.pipeline.mode = p["mode"].as<std::string>();
        }

        if (node["calibration"]) {
            auto c = node["calibration"];
            if (c["enabled"]) cfg.calibration.enabled = c["enabled"].as<bool>();
            read_rect(c["selection"], cfg.calibration.selection);
            if (c["physical_length"]) cfg.calibration.physical_length = c["physical_length"].as<double>();
            if (c["unit"]) cfg.calibration.unit = c["unit"].as<std::string>();
            if (c["pixel_size"]) cfg.calibration.pixel_size = c["pixel_size"].as<double>();
            if (c["use_fits_scale"]) cfg.calibration.use_fits_scale = c["use_fits_scale"].as<bool>();
        }

        if (node["threshold"]) {
            auto t = node["threshold"];
            if (t["level"]) cfg.threshold.level = t["level"].as<float>();
            if (t["seed_growing"]) cfg.threshold.seed_growing = t["seed_growing"].as<bool>();
        }

        if (node["markers"]) {
            auto m = node["markers"];
            if (m["quantile"]) cfg.markers.quantile = m["quantile"].as<double>();
        }

        if (node["border"]) {
            auto b = node["border"];
            if (b["width"]) cfg.border.width = b["width"].as<int>();
        }

        if (node["size_window"]) {
            auto s = node["size_window"];
            if (s["min"]) cfg.size_window.min = s["min"].as<double>();
            if (s["max"]) cfg.size_window.max = s["max"].as<double>();
            if (s["histogram_bins"]) cfg.size_window.histogram_bins = s["histogram_bins"].as<int>();
        }

        if (node["distance"]) {
            auto d = node["distance"];
            if (d["histogram_bins"]) cfg.distance.histogram_bins = d["histogram_bins"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["results_file"]) cfg.output.results_file = o["results_file"].as<std::string>();
            if (o["write_debug_images"]) cfg.output.write_debug_images = o["write_debug_images"].as<bool>();
            if (o["write_fits_artifacts"]) cfg.output.write_fits_artifacts = o["write_fits_artifacts"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
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

    node["pipeline"]["mode"] = pipeline.mode;

    node["calibration"]["enabled"] = calibration.enabled;
    node["calibration"]["selection"]["x"] = calibration.selection.x;
    node["calibration"]["selection"]["y"] = calibration.selection.y;
    node["calibration"]["selection"]["width"] = calibration.selection.width;
    node["calibration"]["selection"]["height"] = calibration.selection.height;
    node["calibration"]["physical_length"] = calibration.physical_length;
    node["calibration"]["unit"] = calibration.unit;
    node["calibration"]["pixel_size"] = calibration.pixel_size;
    node["calibration"]["use_fits_scale"] = calibration.use_fits_scale;

    node["threshold"]["level"] = threshold.level;
    node["threshold"]["seed_growing"] = threshold.seed_growing;

    node["markers"]["quantile"] = markers.quantile;

    node["border"]["width"] = border.width;

    node["size_window"]["min"] = size_window.min;
    node["size_window"]["max"] = size_window.max;
    node["size_window"]["histogram_bins"] = size_window.histogram_bins;

    node["distance"]["histogram_bins"] = distance.histogram_bins;

    node["output"]["results_file"] = output.results_file;
    node["output"]["write_debug_images"] = output.write_debug_images;
    node["output"]["write_fits_artifacts"] = output.write_fits_artifacts;

    return node;
}

void Config::validate() const {
    if (pipeline.mode != "production" && pipeline.mode != "test") {
        throw ValidationError("pipeline.mode must be 'production' or 'test'");
    }
    if (calibration.enabled) {
        if (calibration.selection.width < 1 || calibration.selection.height < 1) {
            throw ValidationError("calibration.selection width and height must be >= 1");
        }
        if (calibration.selection.x < 0 || calibration.selection.y < 0) {
            throw ValidationError("calibration.selection origin must be >= 0");
        }
        if (!(calibration.physical_length > 0.0) || !std::isfinite(calibration.physical_length)) {
            throw ValidationError("calibration.physical_length must be > 0");
        }
    } else if (!(calibration.pixel_size > 0.0) || !std::isfinite(calibration.pixel_size)) {
        throw ValidationError("calibration.pixel_size must be > 0");
    }
    if (calibration.unit.empty()) {
        throw ValidationError("calibration.unit must not be empty");
    }
    if (!(threshold.level >= 0.0f && threshold.level <= 1.0f)) {
        throw ValidationError("threshold.level must be in [0,1]");
    }
    if (!(markers.quantile >= 0.0 && markers.quantile <= 1.0)) {
        throw ValidationError("markers.quantile must be in [0,1]");
    }
    if (border.width < 0) {
        throw ValidationError("border.width must be >= 0");
    }
    if (!(size_window.min >= 0.0) || !std::isfinite(size_window.max) ||
        !(size_window.max > size_window.min)) {
        throw ValidationError("size_window must satisfy 0 <= min < max");
    }
    if (size_window.histogram_bins < 1) {
        throw ValidationError("size_window.histogram_bins must be >= 1");
    }
    if (distance.histogram_bins < 1) {
        throw ValidationError("distance.histogram_bins must be >= 1");
    }
    if (output.results_file.empty()) {
        throw ValidationError("output.results_file must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "pipeline": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["production", "test"]}
      }
    },
    "calibration": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "selection": {
          "type": "object",
          "properties": {
            "x": {"type": "integer", "minimum": 0},
            "y": {"type": "integer", "minimum": 0},
            "width": {"type": "integer", "minimum": 1},
            "height": {"type": "integer", "minimum": 1}
          }
        },
        "physical_length": {"type": "number", "exclusiveMinimum": 0},
        "unit": {"type": "string"},
        "pixel_size": {"type": "number", "exclusiveMinimum": 0},
        "use_fits_scale": {"type": "boolean"}
      }
    },
    "threshold": {
      "type": "object",
      "properties": {
        "level": {"type": "number", "minimum": 0, "maximum": 1},
        "seed_growing": {"type": "boolean"}
      }
    },
    "markers": {
      "type": "object",
      "properties": {
        "quantile": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "border": {
      "type": "object",
      "properties": {
        "width": {"type": "integer", "minimum": 0}
      }
    },
    "size_window": {
      "type": "object",
      "properties": {
        "min": {"type": "number", "minimum": 0},
        "max": {"type": "number"},
        "histogram_bins": {"type": "integer", "minimum": 1}
      }
    },
    "distance": {
      "type": "object",
      "properties": {
        "histogram_bins": {"type": "integer", "minimum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "results_file": {"type": "string"},
        "write_debug_images": {"type": "boolean"},
        "write_fits_artifacts": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace particle_sizer::config
