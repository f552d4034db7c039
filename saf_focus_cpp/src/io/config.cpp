#include "saf_focus/config/configuration.hpp"
#include "saf_focus/core/errors.hpp"
#include "saf_focus/focus/saf_focus.hpp"

#include <fstream>

namespace saf_focus::config {

static void read_double_pair(const YAML::Node& n, const char* key, std::array<double, 2>& out) {
    if (!n) return;
    if (!n.IsSequence() || n.size() != 2) {
        throw ConfigError(std::string(key) + " must be a sequence of two numbers");
    }
    out[0] = n[0].as<double>();
    out[1] = n[1].as<double>();
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
        if (node["optics"]) {
            auto o = node["optics"];
            if (o["na"]) cfg.optics.na = o["na"].as<double>();
            if (o["refmed"]) cfg.optics.refmed = o["refmed"].as<double>();
            if (o["refcov"]) cfg.optics.refcov = o["refcov"].as<double>();
            if (o["refimm"]) cfg.optics.refimm = o["refimm"].as<double>();
            if (o["refimmnom"]) cfg.optics.refimmnom = o["refimmnom"].as<double>();
            if (o["lambda"]) cfg.optics.lambda = o["lambda"].as<double>();
        }

        if (node["sampling"]) {
            auto s = node["sampling"];
            if (s["npupil"]) cfg.sampling.npupil = s["npupil"].as<int>();
        }

        if (node["geometry"]) {
            auto g = node["geometry"];
            if (g["fwd"]) cfg.geometry.fwd = g["fwd"].as<double>();
            if (g["depth"]) cfg.geometry.depth = g["depth"].as<double>();
            read_double_pair(g["zspread"], "geometry.zspread", cfg.geometry.zspread);
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
            if (r["debug"]) cfg.runtime.debug = r["debug"].as<bool>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["curve_artifact"]) cfg.output.curve_artifact = o["curve_artifact"].as<std::string>();
            if (o["events"]) cfg.output.events = o["events"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["optics"]["na"] = optics.na;
    node["optics"]["refmed"] = optics.refmed;
    node["optics"]["refcov"] = optics.refcov;
    node["optics"]["refimm"] = optics.refimm;
    node["optics"]["refimmnom"] = optics.refimmnom;
    node["optics"]["lambda"] = optics.lambda;

    node["sampling"]["npupil"] = sampling.npupil;

    node["geometry"]["fwd"] = geometry.fwd;
    node["geometry"]["depth"] = geometry.depth;
    node["geometry"]["zspread"].push_back(geometry.zspread[0]);
    node["geometry"]["zspread"].push_back(geometry.zspread[1]);

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["debug"] = runtime.debug;

    node["output"]["curve_artifact"] = output.curve_artifact;
    node["output"]["events"] = output.events;

    return node;
}

void Config::validate() const {
    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 256) {
        throw InvalidParameterError("runtime.parallel_workers must be in [1,256]");
    }
    focus::validate_parameters(optical_parameters());
}

OpticalParameters Config::optical_parameters() const {
    OpticalParameters p;
    p.NA = optics.na;
    p.refmed = optics.refmed;
    p.refcov = optics.refcov;
    p.refimm = optics.refimm;
    p.refimmnom = optics.refimmnom;
    p.lambda = optics.lambda;
    p.Npupil = sampling.npupil;
    p.fwd = geometry.fwd;
    p.depth = geometry.depth;
    p.zspread = geometry.zspread;
    p.debugmode = runtime.debug;
    return p;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "optics": {
      "type": "object",
      "properties": {
        "na": {"type": "number", "exclusiveMinimum": 0},
        "refmed": {"type": "number", "exclusiveMinimum": 0},
        "refcov": {"type": "number", "exclusiveMinimum": 0},
        "refimm": {"type": "number", "exclusiveMinimum": 0},
        "refimmnom": {"type": "number", "exclusiveMinimum": 0},
        "lambda": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "sampling": {
      "type": "object",
      "properties": {
        "npupil": {"type": "integer", "minimum": 1}
      }
    },
    "geometry": {
      "type": "object",
      "properties": {
        "fwd": {"type": "number"},
        "depth": {"type": "number", "minimum": 0},
        "zspread": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 256},
        "debug": {"type": "boolean"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "curve_artifact": {"type": "string"},
        "events": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace saf_focus::config
