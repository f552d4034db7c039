#pragma once

#include "saf_focus/core/types.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace saf_focus::config {

namespace fs = std::filesystem;

struct OpticsConfig {
  double na = 1.49;
  double refmed = 1.33;
  double refcov = 1.52;
  double refimm = 1.51;
  double refimmnom = 1.51;
  double lambda = 680.0; // nm
};

struct SamplingConfig {
  int npupil = 64;
};

struct GeometryConfig {
  double fwd = 150000.0; // nm
  double depth = 0.0;    // nm below the coverslip
  std::array<double, 2> zspread{-1000.0, 1000.0};
};

struct RuntimeConfig {
  int parallel_workers = 4;
  bool debug = false;
};

struct OutputConfig {
  std::string curve_artifact; // empty = no Strehl curve artifact
  bool events = false;        // JSON-lines events on the log stream
};

struct Config {
  OpticsConfig optics;
  SamplingConfig sampling;
  GeometryConfig geometry;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  OpticalParameters optical_parameters() const;
};

std::string get_schema_json();

} // namespace saf_focus::config
