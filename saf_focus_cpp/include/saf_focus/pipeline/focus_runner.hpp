#pragma once

#include "saf_focus/config/configuration.hpp"
#include "saf_focus/core/types.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace saf_focus::pipeline {

using json = nlohmann::json;

// Human-readable summary printed in debug mode (depth in nm, distances in
// um, aberration in milliwavelengths).
std::string format_debug_report(const OpticalParameters &params,
                                const FocusResult &result);

// Strehl against stage position offset from fwd, plus the fit.
json strehl_curve_to_json(const OpticalParameters &params,
                          const FocusResult &result);

json focus_result_to_json(const FocusResult &result);

// Runs the five stages for one configuration. Events go to log_stream when
// output.events is set; the debug report and the curve artifact are only
// produced when runtime.debug is set. Neither changes the returned result.
class FocusRunner {
public:
  explicit FocusRunner(config::Config cfg);

  // run_info is merged into the run_start event. Errors are reported as an
  // error event and rethrown.
  FocusResult run(const std::string &run_id, std::ostream &log_stream,
                  const json &run_info = json::object()) const;

  const config::Config &config() const { return cfg_; }

private:
  config::Config cfg_;
};

} // namespace saf_focus::pipeline
