#include "saf_focus/pipeline/focus_runner.hpp"
#include "saf_focus/core/errors.hpp"
#include "saf_focus/core/events.hpp"
#include "saf_focus/core/utils.hpp"
#include "saf_focus/focus/saf_focus.hpp"
#include "saf_focus/optics/interface_optics.hpp"
#include "saf_focus/optics/pupil_grid.hpp"
#include "saf_focus/optics/vectorial_field.hpp"

#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

namespace saf_focus::pipeline {

std::string format_debug_report(const OpticalParameters &params,
                                const FocusResult &result) {
  std::ostringstream oss;
  oss << std::fixed;
  oss << "image plane depth from cover slip = " << std::setw(4)
      << std::setprecision(0) << -result.zvals[2] << " nm\n";
  oss << "free working distance = " << std::setw(6) << std::setprecision(3)
      << 1.0e-3 * result.zvals[1] << " mu\n";
  oss << "nominal z-stage position = " << std::setw(6) << std::setprecision(3)
      << 1.0e-3 * result.zvals[0] << " mu\n";
  oss << "rms aberration due to RI mismatch = " << std::setw(4)
      << std::setprecision(1) << 1.0e3 * result.wrms / params.lambda
      << " mlambda\n";
  return oss.str();
}

json strehl_curve_to_json(const OpticalParameters &params,
                          const FocusResult &result) {
  // Stage positions relative to fwd, as plotted against the Strehl ratio
  const double shift = result.scan.baseline - params.fwd;

  json j;
  j["x_label"] = "Stage position";
  j["y_label"] = "Strehl";
  j["stage_position"] = json::array();
  j["strehl"] = json::array();
  for (const auto &s : result.scan.samples) {
    j["stage_position"].push_back(s.z_offset + shift);
    j["strehl"].push_back(s.strehl);
  }
  j["fit"] = {{"a", result.fit.a},
              {"b", result.fit.b},
              {"c", result.fit.c},
              {"peak_index", result.fit.peak_index},
              {"window_center", result.fit.window_center},
              {"z_opt", result.fit.z_opt},
              {"max_strehl", result.fit.max_strehl}};
  return j;
}

json focus_result_to_json(const FocusResult &result) {
  json j;
  j["zvals"] = {result.zvals[0], result.zvals[1], result.zvals[2]};
  j["stage_position"] = result.zvals[0];
  j["free_working_distance"] = result.zvals[1];
  j["image_plane"] = result.zvals[2];
  j["wrms"] = result.wrms;
  j["max_strehl"] = result.fit.max_strehl;
  j["strehl_norm"] = result.strehl_norm;
  return j;
}

FocusRunner::FocusRunner(config::Config cfg) : cfg_(std::move(cfg)) {}

FocusResult FocusRunner::run(const std::string &run_id,
                             std::ostream &log_stream,
                             const json &run_info) const {
  const OpticalParameters params = cfg_.optical_parameters();
  const bool events = cfg_.output.events;
  core::EventEmitter emitter;
  std::mutex log_mutex;

  if (events) {
    json extra = run_info;
    extra["params"] = {{"NA", params.NA},
                       {"refmed", params.refmed},
                       {"refcov", params.refcov},
                       {"refimm", params.refimm},
                       {"refimmnom", params.refimmnom},
                       {"lambda", params.lambda},
                       {"Npupil", params.Npupil},
                       {"fwd", params.fwd},
                       {"depth", params.depth},
                       {"zspread", {params.zspread[0], params.zspread[1]}}};
    emitter.run_start(run_id, extra, log_stream);
  }

  Phase current = Phase::PUPIL_GRID;
  auto start = [&](Phase phase) {
    current = phase;
    if (events)
      emitter.phase_start(run_id, phase, log_stream);
  };
  auto finish = [&](Phase phase, const json &extra) {
    if (events)
      emitter.phase_end(run_id, phase, "ok", extra, log_stream);
  };

  try {
    cfg_.validate();

    start(Phase::PUPIL_GRID);
    const PupilGrid grid = optics::build_pupil_grid(params.Npupil);
    finish(Phase::PUPIL_GRID, {{"npupil", grid.size},
                               {"step", grid.step},
                               {"aperture_samples", grid.aperture_mask.sum()}});

    start(Phase::INTERFACE_OPTICS);
    const InterfaceOptics stack = optics::compute_interface_optics(grid, params);
    int evanescent = 0;
    for (int i = 0; i < grid.size; ++i) {
      for (int j = 0; j < grid.size; ++j) {
        if (grid.aperture_mask(i, j) > 0.0 && stack.cos_med(i, j).imag() != 0.0)
          ++evanescent;
      }
    }
    finish(Phase::INTERFACE_OPTICS, {{"evanescent_samples", evanescent}});

    start(Phase::VECTORIAL_FIELD);
    const VectorialField field =
        optics::assemble_vectorial_field(grid, stack, params);
    finish(Phase::VECTORIAL_FIELD, {{"strehl_norm", field.strehl_norm}});

    start(Phase::STREHL_SCAN);
    focus::ScanProgressFn progress;
    if (events) {
      progress = [&](int done, int total) {
        std::lock_guard<std::mutex> lock(log_mutex);
        emitter.scan_progress(run_id, done, total, log_stream);
      };
    }
    StrehlScan scan = focus::run_strehl_scan(
        grid, stack, field, params, cfg_.runtime.parallel_workers, progress);
    finish(Phase::STREHL_SCAN,
           {{"n_planes", static_cast<int>(scan.samples.size())},
            {"baseline", scan.baseline}});

    start(Phase::PEAK_REFINE);
    FocusResult result =
        focus::finalize_focus(params, field.strehl_norm, std::move(scan));
    finish(Phase::PEAK_REFINE, {{"peak_index", result.fit.peak_index},
                                {"window_center", result.fit.window_center},
                                {"z_opt", result.fit.z_opt},
                                {"max_strehl", result.fit.max_strehl}});

    if (events && result.fit.peak_index != result.fit.window_center) {
      emitter.warning(run_id,
                      "Strehl maximum at the scan edge; widen geometry.zspread",
                      log_stream);
    }

    if (params.debugmode) {
      log_stream << format_debug_report(params, result);
      if (!cfg_.output.curve_artifact.empty()) {
        core::write_text(cfg_.output.curve_artifact,
                         strehl_curve_to_json(params, result).dump(2) + "\n");
        log_stream << "[debug] Strehl curve written to "
                   << cfg_.output.curve_artifact << "\n";
      }
    }

    if (events) {
      emitter.phase_end(run_id, Phase::DONE, "ok", focus_result_to_json(result),
                        log_stream);
      emitter.run_end(run_id, true, "ok", log_stream);
    }
    return result;
  } catch (const SafFocusError &e) {
    if (events) {
      emitter.error(run_id,
                    phase_to_string(current) + std::string(": ") + e.what(),
                    log_stream);
      emitter.run_end(run_id, false, "error", log_stream);
    }
    throw;
  }
}

} // namespace saf_focus::pipeline
