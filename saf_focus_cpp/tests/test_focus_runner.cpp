#include "saf_focus/core/errors.hpp"
#include "saf_focus/core/utils.hpp"
#include "saf_focus/focus/saf_focus.hpp"
#include "saf_focus/pipeline/focus_runner.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace saf_focus;
using pipeline::json;

namespace {

config::Config small_config() {
  config::Config cfg;
  cfg.optics.na = 1.25;
  cfg.sampling.npupil = 16;
  cfg.geometry.depth = 2000.0;
  cfg.runtime.parallel_workers = 2;
  return cfg;
}

std::vector<json> parse_lines(const std::string &text) {
  std::vector<json> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty())
      out.push_back(json::parse(line));
  }
  return out;
}

} // namespace

TEST_CASE("debug_report_uses_fixed_units") {
  OpticalParameters p;
  FocusResult r;
  r.zvals = {143601.474, 150000.0, -5000.0};
  r.wrms = 38.716;

  const std::string report = pipeline::format_debug_report(p, r);
  REQUIRE(report.find("image plane depth from cover slip = 5000 nm\n") !=
          std::string::npos);
  REQUIRE(report.find("free working distance = 150.000 mu\n") != std::string::npos);
  REQUIRE(report.find("nominal z-stage position = 143.601 mu\n") !=
          std::string::npos);
  REQUIRE(report.find("rms aberration due to RI mismatch = 56.9 mlambda\n") !=
          std::string::npos);
}

TEST_CASE("runner_matches_direct_computation") {
  config::Config cfg = small_config();
  pipeline::FocusRunner runner(cfg);
  std::ostringstream log;
  FocusResult via_runner = runner.run("run_direct", log);
  FocusResult direct = focus::compute_saf_focus(cfg.optical_parameters());

  REQUIRE(log.str().empty());
  REQUIRE(via_runner.zvals[0] == Catch::Approx(direct.zvals[0]));
  REQUIRE(via_runner.wrms == Catch::Approx(direct.wrms));
  REQUIRE(via_runner.fit.peak_index == direct.fit.peak_index);
}

TEST_CASE("runner_emits_event_stream") {
  config::Config cfg = small_config();
  cfg.output.events = true;
  pipeline::FocusRunner runner(cfg);

  std::ostringstream log;
  FocusResult r = runner.run("run_events", log, {{"config_path", "inline"}});
  auto events = parse_lines(log.str());

  REQUIRE(events.size() > 2);
  REQUIRE(events.front()["type"] == "run_start");
  REQUIRE(events.front()["config_path"] == "inline");
  REQUIRE(events.front()["params"]["Npupil"] == 16);
  REQUIRE(events.back()["type"] == "run_end");
  REQUIRE(events.back()["success"] == true);

  int progress = 0;
  std::vector<std::string> phases_done;
  for (const auto &ev : events) {
    REQUIRE(ev["run_id"] == "run_events");
    if (ev["type"] == "phase_progress")
      ++progress;
    if (ev["type"] == "phase_end")
      phases_done.push_back(ev["phase_name"].get<std::string>());
  }
  REQUIRE(progress == kNumScanPlanes);
  const std::vector<std::string> expected{"PUPIL_GRID",  "INTERFACE_OPTICS",
                                          "VECTORIAL_FIELD", "STREHL_SCAN",
                                          "PEAK_REFINE", "DONE"};
  REQUIRE(phases_done == expected);

  const json &done = events[events.size() - 2];
  REQUIRE(done["stage_position"].get<double>() == Catch::Approx(r.zvals[0]));
  REQUIRE(done["image_plane"].get<double>() == Catch::Approx(-2000.0));
}

TEST_CASE("runner_reports_failure_and_rethrows") {
  config::Config cfg = small_config();
  cfg.output.events = true;
  cfg.optics.lambda = -1.0;
  pipeline::FocusRunner runner(cfg);

  std::ostringstream log;
  REQUIRE_THROWS_AS(runner.run("run_bad", log), InvalidParameterError);

  auto events = parse_lines(log.str());
  REQUIRE(events.size() >= 3);
  REQUIRE(events[events.size() - 2]["type"] == "error");
  REQUIRE(events.back()["type"] == "run_end");
  REQUIRE(events.back()["success"] == false);
}

TEST_CASE("debug_run_writes_report_and_curve") {
  fs::path dir = fs::temp_directory_path() / "saf_focus_test_runner";
  fs::remove_all(dir);

  config::Config cfg = small_config();
  cfg.runtime.debug = true;
  cfg.output.curve_artifact = (dir / "curve.json").string();
  pipeline::FocusRunner runner(cfg);

  std::ostringstream log;
  FocusResult r = runner.run("run_debug", log);

  REQUIRE(log.str().find("nominal z-stage position") != std::string::npos);
  REQUIRE(fs::exists(dir / "curve.json"));

  json curve = json::parse(core::read_text(dir / "curve.json"));
  REQUIRE(curve["stage_position"].size() == static_cast<size_t>(kNumScanPlanes));
  REQUIRE(curve["strehl"].size() == static_cast<size_t>(kNumScanPlanes));
  REQUIRE(curve["x_label"] == "Stage position");
  REQUIRE(curve["fit"]["z_opt"].get<double>() == Catch::Approx(r.fit.z_opt));

  // Positions are relative to fwd
  const double shift = r.scan.baseline - cfg.geometry.fwd;
  REQUIRE(curve["stage_position"][0].get<double>() ==
          Catch::Approx(r.scan.samples.front().z_offset + shift));

  fs::remove_all(dir);
}

TEST_CASE("result_json_carries_zvals") {
  FocusResult r;
  r.zvals = {149000.0, 150000.0, -800.0};
  r.wrms = 12.5;
  r.fit.max_strehl = 0.9;
  r.strehl_norm = 3.0;
  json j = pipeline::focus_result_to_json(r);
  REQUIRE(j["zvals"].size() == 3);
  REQUIRE(j["zvals"][0] == 149000.0);
  REQUIRE(j["free_working_distance"] == 150000.0);
  REQUIRE(j["wrms"] == 12.5);
  REQUIRE(j["max_strehl"] == 0.9);
}
