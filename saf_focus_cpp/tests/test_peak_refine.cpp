#include "saf_focus/core/errors.hpp"
#include "saf_focus/core/utils.hpp"
#include "saf_focus/focus/peak_refine.hpp"

#include <cmath>
#include <functional>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace saf_focus;

namespace {

std::vector<ScanSample> sample_curve(const std::function<double(double)> &f,
                                     int n = kNumScanPlanes) {
  std::vector<ScanSample> out;
  for (double z : core::linspace(-1500.0, 1500.0, n)) {
    out.push_back({z, f(z)});
  }
  return out;
}

} // namespace

TEST_CASE("exact_parabola_vertex_is_recovered") {
  auto samples =
      sample_curve([](double z) { return 1.0 - 1e-6 * (z - 37.0) * (z - 37.0); });
  PeakFit fit = focus::refine_peak(samples);

  REQUIRE(fit.peak_index == 51);
  REQUIRE(fit.window_center == 51);
  REQUIRE(fit.z_opt == Catch::Approx(37.0).margin(1e-6));
  REQUIRE(fit.max_strehl == Catch::Approx(1.0).epsilon(1e-12));
  REQUIRE(fit.a == Catch::Approx(-1e-6));
  REQUIRE(fit.b == Catch::Approx(2.0 * 37e-6));
  REQUIRE(fit.c == Catch::Approx(1.0 - 1e-6 * 37.0 * 37.0));
}

TEST_CASE("window_is_clamped_at_scan_edges") {
  auto rising =
      sample_curve([](double z) { return 1.0 - 1e-7 * (z - 2000.0) * (z - 2000.0); });
  PeakFit hi = focus::refine_peak(rising);
  REQUIRE(hi.peak_index == 100);
  REQUIRE(hi.window_center == 97);
  REQUIRE(hi.z_opt == Catch::Approx(2000.0).epsilon(1e-6));

  auto falling =
      sample_curve([](double z) { return 1.0 - 1e-7 * (z + 2000.0) * (z + 2000.0); });
  PeakFit lo = focus::refine_peak(falling);
  REQUIRE(lo.peak_index == 0);
  REQUIRE(lo.window_center == 2);
  REQUIRE(lo.z_opt == Catch::Approx(-2000.0).epsilon(1e-6));
}

TEST_CASE("clamp_keeps_last_sample_out_of_window") {
  REQUIRE(focus::clamp_window_center(0, 101) == 2);
  REQUIRE(focus::clamp_window_center(1, 101) == 2);
  REQUIRE(focus::clamp_window_center(50, 101) == 50);
  REQUIRE(focus::clamp_window_center(97, 101) == 97);
  REQUIRE(focus::clamp_window_center(98, 101) == 97);
  REQUIRE(focus::clamp_window_center(100, 101) == 97);
}

TEST_CASE("first_maximum_wins_on_ties") {
  auto plateau = sample_curve([](double z) {
    return std::fabs(z) <= 60.0 ? 1.0 : 1.0 - 1e-6 * z * z;
  });
  PeakFit fit = focus::refine_peak(plateau);
  REQUIRE(fit.peak_index == 48);
}

TEST_CASE("flat_curve_is_a_degenerate_fit") {
  auto flat = sample_curve([](double) { return 0.5; });
  REQUIRE_THROWS_AS(focus::refine_peak(flat), DegenerateFitError);

  auto linear = sample_curve([](double z) { return 0.5 + 1e-4 * z; });
  REQUIRE_THROWS_AS(focus::refine_peak(linear), DegenerateFitError);
}

TEST_CASE("too_few_samples_are_rejected") {
  auto short_scan = sample_curve([](double z) { return -z * z; }, 5);
  REQUIRE_THROWS_AS(focus::refine_peak(short_scan), InvalidParameterError);
}

TEST_CASE("wrms_follows_log_strehl") {
  const double lambda = 680.0;
  REQUIRE(focus::wrms_from_strehl(1.0, lambda) == Catch::Approx(0.0).margin(1e-12));
  REQUIRE(focus::wrms_from_strehl(std::exp(-1.0), lambda) ==
          Catch::Approx(lambda / (2.0 * 3.14159265358979323846)));
  REQUIRE(focus::wrms_from_strehl(1.02, lambda) < 0.0);

  REQUIRE_THROWS_AS(focus::wrms_from_strehl(0.0, lambda), DegenerateFitError);
  REQUIRE_THROWS_AS(focus::wrms_from_strehl(-0.3, lambda), DegenerateFitError);
}
