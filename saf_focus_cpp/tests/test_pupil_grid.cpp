#include "saf_focus/core/errors.hpp"
#include "saf_focus/optics/pupil_grid.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using saf_focus::optics::build_pupil_grid;

TEST_CASE("pupil_samples_sit_on_pixel_centres") {
  auto grid = build_pupil_grid(4);
  REQUIRE(grid.size == 4);
  REQUIRE(grid.step == Catch::Approx(0.5));

  const double expected[4] = {-0.75, -0.25, 0.25, 0.75};
  for (int i = 0; i < 4; ++i) {
    for (int j = 0; j < 4; ++j) {
      REQUIRE(grid.X(i, j) == Catch::Approx(expected[i]));
      REQUIRE(grid.Y(i, j) == Catch::Approx(expected[j]));
    }
  }
}

TEST_CASE("aperture_mask_excludes_corners") {
  auto grid = build_pupil_grid(4);
  // r^2 = 0.75^2 + 0.75^2 = 1.125 at the four corners
  REQUIRE(grid.aperture_mask(0, 0) == 0.0);
  REQUIRE(grid.aperture_mask(3, 3) == 0.0);
  REQUIRE(grid.aperture_mask(0, 3) == 0.0);
  REQUIRE(grid.aperture_mask(1, 1) == 1.0);
  REQUIRE(grid.aperture_mask.sum() == Catch::Approx(12.0));
}

TEST_CASE("aperture_fill_factor_approaches_pi_over_four") {
  auto grid = build_pupil_grid(128);
  const double fill = grid.aperture_mask.sum() / (128.0 * 128.0);
  REQUIRE(fill == Catch::Approx(3.14159265358979 / 4.0).epsilon(0.01));
}

TEST_CASE("single_sample_pupil_is_on_axis") {
  auto grid = build_pupil_grid(1);
  REQUIRE(grid.X(0, 0) == Catch::Approx(0.0).margin(1e-15));
  REQUIRE(grid.Y(0, 0) == Catch::Approx(0.0).margin(1e-15));
  REQUIRE(grid.aperture_mask(0, 0) == 1.0);
}

TEST_CASE("pupil_size_below_one_is_rejected") {
  REQUIRE_THROWS_AS(build_pupil_grid(0), saf_focus::InvalidParameterError);
  REQUIRE_THROWS_AS(build_pupil_grid(-3), saf_focus::InvalidParameterError);
}
