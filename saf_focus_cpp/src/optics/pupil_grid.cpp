#include "saf_focus/optics/pupil_grid.hpp"
#include "saf_focus/core/errors.hpp"

#include <string>

namespace saf_focus::optics {

namespace {
constexpr double kPupilRadius = 1.0;
} // namespace

std::vector<double> pupil_axis(int npupil) {
  std::vector<double> axis;
  if (npupil < 1)
    return axis;

  const double step = 2.0 * kPupilRadius / static_cast<double>(npupil);
  axis.reserve(static_cast<size_t>(npupil));
  for (int k = 0; k < npupil; ++k) {
    axis.push_back(-kPupilRadius + 0.5 * step + step * static_cast<double>(k));
  }
  return axis;
}

PupilGrid build_pupil_grid(int npupil) {
  if (npupil < 1) {
    throw InvalidParameterError("Npupil must be >= 1, got " +
                                std::to_string(npupil));
  }

  PupilGrid grid;
  grid.size = npupil;
  grid.step = 2.0 * kPupilRadius / static_cast<double>(npupil);
  grid.X.resize(npupil, npupil);
  grid.Y.resize(npupil, npupil);
  grid.aperture_mask.resize(npupil, npupil);

  const std::vector<double> axis = pupil_axis(npupil);
  for (int i = 0; i < npupil; ++i) {
    for (int j = 0; j < npupil; ++j) {
      const double x = axis[static_cast<size_t>(i)];
      const double y = axis[static_cast<size_t>(j)];
      grid.X(i, j) = x;
      grid.Y(i, j) = y;
      grid.aperture_mask(i, j) = (x * x + y * y < 1.0) ? 1.0 : 0.0;
    }
  }
  return grid;
}

} // namespace saf_focus::optics
