#pragma once

#include "saf_focus/core/types.hpp"

namespace saf_focus::optics {

// Pixel-centred Npupil x Npupil sampling of [-1,1]^2 with the unit-disk mask.
// Throws InvalidParameterError for npupil < 1.
PupilGrid build_pupil_grid(int npupil);

// Sample coordinates along one axis: -1 + step/2 + k*step, step = 2/npupil.
std::vector<double> pupil_axis(int npupil);

} // namespace saf_focus::optics
