#pragma once

#include "saf_focus/core/types.hpp"

namespace saf_focus::optics {

// cos(theta) in the sample medium for arg = 1 - r^2 NA^2 / refmed^2.
// For arg < 0 (beyond the critical angle) the root is taken as
// sqrt(|arg|) * (cos(phi/2) - i sin(phi/2)) with phi = atan2(0, arg), which
// puts it on the negative imaginary axis. std::sqrt would return the
// conjugate.
complexd medium_cos_theta(double arg);

// cos(theta) for an index that stays propagating inside the aperture.
complexd propagating_cos_theta(double arg);

// Propagation cosines for the four index configurations and the P/S Fresnel
// transmission of the medium -> coverslip -> immersion stack.
InterfaceOptics compute_interface_optics(const PupilGrid &grid,
                                         const OpticalParameters &params);

} // namespace saf_focus::optics
