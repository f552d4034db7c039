#pragma once

#include "saf_focus/core/types.hpp"

namespace saf_focus::optics {

// Polarization vector, aplanatic amplitude and the aberration-free peak
// intensity used to normalise the Strehl ratio.
// Throws InvalidParameterError if the normalisation is not finite and
// positive (e.g. a pupil sample lying exactly on the critical angle).
VectorialField assemble_vectorial_field(const PupilGrid &grid,
                                        const InterfaceOptics &optics,
                                        const OpticalParameters &params);

// Sum over the two polarizations and three field components of
// |sum_pupil amplitude * phasor * PV[itel][jtel]|^2, restricted to the
// aperture. A null phasor means zero path difference.
double focal_peak_intensity(const VectorialField &field,
                            const Matrix2Dd &aperture_mask,
                            const Matrix2Dcd *phasor = nullptr);

} // namespace saf_focus::optics
