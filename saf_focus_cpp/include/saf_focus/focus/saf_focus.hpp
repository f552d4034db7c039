#pragma once

#include "saf_focus/core/types.hpp"
#include "saf_focus/focus/strehl_scan.hpp"

namespace saf_focus::focus {

// Throws InvalidParameterError naming the first violated condition:
// positive finite NA, indices and lambda; Npupil >= 1; finite fwd, depth and
// zspread with depth >= 0 and zspread[0] <= zspread[1]; NA below refcov,
// refimm and refimmnom so those media stay propagating inside the aperture.
void validate_parameters(const OpticalParameters &params);

// Refines the scan peak and fills zvals, Wrms and the diagnostics.
FocusResult finalize_focus(const OpticalParameters &params, double strehl_norm,
                           StrehlScan scan);

// Optimal stage position and RMS wavefront error under refractive-index
// mismatch. zvals = [stage position, fwd, -depth].
FocusResult compute_saf_focus(const OpticalParameters &params, int workers = 1,
                              const ScanProgressFn &progress = {});

} // namespace saf_focus::focus
