#pragma once

#include "saf_focus/core/types.hpp"

#include <functional>

namespace saf_focus::focus {

// Called after each scanned offset with (completed, total). May be invoked
// from worker threads; the callee synchronises.
using ScanProgressFn = std::function<void(int, int)>;

// First-order stage estimate fwd - 1.25 * refimm/refmed * depth.
double stage_baseline(const OpticalParameters &params);

// kNumScanPlanes offsets evenly spread over 1.5 * [zspread[0], zspread[1]].
std::vector<double> scan_offsets(const OpticalParameters &params);

// Strehl ratio with the stage at baseline + z_offset.
double strehl_at_offset(const PupilGrid &grid, const InterfaceOptics &stack,
                        const VectorialField &field,
                        const OpticalParameters &params, double z_offset);

// Evaluates all offsets, in order, on up to `workers` threads.
StrehlScan run_strehl_scan(const PupilGrid &grid, const InterfaceOptics &stack,
                           const VectorialField &field,
                           const OpticalParameters &params, int workers = 1,
                           const ScanProgressFn &progress = {});

} // namespace saf_focus::focus
