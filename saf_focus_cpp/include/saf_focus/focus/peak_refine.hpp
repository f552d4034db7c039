#pragma once

#include "saf_focus/core/types.hpp"

#include <vector>

namespace saf_focus::focus {

// Points on each side of the window centre used by the quadratic fit
constexpr int kFitHalfWidth = 2;

// Clamps a discrete peak index so the 5-point window stays inside a scan of
// n samples. The upper bound mirrors the one-based [3, n-3] clamp, i.e. the
// last sample never becomes part of the window.
int clamp_window_center(int peak_index, int n);

// Least-squares parabola through the window around the scan maximum and its
// vertex. Throws DegenerateFitError if the leading coefficient vanishes or
// the fit is not finite, InvalidParameterError if the scan has fewer than
// 2 * kFitHalfWidth + 2 samples.
PeakFit refine_peak(const std::vector<ScanSample> &samples);

// RMS wavefront error lambda/(2 pi) * ln(1/S). Negative for S > 1.
double wrms_from_strehl(double max_strehl, double lambda);

} // namespace saf_focus::focus
