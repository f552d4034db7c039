#include "saf_focus/focus/peak_refine.hpp"
#include "saf_focus/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace saf_focus::focus {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;

// Curvature across the window below this fraction of the data is treated as
// a vanishing leading coefficient
constexpr double kDegenerateCurvature = 1.0e-12;
} // namespace

int clamp_window_center(int peak_index, int n) {
  const int lo = kFitHalfWidth;
  const int hi = n - kFitHalfWidth - 2;
  return std::max(lo, std::min(peak_index, hi));
}

PeakFit refine_peak(const std::vector<ScanSample> &samples) {
  const int n = static_cast<int>(samples.size());
  if (n < 2 * kFitHalfWidth + 2) {
    std::ostringstream oss;
    oss << "peak refinement needs at least " << (2 * kFitHalfWidth + 2)
        << " scan samples, got " << n;
    throw InvalidParameterError(oss.str());
  }

  PeakFit fit;
  fit.peak_index = 0;
  for (int k = 1; k < n; ++k) {
    if (samples[static_cast<size_t>(k)].strehl >
        samples[static_cast<size_t>(fit.peak_index)].strehl) {
      fit.peak_index = k;
    }
  }
  fit.window_center = clamp_window_center(fit.peak_index, n);

  // Fit in coordinates centred on the window for conditioning
  const int m = 2 * kFitHalfWidth + 1;
  const double z_center =
      samples[static_cast<size_t>(fit.window_center)].z_offset;
  Eigen::MatrixXd A(m, 3);
  Eigen::VectorXd y(m);
  double u_max = 0.0;
  double y_max = 0.0;
  for (int r = 0; r < m; ++r) {
    const ScanSample &s =
        samples[static_cast<size_t>(fit.window_center - kFitHalfWidth + r)];
    const double u = s.z_offset - z_center;
    A(r, 0) = u * u;
    A(r, 1) = u;
    A(r, 2) = 1.0;
    y(r) = s.strehl;
    u_max = std::max(u_max, std::fabs(u));
    y_max = std::max(y_max, std::fabs(s.strehl));
  }

  Eigen::MatrixXd lhs = A.transpose() * A;
  Eigen::VectorXd rhs = A.transpose() * y;
  Eigen::VectorXd coeffs = lhs.ldlt().solve(rhs);

  const double a = coeffs(0);
  const double bu = coeffs(1);
  const double cu = coeffs(2);

  if (!std::isfinite(a) || !std::isfinite(bu) || !std::isfinite(cu)) {
    throw DegenerateFitError("quadratic fit around scan index " +
                             std::to_string(fit.window_center) +
                             " is not finite");
  }
  if (!(std::fabs(a) * u_max * u_max > kDegenerateCurvature * y_max)) {
    std::ostringstream oss;
    oss << "leading coefficient " << a << " vanishes around scan index "
        << fit.window_center << "; the vertex is undefined";
    throw DegenerateFitError(oss.str());
  }

  const double u_opt = -bu / (2.0 * a);
  fit.a = a;
  fit.b = bu - 2.0 * a * z_center;
  fit.c = a * z_center * z_center - bu * z_center + cu;
  fit.z_opt = z_center + u_opt;
  fit.max_strehl = a * u_opt * u_opt + bu * u_opt + cu;
  return fit;
}

double wrms_from_strehl(double max_strehl, double lambda) {
  if (!std::isfinite(max_strehl) || max_strehl <= 0.0) {
    std::ostringstream oss;
    oss << "fitted peak Strehl " << max_strehl
        << " must be finite and positive";
    throw DegenerateFitError(oss.str());
  }
  return lambda / kTwoPi * std::log(1.0 / max_strehl);
}

} // namespace saf_focus::focus
