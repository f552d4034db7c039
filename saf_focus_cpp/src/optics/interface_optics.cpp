#include "saf_focus/optics/interface_optics.hpp"

#include <cmath>

namespace saf_focus::optics {

complexd medium_cos_theta(double arg) {
  const double phi = std::atan2(0.0, arg);
  return std::sqrt(std::fabs(arg)) *
         complexd(std::cos(0.5 * phi), -std::sin(0.5 * phi));
}

complexd propagating_cos_theta(double arg) {
  // Negative arguments only occur in the grid corners outside the aperture;
  // the principal root keeps those entries finite.
  return std::sqrt(complexd(arg, 0.0));
}

InterfaceOptics compute_interface_optics(const PupilGrid &grid,
                                         const OpticalParameters &params) {
  const int n = grid.size;
  const double na2 = params.NA * params.NA;
  const double refmed = params.refmed;
  const double refcov = params.refcov;
  const double refimm = params.refimm;

  InterfaceOptics out;
  out.cos_med.resize(n, n);
  out.cos_cov.resize(n, n);
  out.cos_imm.resize(n, n);
  out.cos_immnom.resize(n, n);
  out.fresnel_p_medcov.resize(n, n);
  out.fresnel_s_medcov.resize(n, n);
  out.fresnel_p_covimm.resize(n, n);
  out.fresnel_s_covimm.resize(n, n);
  out.fresnel_p.resize(n, n);
  out.fresnel_s.resize(n, n);

  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      const double r2 = grid.X(i, j) * grid.X(i, j) + grid.Y(i, j) * grid.Y(i, j);

      const complexd cmed = medium_cos_theta(1.0 - r2 * na2 / (refmed * refmed));
      const complexd ccov = propagating_cos_theta(1.0 - r2 * na2 / (refcov * refcov));
      const complexd cimm = propagating_cos_theta(1.0 - r2 * na2 / (refimm * refimm));
      const complexd cnom = propagating_cos_theta(
          1.0 - r2 * na2 / (params.refimmnom * params.refimmnom));

      out.cos_med(i, j) = cmed;
      out.cos_cov(i, j) = ccov;
      out.cos_imm(i, j) = cimm;
      out.cos_immnom(i, j) = cnom;

      const complexd p_medcov = 2.0 * refmed * cmed / (refmed * ccov + refcov * cmed);
      const complexd s_medcov = 2.0 * refmed * cmed / (refmed * cmed + refcov * ccov);
      const complexd p_covimm = 2.0 * refcov * ccov / (refcov * cimm + refimm * ccov);
      const complexd s_covimm = 2.0 * refcov * ccov / (refcov * ccov + refimm * cimm);

      out.fresnel_p_medcov(i, j) = p_medcov;
      out.fresnel_s_medcov(i, j) = s_medcov;
      out.fresnel_p_covimm(i, j) = p_covimm;
      out.fresnel_s_covimm(i, j) = s_covimm;
      out.fresnel_p(i, j) = p_medcov * p_covimm;
      out.fresnel_s(i, j) = s_medcov * s_covimm;
    }
  }
  return out;
}

} // namespace saf_focus::optics
