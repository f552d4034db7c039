#include "saf_focus/optics/vectorial_field.hpp"
#include "saf_focus/core/errors.hpp"

#include <cmath>
#include <sstream>

namespace saf_focus::optics {

VectorialField assemble_vectorial_field(const PupilGrid &grid,
                                        const InterfaceOptics &optics,
                                        const OpticalParameters &params) {
  const int n = grid.size;

  VectorialField field;
  for (auto &channel : field.polarization) {
    for (auto &component : channel) {
      component = Matrix2Dcd::Zero(n, n);
    }
  }
  field.amplitude = Matrix2Dcd::Zero(n, n);

  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      const double phi = std::atan2(grid.Y(i, j), grid.X(i, j));
      const double cos_phi = std::cos(phi);
      const double sin_phi = std::sin(phi);
      const complexd cos_theta = optics.cos_med(i, j);
      const complexd sin_theta = std::sqrt(1.0 - cos_theta * cos_theta);
      const complexd fp = optics.fresnel_p(i, j);
      const complexd fs = optics.fresnel_s(i, j);

      const complexd pvec[3] = {fp * cos_theta * cos_phi,
                                fp * cos_theta * sin_phi, -fp * sin_theta};
      const complexd svec[3] = {-fs * sin_phi, fs * cos_phi, complexd(0.0, 0.0)};

      for (int k = 0; k < 3; ++k) {
        field.polarization[0][k](i, j) = cos_phi * pvec[k] - sin_phi * svec[k];
        field.polarization[1][k](i, j) = sin_phi * pvec[k] + cos_phi * svec[k];
      }

      if (grid.aperture_mask(i, j) > 0.0) {
        field.amplitude(i, j) =
            std::sqrt(optics.cos_imm(i, j)) / (params.refmed * cos_theta);
      }
    }
  }

  field.strehl_norm = focal_peak_intensity(field, grid.aperture_mask);
  if (!std::isfinite(field.strehl_norm) || field.strehl_norm <= 0.0) {
    std::ostringstream oss;
    oss << "Strehl normalisation is " << field.strehl_norm
        << "; a pupil sample may sit on the critical angle, change Npupil";
    throw InvalidParameterError(oss.str());
  }
  return field;
}

double focal_peak_intensity(const VectorialField &field,
                            const Matrix2Dd &aperture_mask,
                            const Matrix2Dcd *phasor) {
  const Eigen::Index rows = aperture_mask.rows();
  const Eigen::Index cols = aperture_mask.cols();

  complexd acc[2][3];
  for (int itel = 0; itel < 2; ++itel) {
    for (int jtel = 0; jtel < 3; ++jtel) {
      acc[itel][jtel] = complexd(0.0, 0.0);
    }
  }

  for (Eigen::Index i = 0; i < rows; ++i) {
    for (Eigen::Index j = 0; j < cols; ++j) {
      if (aperture_mask(i, j) <= 0.0)
        continue;
      complexd w = field.amplitude(i, j);
      if (phasor)
        w *= (*phasor)(i, j);
      for (int itel = 0; itel < 2; ++itel) {
        for (int jtel = 0; jtel < 3; ++jtel) {
          acc[itel][jtel] += w * field.polarization[itel][jtel](i, j);
        }
      }
    }
  }

  double intensity = 0.0;
  for (int itel = 0; itel < 2; ++itel) {
    for (int jtel = 0; jtel < 3; ++jtel) {
      intensity += std::norm(acc[itel][jtel]);
    }
  }
  return intensity;
}

} // namespace saf_focus::optics
