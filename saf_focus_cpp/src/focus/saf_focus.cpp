#include "saf_focus/focus/saf_focus.hpp"
#include "saf_focus/core/errors.hpp"
#include "saf_focus/focus/peak_refine.hpp"
#include "saf_focus/optics/interface_optics.hpp"
#include "saf_focus/optics/pupil_grid.hpp"
#include "saf_focus/optics/vectorial_field.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace saf_focus::focus {

static void require_positive(double v, const char *name) {
  if (!std::isfinite(v) || v <= 0.0) {
    std::ostringstream oss;
    oss << name << " must be > 0, got " << v;
    throw InvalidParameterError(oss.str());
  }
}

static void require_finite(double v, const char *name) {
  if (!std::isfinite(v)) {
    std::ostringstream oss;
    oss << name << " must be finite, got " << v;
    throw InvalidParameterError(oss.str());
  }
}

static void require_propagating(double na, double n, const char *name) {
  if (!(na < n)) {
    std::ostringstream oss;
    oss << "NA (" << na << ") must be below " << name << " (" << n
        << ") for propagating rays inside the aperture";
    throw InvalidParameterError(oss.str());
  }
}

void validate_parameters(const OpticalParameters &params) {
  require_positive(params.NA, "NA");
  require_positive(params.refmed, "refmed");
  require_positive(params.refcov, "refcov");
  require_positive(params.refimm, "refimm");
  require_positive(params.refimmnom, "refimmnom");
  require_positive(params.lambda, "lambda");

  if (params.Npupil < 1) {
    throw InvalidParameterError("Npupil must be >= 1, got " +
                                std::to_string(params.Npupil));
  }

  require_finite(params.fwd, "fwd");
  require_finite(params.depth, "depth");
  require_finite(params.zspread[0], "zspread[0]");
  require_finite(params.zspread[1], "zspread[1]");
  if (params.depth < 0.0) {
    std::ostringstream oss;
    oss << "depth must be >= 0, got " << params.depth;
    throw InvalidParameterError(oss.str());
  }
  if (params.zspread[0] > params.zspread[1]) {
    std::ostringstream oss;
    oss << "zspread must be [low, high] with low <= high, got ["
        << params.zspread[0] << ", " << params.zspread[1] << "]";
    throw InvalidParameterError(oss.str());
  }

  // The sample medium may go evanescent; the other media may not
  require_propagating(params.NA, params.refcov, "refcov");
  require_propagating(params.NA, params.refimm, "refimm");
  require_propagating(params.NA, params.refimmnom, "refimmnom");
}

FocusResult finalize_focus(const OpticalParameters &params, double strehl_norm,
                           StrehlScan scan) {
  FocusResult result;
  result.strehl_norm = strehl_norm;
  result.fit = refine_peak(scan.samples);
  result.zvals[0] = scan.baseline + result.fit.z_opt;
  result.zvals[1] = params.fwd;
  result.zvals[2] = -params.depth;
  result.wrms = wrms_from_strehl(result.fit.max_strehl, params.lambda);
  result.scan = std::move(scan);
  return result;
}

FocusResult compute_saf_focus(const OpticalParameters &params, int workers,
                              const ScanProgressFn &progress) {
  validate_parameters(params);

  const PupilGrid grid = optics::build_pupil_grid(params.Npupil);
  const InterfaceOptics stack = optics::compute_interface_optics(grid, params);
  const VectorialField field =
      optics::assemble_vectorial_field(grid, stack, params);

  StrehlScan scan =
      run_strehl_scan(grid, stack, field, params, workers, progress);
  return finalize_focus(params, field.strehl_norm, std::move(scan));
}

} // namespace saf_focus::focus
