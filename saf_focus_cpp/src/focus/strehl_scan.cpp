#include "saf_focus/focus/strehl_scan.hpp"
#include "saf_focus/core/utils.hpp"
#include "saf_focus/optics/vectorial_field.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>

namespace saf_focus::focus {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
} // namespace

double stage_baseline(const OpticalParameters &params) {
  return params.fwd -
         kFocalShiftFactor * params.refimm / params.refmed * params.depth;
}

std::vector<double> scan_offsets(const OpticalParameters &params) {
  return core::linspace(kScanRangeFactor * params.zspread[0],
                        kScanRangeFactor * params.zspread[1], kNumScanPlanes);
}

double strehl_at_offset(const PupilGrid &grid, const InterfaceOptics &stack,
                        const VectorialField &field,
                        const OpticalParameters &params, double z_offset) {
  const int n = grid.size;
  const double z_stage = stage_baseline(params) + z_offset;
  const double k0 = kTwoPi / params.lambda;

  // exp(i k0 W), W being the optical path difference between the actual and
  // the design stack; unity outside the aperture
  Matrix2Dcd phasor = Matrix2Dcd::Ones(n, n);
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      if (grid.aperture_mask(i, j) <= 0.0)
        continue;
      const complexd w = z_stage * params.refimm * stack.cos_imm(i, j) -
                         params.fwd * params.refimmnom * stack.cos_immnom(i, j) +
                         params.depth * params.refmed * stack.cos_med(i, j);
      phasor(i, j) = std::exp(complexd(0.0, k0) * w);
    }
  }

  return optics::focal_peak_intensity(field, grid.aperture_mask, &phasor) /
         field.strehl_norm;
}

StrehlScan run_strehl_scan(const PupilGrid &grid, const InterfaceOptics &stack,
                           const VectorialField &field,
                           const OpticalParameters &params, int workers,
                           const ScanProgressFn &progress) {
  StrehlScan scan;
  scan.baseline = stage_baseline(params);

  const std::vector<double> offsets = scan_offsets(params);
  const int total = static_cast<int>(offsets.size());
  std::vector<double> strehl(offsets.size(), 0.0);
  std::atomic<int> done{0};

  auto process_offset = [&](size_t k) {
    strehl[k] = strehl_at_offset(grid, stack, field, params, offsets[k]);
    const int completed = done.fetch_add(1) + 1;
    if (progress)
      progress(completed, total);
  };

  int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
  if (cpu_cores == 0)
    cpu_cores = 1;
  const int n_workers = std::max(1, std::min({workers, cpu_cores, total}));

  if (n_workers > 1) {
    std::vector<std::thread> pool;
    std::atomic<size_t> next{0};
    for (int w = 0; w < n_workers; ++w) {
      pool.emplace_back([&]() {
        while (true) {
          size_t k = next.fetch_add(1);
          if (k >= offsets.size())
            break;
          process_offset(k);
        }
      });
    }
    for (auto &t : pool) {
      t.join();
    }
  } else {
    for (size_t k = 0; k < offsets.size(); ++k) {
      process_offset(k);
    }
  }

  scan.samples.reserve(offsets.size());
  for (size_t k = 0; k < offsets.size(); ++k) {
    scan.samples.push_back({offsets[k], strehl[k]});
  }
  return scan;
}

} // namespace saf_focus::focus
