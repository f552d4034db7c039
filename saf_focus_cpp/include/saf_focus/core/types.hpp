#pragma once

#include <Eigen/Dense>
#include <array>
#include <complex>
#include <string>
#include <vector>

namespace saf_focus {

using complexd = std::complex<double>;

// Pupil-plane maps (row index i runs along X, column index j along Y)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dcd = Eigen::Matrix<complexd, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

// Number of candidate stage offsets in the Strehl scan
constexpr int kNumScanPlanes = 101;

// Scan range is this multiple of the configured z-spread
constexpr double kScanRangeFactor = 1.5;

// First-order focal shift per unit depth, in units of refimm/refmed
constexpr double kFocalShiftFactor = 1.25;

// Physical parameter set. All lengths share the unit of lambda (nm in practice).
struct OpticalParameters {
    double NA = 1.49;            // numerical aperture
    double refmed = 1.33;        // sample medium
    double refcov = 1.52;        // coverslip
    double refimm = 1.51;        // actual immersion medium
    double refimmnom = 1.51;     // design immersion medium
    double lambda = 680.0;       // vacuum wavelength
    int Npupil = 64;             // pupil samples per axis
    double fwd = 150000.0;       // nominal free working distance
    double depth = 0.0;          // imaging depth below the coverslip
    std::array<double, 2> zspread{-1000.0, 1000.0};
    bool debugmode = false;
};

// Aperture-limited sampling of the unit pupil
struct PupilGrid {
    int size = 0;
    double step = 0.0;
    Matrix2Dd X;
    Matrix2Dd Y;
    Matrix2Dd aperture_mask;     // 1 inside X^2 + Y^2 < 1, else 0
};

// Propagation cosines and Fresnel transmission through medium/cover/immersion
struct InterfaceOptics {
    Matrix2Dcd cos_med;
    Matrix2Dcd cos_cov;
    Matrix2Dcd cos_imm;
    Matrix2Dcd cos_immnom;

    Matrix2Dcd fresnel_p_medcov;
    Matrix2Dcd fresnel_s_medcov;
    Matrix2Dcd fresnel_p_covimm;
    Matrix2Dcd fresnel_s_covimm;
    Matrix2Dcd fresnel_p;
    Matrix2Dcd fresnel_s;
};

// Polarization vector, indexed [itel][jtel]: output polarization x field component
using PolarizationVector = std::array<std::array<Matrix2Dcd, 3>, 2>;

struct VectorialField {
    PolarizationVector polarization;
    Matrix2Dcd amplitude;        // aplanatic factor, zero outside the aperture
    double strehl_norm = 0.0;    // peak intensity at zero path difference
};

struct ScanSample {
    double z_offset;             // offset from the first-order stage estimate
    double strehl;
};

struct StrehlScan {
    double baseline = 0.0;       // fwd - 1.25 * refimm/refmed * depth
    std::vector<ScanSample> samples;
};

// Quadratic fit S(z) = a z^2 + b z + c around the scan maximum
struct PeakFit {
    int peak_index = 0;          // discrete maximum
    int window_center = 0;       // clamped centre of the 5-point window
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
    double z_opt = 0.0;          // vertex, in offset coordinates
    double max_strehl = 0.0;     // fit evaluated at its vertex
};

struct FocusResult {
    std::array<double, 3> zvals{0.0, 0.0, 0.0};  // stage position, fwd, -depth
    double wrms = 0.0;
    double strehl_norm = 0.0;
    StrehlScan scan;
    PeakFit fit;
};

// Pipeline stage enumeration
enum class Phase {
    PUPIL_GRID = 0,
    INTERFACE_OPTICS = 1,
    VECTORIAL_FIELD = 2,
    STREHL_SCAN = 3,
    PEAK_REFINE = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::PUPIL_GRID: return "PUPIL_GRID";
        case Phase::INTERFACE_OPTICS: return "INTERFACE_OPTICS";
        case Phase::VECTORIAL_FIELD: return "VECTORIAL_FIELD";
        case Phase::STREHL_SCAN: return "STREHL_SCAN";
        case Phase::PEAK_REFINE: return "PEAK_REFINE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace saf_focus
