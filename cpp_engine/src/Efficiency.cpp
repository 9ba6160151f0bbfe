#include "Efficiency.h"

#include <algorithm>
#include <cmath>

namespace solarsynth {

namespace {

constexpr double kPi = 3.14159265358979323846;

constexpr double kElecPeak_pct   = 0.85;
constexpr double kElecSigma_pct  = 0.45;
constexpr double kElecFloor      = 0.2;
constexpr double kElecBumpHeight = 0.8;

static inline double clampFinite(double v, double lo, double hi) {
    if (!std::isfinite(v)) return lo;
    return std::clamp(v, lo, hi);
}

static inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

} // namespace

Configuration clampConfiguration(const Configuration& c) {
    Configuration out;
    out.tilt_deg = clampFinite(c.tilt_deg, kTiltMin_deg, kTiltMax_deg);
    out.electrolyte_pct = clampFinite(c.electrolyte_pct, kElectrolyteMin_pct, kElectrolyteMax_pct);
    return out;
}

double tiltEfficiency(double tilt_deg, double sun_angle_deg) {
    const double diff_deg = std::abs(tilt_deg - sun_angle_deg);
    return clamp01(std::cos(diff_deg * kPi / 180.0));
}

double electrolyteEfficiency(double electrolyte_pct) {
    const double z = (electrolyte_pct - kElecPeak_pct) / kElecSigma_pct;
    const double bump = std::exp(-0.5 * z * z);
    return clamp01(kElecFloor + kElecBumpHeight * bump);
}

EfficiencyPair computeEfficiencies(const Configuration& c, const EnvironmentSample& env) {
    EfficiencyPair e;
    e.tilt_eff_0_1 = tiltEfficiency(c.tilt_deg, env.sun_angle_deg);
    e.elec_eff_0_1 = electrolyteEfficiency(c.electrolyte_pct);
    return e;
}

} // namespace solarsynth
