#include "Production.h"

#include <algorithm>
#include <cmath>

namespace solarsynth {

double Mt19937RandomSource::uniform01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

int Mt19937RandomSource::uniformInt(int lo, int hi) {
    if (hi < lo) std::swap(lo, hi);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
}

double productionRate(int lux, double tilt_eff_0_1, double elec_eff_0_1, RandomSource& rng) {
    double u = rng.uniform01();
    if (!std::isfinite(u)) u = 0.5;
    u = std::clamp(u, 0.0, 1.0);

    // Map [0,1) onto [-halfwidth, +halfwidth).
    const double noise = (u - 0.5) * 2.0 * kRateNoiseHalfWidth_mL_per_min;

    const double clean = static_cast<double>(lux) * tilt_eff_0_1 * elec_eff_0_1 * kRatePerLux_mL_per_min;
    const double rate = clean + noise;
    if (!std::isfinite(rate)) return 0.0;
    return std::max(0.0, rate);
}

double accumulateYield(double total_mL, double rate_mL_per_min, double dt_s) {
    if (!std::isfinite(rate_mL_per_min) || rate_mL_per_min <= 0.0) return total_mL;
    if (!std::isfinite(dt_s) || dt_s <= 0.0) return total_mL;
    return total_mL + rate_mL_per_min * (dt_s / 60.0);
}

} // namespace solarsynth
