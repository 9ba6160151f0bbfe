#pragma once

#include "Environment.h"

namespace solarsynth {

// Controllable parameter vector (explicit units).
struct Configuration {
    double tilt_deg = 30.0;         // [0, 60]
    double electrolyte_pct = 1.0;   // [0, 2]
};

constexpr double kTiltMin_deg = 0.0;
constexpr double kTiltMax_deg = 60.0;
constexpr double kElectrolyteMin_pct = 0.0;
constexpr double kElectrolyteMax_pct = 2.0;

// Clamp into domain; non-finite components map to the lower bound.
Configuration clampConfiguration(const Configuration& c);

struct EfficiencyPair {
    double tilt_eff_0_1 = 0.0;      // [0, 1]
    double elec_eff_0_1 = 0.2;      // [0.2, 1]
};

// 1.0 when panel tilt matches sun elevation, cosine falloff with the absolute
// difference, 0 once the difference reaches 90 degrees.
double tiltEfficiency(double tilt_deg, double sun_angle_deg);

// Gaussian bump centred on 0.85 %, floor of 0.2.
double electrolyteEfficiency(double electrolyte_pct);

EfficiencyPair computeEfficiencies(const Configuration& c, const EnvironmentSample& env);

} // namespace solarsynth
