#include "Environment.h"

#include <algorithm>
#include <cmath>

namespace solarsynth {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Cloud layer: two detuned harmonics of the day phase.
constexpr double kCloudAmpA   = 0.15;
constexpr double kCloudFreqA  = 2.4;
constexpr double kCloudPhaseA = 1.7;
constexpr double kCloudAmpB   = 0.08;
constexpr double kCloudFreqB  = 4.1;
constexpr double kCloudPhaseB = 0.3;

static inline double dayPhase01(double t_s) {
    if (!std::isfinite(t_s) || t_s < 0.0) t_s = 0.0;
    return std::fmod(t_s, kDayLength_s) / kDayLength_s;
}

} // namespace

EnvironmentSample sampleEnvironment(double t_s) {
    const double phase = dayPhase01(t_s);
    const double angle = phase * 2.0 * kPi;

    const double base = std::max(0.0, std::sin(angle));
    const double clouds = kCloudAmpA * std::sin(angle * kCloudFreqA + kCloudPhaseA)
                        + kCloudAmpB * std::sin(angle * kCloudFreqB + kCloudPhaseB);
    const double sky_0_1 = std::clamp(base + clouds, 0.0, 1.0);

    EnvironmentSample s;
    const double span = static_cast<double>(kLuxMax - kLuxMin);
    s.lux = static_cast<int>(std::lround(static_cast<double>(kLuxMin) + sky_0_1 * span));
    s.lux = std::clamp(s.lux, kLuxMin, kLuxMax);

    s.sun_angle_deg = std::max(0.0, std::sin(phase * kPi) * kSunAngleMax_deg);
    return s;
}

} // namespace solarsynth
