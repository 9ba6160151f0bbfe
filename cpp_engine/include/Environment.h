#pragma once

// Environment.h
//
// Deterministic sun model over a compressed simulated day.
//
// Design goals:
//   - Pure function of simulated time (no hidden state, no randomness).
//   - Identical time input => identical sample, bit for bit.
//   - "Clouds" are two fixed low-frequency sinusoids layered on the day curve,
//     so the irradiance trace is irregular but reproducible.

namespace solarsynth {

// Full day/night cycle length in simulated seconds.
constexpr double kDayLength_s = 360.0;

constexpr int kLuxMin = 10000;
constexpr int kLuxMax = 80000;

// Sun elevation swings 0..60 degrees over the first half of the phase.
constexpr double kSunAngleMax_deg = 60.0;

struct EnvironmentSample {
    int lux = kLuxMin;              // integer, [10000, 80000]
    double sun_angle_deg = 0.0;     // [0, 60]
};

// Negative or non-finite time is treated as t = 0.
EnvironmentSample sampleEnvironment(double t_s);

} // namespace solarsynth
