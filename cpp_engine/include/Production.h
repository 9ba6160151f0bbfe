#pragma once

#include <cstdint>
#include <random>

namespace solarsynth {

// Replaceable randomness seam. The engine never calls std::rand(); every
// random draw goes through one of these so tests can script the sequence.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform in [0, 1).
    virtual double uniform01() = 0;

    // Uniform over the inclusive integer range [lo, hi]. Requires lo <= hi.
    virtual int uniformInt(int lo, int hi) = 0;
};

// Default source: std::mt19937 with an explicit seed (deterministic per seed).
class Mt19937RandomSource : public RandomSource {
public:
    explicit Mt19937RandomSource(std::uint32_t seed = 1337u) : rng_(seed) {}

    double uniform01() override;
    int uniformInt(int lo, int hi) override;

    void reseed(std::uint32_t seed) { rng_.seed(seed); }

private:
    std::mt19937 rng_;
};

// Conversion constant: lux * efficiencies -> mL/min.
constexpr double kRatePerLux_mL_per_min = 0.00035;
// Symmetric measurement jitter half-width (mL/min).
constexpr double kRateNoiseHalfWidth_mL_per_min = 0.25;

// Instantaneous hydrogen rate (mL/min), >= 0. Draws exactly one uniform01().
double productionRate(int lux, double tilt_eff_0_1, double elec_eff_0_1, RandomSource& rng);

// total + rate * dt/60. Negative or non-finite rate/dt contribute nothing,
// so the result is never below total.
double accumulateYield(double total_mL, double rate_mL_per_min, double dt_s);

} // namespace solarsynth
