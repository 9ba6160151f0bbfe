#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Efficiency.h"

namespace solarsynth {

// Headless parameter sweeps over the learner policy. Each sampled value is run
// for several seeds; final yield and best raw reward are summarized per value.
class PolicySweep {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        double dt_s = 0.05;             // below kMinFixedStep_s falls back to 0.05
        double t_end_s = 360.0;         // one simulated day
        int seeds = 5;
        std::uint32_t base_seed_u32 = 1337u;
        Configuration start_config{};
        double epsilon = 0.2;
        double decision_cadence_s = 5.0;
        bool learner_enabled = true;
    };

    struct RunResult {
        double yield_mL = 0.0;
        double best_reward_mL_per_min = 0.0;
        int bins_visited = 0;
        std::uint64_t decisions = 0;
    };

    struct SampleResult {
        double mean_yield_mL = 0.0;
        double std_yield_mL = 0.0;
        double mean_best_reward_mL_per_min = 0.0;
        double mean_bins_visited = 0.0;
    };

    struct SweepRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        SampleResult metrics{};
    };

    PolicySweep();

    void setScenario(const ScenarioConfig& scenario);
    const ScenarioConfig& scenario() const { return scenario_; }
    void clearResults();

    void analyzeEpsilon(const ParameterRange& range);
    void analyzeCadence(const ParameterRange& range);

    // Returns false when the file cannot be opened.
    bool exportSweepCSV(const std::string& filename) const;
    const std::vector<SweepRow>& results() const;

    // Single deterministic run (fixed dt, one seed).
    static RunResult runScenario(const ScenarioConfig& scenario, std::uint32_t seed_u32);

private:
    ScenarioConfig scenario_{};
    std::vector<SweepRow> results_{};

    SampleResult runReplicates(const ScenarioConfig& scenario) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace solarsynth
