#include "PolicySweep.h"

#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace solarsynth {

PolicySweep::PolicySweep() = default;

void PolicySweep::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void PolicySweep::clearResults() {
    results_.clear();
}

std::vector<double> PolicySweep::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

PolicySweep::RunResult PolicySweep::runScenario(const ScenarioConfig& scenario, std::uint32_t seed_u32) {
    SimConfigV1 cfg;
    cfg.default_config = scenario.start_config;
    cfg.learner.epsilon = scenario.epsilon;
    cfg.learner.decision_cadence_s = scenario.decision_cadence_s;
    cfg.learner_enabled = scenario.learner_enabled;
    cfg.seed_u32 = seed_u32;

    Simulation sim(cfg);
    sim.start();

    const double dt = (std::isfinite(scenario.dt_s) && scenario.dt_s >= kMinFixedStep_s) ? scenario.dt_s : 0.05;
    const std::int64_t steps = fixedStepCount(scenario.t_end_s, dt);
    for (std::int64_t i = 0; i < steps; ++i) {
        sim.tick(dt);
    }

    const Observation o = sim.observe();
    RunResult r;
    r.yield_mL = o.yield_mL;
    r.best_reward_mL_per_min = o.best.valid ? o.best.reward : 0.0;
    r.bins_visited = static_cast<int>(o.memory_bins);
    r.decisions = o.decisions;
    return r;
}

PolicySweep::SampleResult PolicySweep::runReplicates(const ScenarioConfig& scenario) const {
    const int seeds = std::max(1, scenario.seeds);

    std::vector<double> yields;
    yields.reserve(static_cast<std::size_t>(seeds));
    double best_sum = 0.0;
    double bins_sum = 0.0;

    for (int i = 0; i < seeds; ++i) {
        const RunResult r = runScenario(scenario, scenario.base_seed_u32 + static_cast<std::uint32_t>(i));
        yields.push_back(r.yield_mL);
        best_sum += r.best_reward_mL_per_min;
        bins_sum += static_cast<double>(r.bins_visited);
    }

    SampleResult m{};
    double mean = 0.0;
    for (double y : yields) mean += y;
    mean /= static_cast<double>(seeds);

    double variance = 0.0;
    for (double y : yields) {
        const double d = y - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(seeds);

    m.mean_yield_mL = mean;
    m.std_yield_mL = std::sqrt(variance);
    m.mean_best_reward_mL_per_min = best_sum / static_cast<double>(seeds);
    m.mean_bins_visited = bins_sum / static_cast<double>(seeds);
    return m;
}

void PolicySweep::analyzeEpsilon(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.epsilon = std::clamp(value, 0.0, 1.0);
        const auto metrics = runReplicates(scenario);
        results_.push_back({"epsilon", scenario.epsilon, metrics});
    }
}

void PolicySweep::analyzeCadence(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.decision_cadence_s = std::clamp(value, kCadenceMin_s, kCadenceMax_s);
        const auto metrics = runReplicates(scenario);
        results_.push_back({"decision_cadence_s", scenario.decision_cadence_s, metrics});
    }
}

bool PolicySweep::exportSweepCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,mean_yield_mL,std_yield_mL,mean_best_reward_mL_per_min,mean_bins_visited\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.mean_yield_mL << ','
            << row.metrics.std_yield_mL << ','
            << row.metrics.mean_best_reward_mL_per_min << ','
            << row.metrics.mean_bins_visited << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<PolicySweep::SweepRow>& PolicySweep::results() const {
    return results_;
}

} // namespace solarsynth
