#include "PolicySweep.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "PolicySweepTool usage:\n"
              << "  PolicySweepTool --param <epsilon|cadence> [--min v] [--max v] [--samples n]\n"
              << "                  [--seeds n] [--seconds s] [--dt s] [--seed n] [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "policy_sweep.csv";
    bool min_set = false;
    bool max_set = false;

    solarsynth::PolicySweep::ScenarioConfig scenario;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--seeds" && i + 1 < argc) {
                scenario.seeds = std::stoi(argv[++i]);
            } else if (arg == "--seconds" && i + 1 < argc) {
                scenario.t_end_s = std::stod(argv[++i]);
            } else if (arg == "--dt" && i + 1 < argc) {
                scenario.dt_s = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                scenario.base_seed_u32 = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "FATAL: bad numeric argument (" << e.what() << ")\n";
        printUsage();
        return 1;
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    solarsynth::PolicySweep sweep;
    sweep.setScenario(scenario);

    solarsynth::PolicySweep::ParameterRange range;
    range.samples = samples;

    const bool is_epsilon = (param == "epsilon" || param == "eps");
    const bool is_cadence = (param == "cadence" || param == "decision_cadence" || param == "decision_cadence_s");

    if (is_epsilon) {
        range.nominal = scenario.epsilon;
        if (!min_set) min_val = 0.0;
        if (!max_set) max_val = 1.0;
    } else if (is_cadence) {
        range.nominal = scenario.decision_cadence_s;
        if (!min_set) min_val = 2.0;
        if (!max_set) max_val = 30.0;
    } else {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    range.min = min_val;
    range.max = max_val;

    std::cout << "[INFO] sweeping " << param << " over [" << range.min << ", " << range.max << "] "
              << "samples=" << range.samples << " seeds=" << scenario.seeds
              << " t_end=" << scenario.t_end_s << "s dt=" << scenario.dt_s << "s\n";

    if (is_epsilon) {
        sweep.analyzeEpsilon(range);
    } else {
        sweep.analyzeCadence(range);
    }

    for (const auto& row : sweep.results()) {
        std::cout << "  " << row.parameter_name << "=" << row.parameter_value
                  << "  yield=" << row.metrics.mean_yield_mL << " +/- " << row.metrics.std_yield_mL << " mL"
                  << "  best=" << row.metrics.mean_best_reward_mL_per_min << " mL/min"
                  << "  bins=" << row.metrics.mean_bins_visited << "\n";
    }

    if (!sweep.exportSweepCSV(out)) {
        std::cerr << "FATAL: could not write " << out << "\n";
        return 1;
    }
    std::cout << "Wrote policy sweep to: " << out << "\n";
    return 0;
}
