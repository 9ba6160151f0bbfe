// HeadlessRun: fixed-step driver with no presentation layer.
// Prints a run summary + determinism signatures, optionally writes the
// per-second telemetry stream as CSV.

#include "Simulation.h"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "HeadlessRun usage:\n"
              << "  HeadlessRun [--seconds s] [--dt s] [--tilt deg] [--elec pct]\n"
              << "              [--learner 0|1] [--epsilon e] [--cadence s] [--seed n]\n"
              << "              [--out telemetry.csv] [--print-config]\n";
}

bool writeTelemetryCSV(const solarsynth::Simulation& sim, const std::string& filename) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    std::vector<solarsynth::TelemetrySample> samples(static_cast<std::size_t>(sim.telemetryCount()));
    const int n = sim.getTelemetrySamples(samples.data(), static_cast<int>(samples.size()));

    out << "t_s,lux,sun_angle_deg,tilt_eff,elec_eff,tilt_deg,electrolyte_pct,rate_mL_per_min,yield_mL,best_reward\n";
    out << std::fixed << std::setprecision(6);
    for (int i = 0; i < n; ++i) {
        const auto& s = samples[static_cast<std::size_t>(i)];
        out << s.t_s << ',' << s.lux << ',' << s.sun_angle_deg << ','
            << s.tilt_eff_0_1 << ',' << s.elec_eff_0_1 << ','
            << s.tilt_deg << ',' << s.electrolyte_pct << ','
            << s.rate_mL_per_min << ',' << s.yield_mL << ','
            << s.best_reward_mL_per_min << '\n';
    }
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char** argv) {
    double seconds = 360.0;
    double dt = 1.0 / 60.0;
    std::string out;
    bool print_config = false;

    solarsynth::SimConfigV1 cfg;
    cfg.learner_enabled = true;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--seconds" && i + 1 < argc) {
                seconds = std::stod(argv[++i]);
            } else if (arg == "--dt" && i + 1 < argc) {
                dt = std::stod(argv[++i]);
            } else if (arg == "--tilt" && i + 1 < argc) {
                cfg.default_config.tilt_deg = std::stod(argv[++i]);
            } else if (arg == "--elec" && i + 1 < argc) {
                cfg.default_config.electrolyte_pct = std::stod(argv[++i]);
            } else if (arg == "--learner" && i + 1 < argc) {
                cfg.learner_enabled = (std::stoi(argv[++i]) != 0);
            } else if (arg == "--epsilon" && i + 1 < argc) {
                cfg.learner.epsilon = std::stod(argv[++i]);
            } else if (arg == "--cadence" && i + 1 < argc) {
                cfg.learner.decision_cadence_s = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed_u32 = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--print-config") {
                print_config = true;
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

    if (!(dt >= solarsynth::kMinFixedStep_s) || !(seconds >= 0.0)) {
        std::cerr << "FATAL: --dt must be >= " << solarsynth::kMinFixedStep_s << " and --seconds >= 0\n";
        return 1;
    }
    const std::int64_t steps = solarsynth::fixedStepCount(seconds, dt);
    if (steps == 0 && seconds >= dt) {
        std::cerr << "FATAL: --seconds / --dt exceeds " << solarsynth::kMaxFixedSteps << " steps\n";
        return 1;
    }

    solarsynth::Simulation sim(cfg);

    if (print_config) {
        std::cout << sim.exportConfigText();
    }

    sim.start();
    for (std::int64_t i = 0; i < steps; ++i) {
        sim.tick(dt);
    }

    const solarsynth::Observation o = sim.observe();
    const solarsynth::RunSignatures sig = sim.getRunSignatures();

    std::printf("[RUN] t=%d:%02d  lux=%d  rate=%.2f mL/min  yield=%.1f mL\n",
                o.elapsed_min, o.elapsed_sec, o.lux, o.rate_mL_per_min, o.yield_mL);
    std::printf("[RUN] config tilt=%.0f deg  electrolyte=%.1f %%  decisions=%llu (last: %s)\n",
                o.tilt_deg, o.electrolyte_pct,
                static_cast<unsigned long long>(o.decisions),
                solarsynth::suggestionReasonText(o.last_suggestion));
    if (o.best.valid) {
        std::printf("[RUN] best tilt=%d deg  electrolyte=%.1f %%  rate=%.2f mL/min\n",
                    o.best.bin.tilt_deg, o.best.bin.electrolytePct(), o.best.reward);
    } else {
        std::printf("[RUN] best: none\n");
    }
    std::printf("[RUN] bins=%zu  records=%llu\n", o.memory_bins, static_cast<unsigned long long>(o.records));
    std::printf("[SIG] params=0x%08X telemetry=0x%08X state=0x%08X\n",
                sig.run_param_hash_u32, sig.telemetry_crc_u32, sig.state_digest_u32);

    if (!out.empty()) {
        if (!writeTelemetryCSV(sim, out)) {
            std::fprintf(stderr, "FATAL: could not write %s\n", out.c_str());
            return 1;
        }
        std::cout << "Wrote telemetry to: " << out << "\n";
    }
    return 0;
}
