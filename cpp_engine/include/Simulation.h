#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "BanditLearner.h"
#include "Efficiency.h"
#include "Environment.h"
#include "Production.h"

namespace solarsynth {

enum class RunState : int {
    Stopped = 0,
    Running = 1,
    Paused  = 2,
};

const char* runStateText(RunState s);

// Fixed-step drivers (headless tool, sweeps) reject smaller steps.
constexpr double kMinFixedStep_s = 1e-6;
constexpr std::int64_t kMaxFixedSteps = 1000000000000LL;

// Number of whole dt steps that fit in [0, t_end_s]. Returns 0 for a step
// below kMinFixedStep_s, a non-finite input, or a count above kMaxFixedSteps.
std::int64_t fixedStepCount(double t_end_s, double dt_s);

// ============================================================
// Versioned, hashable run configuration (explicit units).
// Reset returns the live configuration to default_config.
// ============================================================
struct SimConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(SimConfigV1);

    Configuration default_config{};
    LearnerConfig learner{};
    bool learner_enabled = false;
    std::uint32_t seed_u32 = 1337u;
};

// One row per recorded whole second (same moment the learner observes).
struct TelemetrySample {
    float t_s = 0.0f;
    float lux = 0.0f;
    float sun_angle_deg = 0.0f;
    float tilt_eff_0_1 = 0.0f;
    float elec_eff_0_1 = 0.0f;
    float tilt_deg = 0.0f;
    float electrolyte_pct = 0.0f;
    float rate_mL_per_min = 0.0f;
    float yield_mL = 0.0f;
    float best_reward_mL_per_min = 0.0f;
};

struct RunSignatures {
    std::uint32_t run_param_hash_u32 = 0; // FNV-1a32 over effective SimConfigV1 fields
    std::uint32_t telemetry_crc_u32  = 0; // CRC32 over recorded TelemetrySample stream
    std::uint32_t state_digest_u32   = 0; // FNV-1a32 over clock, yield and learner memory
};

// Snapshot handed to presentation layers. Plain value; never aliases state.
struct Observation {
    RunState run_state = RunState::Stopped;

    double t_s = 0.0;
    int elapsed_min = 0;
    int elapsed_sec = 0;

    int lux = kLuxMin;
    double sun_angle_deg = 0.0;
    double tilt_eff_0_1 = 0.0;
    double elec_eff_0_1 = 0.0;
    double rate_mL_per_min = 0.0;
    double yield_mL = 0.0;

    double tilt_deg = 0.0;
    double electrolyte_pct = 0.0;

    bool learner_enabled = false;
    double epsilon = 0.0;
    double decision_cadence_s = 0.0;
    double last_decision_t_s = 0.0;
    SuggestionReason last_suggestion = SuggestionReason::None;
    std::uint64_t decisions = 0;

    std::size_t memory_bins = 0;
    std::uint64_t records = 0;

    // Consumers redraw the best read-out only when the revision changes.
    BestObservation best{};
    std::uint32_t best_revision_u32 = 0;
};

class Simulation {
public:
    Simulation();
    explicit Simulation(const SimConfigV1& cfg);
    // Takes ownership of an injected random source (tests, replays).
    Simulation(const SimConfigV1& cfg, std::unique_ptr<RandomSource> rng);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Lifecycle
    void start();
    void pause();
    void reset();
    RunState runState() const noexcept { return run_state_; }
    bool isRunning() const noexcept { return run_state_ == RunState::Running; }

    // Control surface inputs (all clamped into domain).
    void setConfiguration(const Configuration& c);
    void setDefaultConfiguration(const Configuration& c);
    void setEpsilon(double epsilon);
    void setDecisionCadence_s(double cadence_s);
    void setLearnerEnabled(bool enabled);

    // dt is clamped to >= 0; non-finite dt is treated as 0.
    // When not running only the snapshot is refreshed.
    void tick(double dt_s);

    // Must be side-effect free.
    Observation observe() const { return obs_; }

    double time_s() const noexcept { return time_s_; }
    double cumulativeYield_mL() const noexcept { return yield_mL_; }
    const Configuration& configuration() const noexcept { return config_; }
    bool learnerEnabled() const noexcept { return learner_enabled_; }
    const BanditLearner& learner() const noexcept { return learner_; }
    const SimConfigV1& simConfig() const noexcept { return cfg_; }

    // Oldest-first copy of up to cap samples; returns the count written.
    int getTelemetrySamples(TelemetrySample* out_ptr, int cap) const;
    int telemetryCount() const noexcept { return telemetry_count_; }
    RunSignatures getRunSignatures() const;

    // Stable key=value text of the effective configuration.
    std::string exportConfigText() const;

private:
    void refreshSnapshot();
    void pushTelemetry();
    std::uint32_t hashRunParams() const;

    SimConfigV1 cfg_{};
    std::unique_ptr<RandomSource> rng_;
    BanditLearner learner_;

    RunState run_state_ = RunState::Stopped;
    bool learner_enabled_ = false;

    Configuration config_{};
    double time_s_ = 0.0;
    double yield_mL_ = 0.0;
    double last_decision_t_s_ = 0.0;
    SuggestionReason last_suggestion_ = SuggestionReason::None;
    std::uint64_t decisions_ = 0;

    // Latest per-tick model outputs
    EnvironmentSample env_{};
    EfficiencyPair eff_{};
    double rate_mL_per_min_ = 0.0;

    Observation obs_{};

    // Telemetry ring buffer (fixed capacity, no dynamic alloc during tick)
    static constexpr int kTelemetryCapacity_ = 4096;
    std::array<TelemetrySample, kTelemetryCapacity_> telemetry_rb_{};
    int telemetry_head_ = 0;   // next write
    int telemetry_count_ = 0;  // number valid
    std::uint32_t telemetry_crc_u32_ = 0;
};

} // namespace solarsynth
