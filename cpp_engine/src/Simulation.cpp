// Simulation.cpp
// Tick-driven controller: environment -> efficiency -> production -> yield,
// then (on whole-second crossings) learner observation, then (on cadence)
// learner decision. Order inside one tick is fixed.

#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>
#include <utility>

namespace solarsynth {

namespace {

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static inline std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t len) {
    static bool table_init = false;
    static std::uint32_t table[256];
    if (!table_init) {
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        table_init = true;
    }
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    std::uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        c = table[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFu;
}

static inline std::uint32_t crc32_add_f32(std::uint32_t crc, float v) {
    std::uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected float size");
    std::memcpy(&bits, &v, sizeof(v));
    return crc32_update(crc, &bits, sizeof(bits));
}

static inline double finiteOr(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

} // namespace

const char* runStateText(RunState s) {
    switch (s) {
        case RunState::Stopped: return "Stopped";
        case RunState::Running: return "Running";
        case RunState::Paused:  return "Paused";
        default: return "Unknown";
    }
}

std::int64_t fixedStepCount(double t_end_s, double dt_s) {
    if (!std::isfinite(dt_s) || dt_s < kMinFixedStep_s) return 0;
    if (!std::isfinite(t_end_s) || t_end_s <= 0.0) return 0;
    const double n = std::floor(t_end_s / dt_s + 1e-9);
    if (!(n >= 0.0) || n > static_cast<double>(kMaxFixedSteps)) return 0;
    return static_cast<std::int64_t>(n);
}

Simulation::Simulation() : Simulation(SimConfigV1{}) {}

Simulation::Simulation(const SimConfigV1& cfg)
    : Simulation(cfg, std::make_unique<Mt19937RandomSource>(cfg.seed_u32)) {}

Simulation::Simulation(const SimConfigV1& cfg, std::unique_ptr<RandomSource> rng)
    : cfg_(cfg),
      rng_(std::move(rng)),
      learner_(cfg.learner) {
    if (!rng_) {
        rng_ = std::make_unique<Mt19937RandomSource>(cfg_.seed_u32);
    }
    cfg_.version_u32 = 1u;
    cfg_.size_bytes_u32 = sizeof(SimConfigV1);
    cfg_.default_config = clampConfiguration(cfg_.default_config);
    cfg_.learner = learner_.config();
    learner_enabled_ = cfg_.learner_enabled;
    reset();
}

void Simulation::start() {
    if (run_state_ == RunState::Stopped || run_state_ == RunState::Paused) {
        run_state_ = RunState::Running;
    }
    refreshSnapshot();
}

void Simulation::pause() {
    if (run_state_ == RunState::Running) {
        run_state_ = RunState::Paused;
    }
    refreshSnapshot();
}

void Simulation::reset() {
    run_state_ = RunState::Stopped;

    time_s_ = 0.0;
    yield_mL_ = 0.0;
    last_decision_t_s_ = 0.0;
    last_suggestion_ = SuggestionReason::None;
    decisions_ = 0;
    config_ = cfg_.default_config;

    learner_.clear();

    telemetry_head_ = 0;
    telemetry_count_ = 0;
    telemetry_crc_u32_ = 0;

    // Deterministic rest snapshot: no random draw, rate reads 0 until the next tick.
    env_ = sampleEnvironment(time_s_);
    eff_ = computeEfficiencies(config_, env_);
    rate_mL_per_min_ = 0.0;

    refreshSnapshot();
}

void Simulation::setConfiguration(const Configuration& c) {
    config_ = clampConfiguration(c);
    refreshSnapshot();
}

void Simulation::setDefaultConfiguration(const Configuration& c) {
    cfg_.default_config = clampConfiguration(c);
}

void Simulation::setEpsilon(double epsilon) {
    learner_.setEpsilon(epsilon);
    cfg_.learner = learner_.config();
    refreshSnapshot();
}

void Simulation::setDecisionCadence_s(double cadence_s) {
    learner_.setDecisionCadence_s(cadence_s);
    cfg_.learner = learner_.config();
    refreshSnapshot();
}

void Simulation::setLearnerEnabled(bool enabled) {
    learner_enabled_ = enabled;
    cfg_.learner_enabled = enabled;
    refreshSnapshot();
}

void Simulation::tick(double dt_s) {
    if (!std::isfinite(dt_s) || dt_s < 0.0) {
        dt_s = 0.0;
    }

    if (!isRunning()) {
        // Display-only refresh at the frozen clock.
        env_ = sampleEnvironment(time_s_);
        eff_ = computeEfficiencies(config_, env_);
        rate_mL_per_min_ = productionRate(env_.lux, eff_.tilt_eff_0_1, eff_.elec_eff_0_1, *rng_);
        refreshSnapshot();
        return;
    }

    // 1) clock
    const double t_prev_s = time_s_;
    time_s_ += dt_s;
    if (!std::isfinite(time_s_) || time_s_ < t_prev_s) time_s_ = t_prev_s;

    // 2) environment -> efficiency -> production -> yield
    env_ = sampleEnvironment(time_s_);
    eff_ = computeEfficiencies(config_, env_);
    rate_mL_per_min_ = productionRate(env_.lux, eff_.tilt_eff_0_1, eff_.elec_eff_0_1, *rng_);
    yield_mL_ = accumulateYield(yield_mL_, rate_mL_per_min_, dt_s);

    // 3) observe once per whole simulated second (edge-triggered)
    if (std::floor(time_s_) != std::floor(t_prev_s)) {
        learner_.record(config_, rate_mL_per_min_);
        pushTelemetry();
    }

    // 4) decide on cadence
    if (learner_enabled_ && (time_s_ - last_decision_t_s_) >= learner_.decisionCadence_s()) {
        const Suggestion s = learner_.suggest(*rng_);
        config_ = clampConfiguration(s.config);
        last_suggestion_ = s.reason;
        last_decision_t_s_ = time_s_;
        ++decisions_;
    }

    // 5) publish
    refreshSnapshot();
}

void Simulation::refreshSnapshot() {
    Observation o;
    o.run_state = run_state_;

    o.t_s = finiteOr(time_s_, 0.0);
    const double whole_s = std::floor(o.t_s);
    // Saturate: minutes must stay representable for very long runs.
    const double minutes = std::min(whole_s / 60.0, static_cast<double>(std::numeric_limits<int>::max()));
    o.elapsed_min = static_cast<int>(minutes);
    o.elapsed_sec = static_cast<int>(std::fmod(whole_s, 60.0));

    o.lux = env_.lux;
    o.sun_angle_deg = env_.sun_angle_deg;
    o.tilt_eff_0_1 = eff_.tilt_eff_0_1;
    o.elec_eff_0_1 = eff_.elec_eff_0_1;
    o.rate_mL_per_min = std::max(0.0, finiteOr(rate_mL_per_min_, 0.0));
    o.yield_mL = std::max(0.0, finiteOr(yield_mL_, 0.0));

    o.tilt_deg = config_.tilt_deg;
    o.electrolyte_pct = config_.electrolyte_pct;

    o.learner_enabled = learner_enabled_;
    o.epsilon = learner_.epsilon();
    o.decision_cadence_s = learner_.decisionCadence_s();
    o.last_decision_t_s = last_decision_t_s_;
    o.last_suggestion = last_suggestion_;
    o.decisions = decisions_;

    o.memory_bins = learner_.binCount();
    o.records = learner_.totalRecords();
    o.best = learner_.best();
    o.best_revision_u32 = learner_.bestRevision();

    obs_ = o;
}

void Simulation::pushTelemetry() {
    TelemetrySample s;
    s.t_s = static_cast<float>(time_s_);
    s.lux = static_cast<float>(env_.lux);
    s.sun_angle_deg = static_cast<float>(env_.sun_angle_deg);
    s.tilt_eff_0_1 = static_cast<float>(eff_.tilt_eff_0_1);
    s.elec_eff_0_1 = static_cast<float>(eff_.elec_eff_0_1);
    s.tilt_deg = static_cast<float>(config_.tilt_deg);
    s.electrolyte_pct = static_cast<float>(config_.electrolyte_pct);
    s.rate_mL_per_min = static_cast<float>(rate_mL_per_min_);
    s.yield_mL = static_cast<float>(yield_mL_);
    s.best_reward_mL_per_min = learner_.best().valid ? static_cast<float>(learner_.best().reward) : 0.0f;

    telemetry_rb_[telemetry_head_] = s;
    telemetry_head_ = (telemetry_head_ + 1) % kTelemetryCapacity_;
    telemetry_count_ = std::min(telemetry_count_ + 1, kTelemetryCapacity_);

    // CRC covers the full stream, not just what the ring still holds.
    std::uint32_t c = telemetry_crc_u32_;
    c = crc32_add_f32(c, s.t_s);
    c = crc32_add_f32(c, s.lux);
    c = crc32_add_f32(c, s.sun_angle_deg);
    c = crc32_add_f32(c, s.tilt_eff_0_1);
    c = crc32_add_f32(c, s.elec_eff_0_1);
    c = crc32_add_f32(c, s.tilt_deg);
    c = crc32_add_f32(c, s.electrolyte_pct);
    c = crc32_add_f32(c, s.rate_mL_per_min);
    c = crc32_add_f32(c, s.yield_mL);
    c = crc32_add_f32(c, s.best_reward_mL_per_min);
    telemetry_crc_u32_ = c;
}

int Simulation::getTelemetrySamples(TelemetrySample* out_ptr, int cap) const {
    if (!out_ptr || cap <= 0) return 0;
    const int n = std::min<int>(telemetry_count_, cap);
    // Oldest sample index = head - count (mod capacity)
    int idx = (telemetry_head_ - telemetry_count_);
    while (idx < 0) idx += kTelemetryCapacity_;
    for (int i = 0; i < n; ++i) {
        out_ptr[i] = telemetry_rb_[(idx + i) % kTelemetryCapacity_];
    }
    return n;
}

std::uint32_t Simulation::hashRunParams() const {
    // Deterministic field hashing (explicit list, fixed order)
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, cfg_.version_u32);
    h = fnv1a32_add_u32(h, cfg_.size_bytes_u32);
    h = fnv1a32_add_f64(h, cfg_.default_config.tilt_deg);
    h = fnv1a32_add_f64(h, cfg_.default_config.electrolyte_pct);
    h = fnv1a32_add_f64(h, cfg_.learner.epsilon);
    h = fnv1a32_add_f64(h, cfg_.learner.decision_cadence_s);
    h = fnv1a32_add_u32(h, cfg_.learner_enabled ? 1u : 0u);
    h = fnv1a32_add_u32(h, cfg_.seed_u32);
    return h;
}

RunSignatures Simulation::getRunSignatures() const {
    RunSignatures sig;
    sig.run_param_hash_u32 = hashRunParams();
    sig.telemetry_crc_u32 = telemetry_crc_u32_;

    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_f64(h, time_s_);
    h = fnv1a32_add_f64(h, yield_mL_);
    h = fnv1a32_add_f64(h, config_.tilt_deg);
    h = fnv1a32_add_f64(h, config_.electrolyte_pct);
    for (const auto& kv : learner_.memory()) {
        h = fnv1a32_add_i32(h, kv.first.tilt_deg);
        h = fnv1a32_add_i32(h, kv.first.electrolyte_tenths);
        h = fnv1a32_add_u32(h, kv.second.sample_count);
        h = fnv1a32_add_f64(h, kv.second.running_average);
    }
    const BestObservation& best = learner_.best();
    h = fnv1a32_add_u32(h, best.valid ? 1u : 0u);
    if (best.valid) {
        h = fnv1a32_add_i32(h, best.bin.tilt_deg);
        h = fnv1a32_add_i32(h, best.bin.electrolyte_tenths);
        h = fnv1a32_add_f64(h, best.reward);
    }
    sig.state_digest_u32 = h;
    return sig;
}

std::string Simulation::exportConfigText() const {
    char buf[1024];
    const int cap = static_cast<int>(sizeof(buf));
    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap) return;
        const int w = std::snprintf(buf + n, static_cast<std::size_t>(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - n);
    };

    app("SimConfigV1.version=%u\n", cfg_.version_u32);
    app("SimConfigV1.size_bytes=%u\n", cfg_.size_bytes_u32);
    app("SimConfigV1.fnv_hash=0x%08X\n", hashRunParams());
    app("default.tilt_deg=%.17g\n", cfg_.default_config.tilt_deg);
    app("default.electrolyte_pct=%.17g\n", cfg_.default_config.electrolyte_pct);
    app("learner.enabled=%u\n", cfg_.learner_enabled ? 1u : 0u);
    app("learner.epsilon=%.17g\n", cfg_.learner.epsilon);
    app("learner.decision_cadence_s=%.17g\n", cfg_.learner.decision_cadence_s);
    app("rng.seed=%u\n", cfg_.seed_u32);
    app("model.day_length_s=%.17g\n", kDayLength_s);
    app("model.rate_per_lux=%.17g\n", kRatePerLux_mL_per_min);
    app("model.rate_noise_half_width=%.17g\n", kRateNoiseHalfWidth_mL_per_min);

    if (n >= cap) n = cap - 1;
    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace solarsynth
