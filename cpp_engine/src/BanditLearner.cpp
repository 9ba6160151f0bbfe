#include "BanditLearner.h"

#include <algorithm>
#include <cmath>

namespace solarsynth {

namespace {

static inline double clampFinite(double v, double lo, double hi, double fallback) {
    if (!std::isfinite(v)) return fallback;
    return std::clamp(v, lo, hi);
}

} // namespace

bool Bin::inDomain() const {
    return tilt_deg >= 0 && tilt_deg <= static_cast<int>(kTiltMax_deg) &&
           (tilt_deg % kTiltStep_deg) == 0 &&
           electrolyte_tenths >= 0 && electrolyte_tenths < kElectrolyteBinCount;
}

Bin discretize(const Configuration& c) {
    const Configuration cc = clampConfiguration(c);

    Bin b;
    b.tilt_deg = static_cast<int>(std::lround(cc.tilt_deg / kTiltStep_deg)) * kTiltStep_deg;
    b.electrolyte_tenths = static_cast<int>(std::lround(cc.electrolyte_pct * 10.0));

    return b;
}

const char* suggestionReasonText(SuggestionReason r) {
    switch (r) {
        case SuggestionReason::Explore: return "explore";
        case SuggestionReason::Exploit: return "exploit";
        default: return "none";
    }
}

BanditLearner::BanditLearner() = default;

BanditLearner::BanditLearner(const LearnerConfig& cfg) {
    setConfig(cfg);
}

void BanditLearner::setEpsilon(double epsilon) {
    cfg_.epsilon = clampFinite(epsilon, 0.0, 1.0, cfg_.epsilon);
}

void BanditLearner::setDecisionCadence_s(double cadence_s) {
    cfg_.decision_cadence_s = clampFinite(cadence_s, kCadenceMin_s, kCadenceMax_s, cfg_.decision_cadence_s);
}

void BanditLearner::setConfig(const LearnerConfig& cfg) {
    setEpsilon(cfg.epsilon);
    setDecisionCadence_s(cfg.decision_cadence_s);
}

void BanditLearner::record(const Configuration& config, double raw_reward) {
    if (!std::isfinite(raw_reward)) return;

    const Bin b = discretize(config);
    RewardRecord& rec = memory_[b];

    // Incremental mean: no raw history retained.
    const double n1 = static_cast<double>(rec.sample_count) + 1.0;
    rec.running_average += (raw_reward - rec.running_average) / n1;
    rec.sample_count += 1;
    ++total_records_;

    // Strict: ties keep the earlier best.
    if (!best_.valid || raw_reward > best_.reward) {
        best_.valid = true;
        best_.bin = b;
        best_.reward = raw_reward;
        ++best_revision_u32_;
    }
}

Suggestion BanditLearner::suggest(RandomSource& rng) const {
    const double u = rng.uniform01();
    if (memory_.empty() || u < cfg_.epsilon) {
        return explore(rng);
    }
    return exploit();
}

Suggestion BanditLearner::explore(RandomSource& rng) const {
    // Integer steps: every bin exactly equally likely, never out of domain.
    Bin b;
    b.tilt_deg = std::clamp(rng.uniformInt(0, kTiltBinCount - 1), 0, kTiltBinCount - 1) * kTiltStep_deg;
    b.electrolyte_tenths = std::clamp(rng.uniformInt(0, kElectrolyteBinCount - 1), 0, kElectrolyteBinCount - 1);

    Suggestion s;
    s.bin = b;
    s.config = b.toConfiguration();
    s.reason = SuggestionReason::Explore;
    return s;
}

Suggestion BanditLearner::exploit() const {
    // memory_ iterates in ascending (tilt, electrolyte); strict '>' keeps the
    // first, i.e. lexicographically smallest, bin among equal averages.
    auto best_it = memory_.begin();
    for (auto it = memory_.begin(); it != memory_.end(); ++it) {
        if (it->second.running_average > best_it->second.running_average) {
            best_it = it;
        }
    }

    Suggestion s;
    s.bin = best_it->first;
    s.config = s.bin.toConfiguration();
    s.reason = SuggestionReason::Exploit;
    return s;
}

const RewardRecord* BanditLearner::find(const Bin& b) const {
    const auto it = memory_.find(b);
    return (it != memory_.end()) ? &it->second : nullptr;
}

void BanditLearner::clear() {
    memory_.clear();
    total_records_ = 0;
    if (best_.valid) {
        ++best_revision_u32_;
    }
    best_ = BestObservation{};
}

} // namespace solarsynth
