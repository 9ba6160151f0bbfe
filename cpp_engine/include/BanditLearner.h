#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>

#include "Efficiency.h"
#include "Production.h"

namespace solarsynth {

// ============================================================
// Discretized configuration space
//
// Tilt in 5 degree steps over [0,60]  -> 13 values.
// Electrolyte in 0.1 % steps over [0,2] -> 21 values.
// Bins are stored as integer steps so equality and ordering are exact.
// ============================================================
constexpr int kTiltStep_deg = 5;
constexpr int kTiltBinCount = 13;
constexpr int kElectrolyteBinCount = 21;
constexpr int kBinCount = kTiltBinCount * kElectrolyteBinCount;

struct Bin {
    int tilt_deg = 0;                   // multiple of 5 in [0, 60]
    int electrolyte_tenths = 0;         // [0, 20], i.e. 0.0 .. 2.0 %

    double tiltDeg() const { return static_cast<double>(tilt_deg); }
    double electrolytePct() const { return static_cast<double>(electrolyte_tenths) / 10.0; }
    Configuration toConfiguration() const { return Configuration{tiltDeg(), electrolytePct()}; }

    // Diagnostics only; the learner itself keys on (tilt, electrolyte).
    // Dense index in [0, kBinCount), tilt-major.
    int index() const { return (tilt_deg / kTiltStep_deg) * kElectrolyteBinCount + electrolyte_tenths; }
    // True for every Bin produced by discretize() or exploration.
    bool inDomain() const;
};

inline bool operator==(const Bin& a, const Bin& b) {
    return a.tilt_deg == b.tilt_deg && a.electrolyte_tenths == b.electrolyte_tenths;
}
inline bool operator!=(const Bin& a, const Bin& b) { return !(a == b); }

// Lexicographic (tilt ascending, electrolyte ascending). This is also the
// exploit tie-break order.
inline bool operator<(const Bin& a, const Bin& b) {
    if (a.tilt_deg != b.tilt_deg) return a.tilt_deg < b.tilt_deg;
    return a.electrolyte_tenths < b.electrolyte_tenths;
}

// Total and idempotent: clamps, then rounds to the nearest step.
Bin discretize(const Configuration& c);

struct RewardRecord {
    std::uint32_t sample_count = 0;
    double running_average = 0.0;
};

// Best single raw reward ever recorded (not the best bin average).
struct BestObservation {
    bool valid = false;
    Bin bin{};
    double reward = -std::numeric_limits<double>::infinity();
};

struct LearnerConfig {
    double epsilon = 0.2;               // [0, 1]
    double decision_cadence_s = 5.0;    // [2, 30]
};

constexpr double kCadenceMin_s = 2.0;
constexpr double kCadenceMax_s = 30.0;

enum class SuggestionReason : int {
    None    = 0,
    Explore = 1,
    Exploit = 2,
};

struct Suggestion {
    Configuration config{};
    Bin bin{};
    SuggestionReason reason = SuggestionReason::None;
};

const char* suggestionReasonText(SuggestionReason r);

// Epsilon-greedy learner over the discretized configuration space.
// Cadence is stored here for the controller; gating is not done here.
class BanditLearner {
public:
    BanditLearner();
    explicit BanditLearner(const LearnerConfig& cfg);

    // Incremental mean update of the configuration's bin + best tracking.
    // Non-finite rewards are ignored.
    void record(const Configuration& config, double raw_reward);

    // Explore with probability epsilon (or when memory is empty), else exploit.
    Suggestion suggest(RandomSource& rng) const;

    // Drops memory and best observation. Settings are kept.
    void clear();

    void setEpsilon(double epsilon);
    void setDecisionCadence_s(double cadence_s);
    void setConfig(const LearnerConfig& cfg);

    double epsilon() const noexcept { return cfg_.epsilon; }
    double decisionCadence_s() const noexcept { return cfg_.decision_cadence_s; }
    const LearnerConfig& config() const noexcept { return cfg_; }

    const std::map<Bin, RewardRecord>& memory() const noexcept { return memory_; }
    bool empty() const noexcept { return memory_.empty(); }
    std::size_t binCount() const noexcept { return memory_.size(); }
    std::uint64_t totalRecords() const noexcept { return total_records_; }

    // Returns nullptr when the bin has never been recorded.
    const RewardRecord* find(const Bin& b) const;

    const BestObservation& best() const noexcept { return best_; }
    // Increments every time the best observation changes (incl. clear()).
    std::uint32_t bestRevision() const noexcept { return best_revision_u32_; }

private:
    Suggestion explore(RandomSource& rng) const;
    Suggestion exploit() const;

    LearnerConfig cfg_{};
    std::map<Bin, RewardRecord> memory_{};
    BestObservation best_{};
    std::uint32_t best_revision_u32_ = 0;
    std::uint64_t total_records_ = 0;
};

} // namespace solarsynth
