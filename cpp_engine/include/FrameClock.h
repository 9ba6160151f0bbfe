#pragma once

#include <cmath>

namespace solarsynth {

// Turns successive wall-clock readings (seconds) into per-tick deltas.
// The first reading after construction or reset() yields 0 so a driver that
// starts late does not inject a large startup jump. Readings that go
// backwards or are non-finite also yield 0.
class FrameClock {
public:
    double advance(double now_s) {
        if (!std::isfinite(now_s)) return 0.0;
        if (!primed_) {
            primed_ = true;
            last_s_ = now_s;
            return 0.0;
        }
        double dt = now_s - last_s_;
        last_s_ = now_s;
        if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;
        return dt;
    }

    void reset() {
        primed_ = false;
        last_s_ = 0.0;
    }

    bool primed() const noexcept { return primed_; }

private:
    bool primed_ = false;
    double last_s_ = 0.0;
};

} // namespace solarsynth
