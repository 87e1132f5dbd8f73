#pragma once

#include <algorithm>
#include <chrono>

namespace skybridge {

// Bounded exponential backoff: initial, 2x, 4x ... capped at max.
class ReconnectBackoff {
public:
    ReconnectBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
        : initial_(initial), max_(std::max(initial, max)), next_(initial) {}

    // Delay to wait before the next attempt; advances the schedule.
    std::chrono::milliseconds next() {
        auto d = next_;
        next_ = std::min(next_ * 2, max_);
        return d;
    }

    void reset() { next_ = initial_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds next_;
};

} // namespace skybridge
