#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>

namespace fretboard {

using Micros = std::chrono::microseconds;

/**
 * @brief Longest delta a single tick may carry; larger ones are clamped.
 */
constexpr double MAX_TICK_SECONDS = 24.0 * 60.0 * 60.0;

/**
 * @brief Convert a tick delta in seconds to whole microseconds.
 *
 * Countdown and sequencer bookkeeping is integral so that fifty 0.1 s ticks
 * land exactly on zero. Negative and NaN deltas count as zero.
 */
inline Micros to_micros(double seconds) {
    if (!(seconds > 0.0)) return Micros{0};
    seconds = std::min(seconds, MAX_TICK_SECONDS);
    return Micros{static_cast<Micros::rep>(std::llround(seconds * 1e6))};
}

inline double to_seconds(Micros us) {
    return static_cast<double>(us.count()) / 1e6;
}

/**
 * @brief Seconds since construction on the monotonic clock; drives tick().
 */
class SteadyClock {
public:
    SteadyClock() : t0_(std::chrono::steady_clock::now()) {}

    double now_seconds() const {
        using namespace std::chrono;
        return duration<double>(steady_clock::now() - t0_).count();
    }

private:
    std::chrono::steady_clock::time_point t0_;
};

} // namespace fretboard
