/**
 * @file CountdownTimer.hpp
 * @brief Cooperative countdown driven by explicit ticks.
 */

#ifndef FRETBOARD_COUNTDOWN_TIMER_HPP
#define FRETBOARD_COUNTDOWN_TIMER_HPP

#include "Clock.hpp"

namespace fretboard {

/**
 * @brief Counts a fixed budget down to zero and signals expiry exactly once.
 *
 * The timer never reads a clock. A scheduler calls tick() at a fixed
 * granularity (100 ms in the trainer); tests call it directly.
 */
class CountdownTimer {
public:
    enum class State {
        Idle,
        Running,
        Expired
    };

    explicit CountdownTimer(double budget_seconds = 5.0);

    /**
     * @brief Idle/Running -> Running(budget).
     */
    void start(double budget_seconds);

    /**
     * @brief Subtract delta from the remaining time.
     *
     * @return true only on the tick that reaches zero. Ticks outside the
     *         Running state do nothing.
     */
    bool tick(double delta_seconds);

    /**
     * @brief Any state -> Idle. Remaining time is kept for display.
     */
    void stop();

    /**
     * @brief Stop and refill the remaining time without running.
     */
    void reset(double budget_seconds);

    State state() const { return state_; }
    bool running() const { return state_ == State::Running; }
    double remaining() const { return to_seconds(remaining_); }

private:
    State state_;
    Micros remaining_;
};

} // namespace fretboard

#endif // FRETBOARD_COUNTDOWN_TIMER_HPP
