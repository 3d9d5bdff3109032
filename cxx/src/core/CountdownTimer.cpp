#include "CountdownTimer.hpp"

namespace fretboard {

CountdownTimer::CountdownTimer(double budget_seconds)
    : state_(State::Idle)
    , remaining_(to_micros(budget_seconds))
{
}

void CountdownTimer::start(double budget_seconds) {
    remaining_ = to_micros(budget_seconds);
    state_ = State::Running;
}

bool CountdownTimer::tick(double delta_seconds) {
    if (state_ != State::Running) return false;

    remaining_ -= to_micros(delta_seconds);
    if (remaining_ <= Micros{0}) {
        remaining_ = Micros{0};
        state_ = State::Expired;
        return true;
    }
    return false;
}

void CountdownTimer::stop() {
    state_ = State::Idle;
}

void CountdownTimer::reset(double budget_seconds) {
    state_ = State::Idle;
    remaining_ = to_micros(budget_seconds);
}

} // namespace fretboard
