#include "MelodySequencer.hpp"
#include "Logger.hpp"
#include <chrono>

namespace fretboard {

MelodySequencer::MelodySequencer(TonePlayer& player, const Tuning& tuning)
    : player_(player)
    , tuning_(tuning)
{
}

bool MelodySequencer::play(const std::vector<MelodyEntry>& entries) {
    if (state_ != State::Idle) {
        LOG_DEBUG("Melody", "Rejected play: already playing");
        return false;
    }
    for (const auto& entry : entries) {
        validate_position(entry.position);
    }
    if (entries.empty()) {
        return true;
    }

    entries_ = entries;
    state_ = State::Playing;
    LOG_INFO("Melody", "Start (" + std::to_string(entries_.size()) + " notes)");
    begin_entry(0);
    return true;
}

void MelodySequencer::cancel() {
    if (state_ == State::Playing) {
        state_ = State::Cancelling;
        LOG_INFO("Melody", "Cancel requested");
    }
}

void MelodySequencer::tick(double delta_seconds) {
    if (state_ == State::Idle) return;

    waited_ += to_micros(delta_seconds);
    while (state_ != State::Idle) {
        const Micros duration = std::chrono::milliseconds(entries_[index_].duration_ms);
        if (waited_ < duration) break;
        waited_ -= duration;
        resume();
    }
}

void MelodySequencer::begin_entry(size_t index) {
    index_ = index;
    waited_ = Micros{0};
    const Position& position = entries_[index_].position;
    now_sounding_ = position;
    player_.play(frequency(tuning_, position));
}

void MelodySequencer::resume() {
    if (state_ == State::Cancelling) {
        LOG_INFO("Melody", "Cancelled before note " + std::to_string(index_ + 1));
        finish();
        return;
    }
    if (index_ + 1 >= entries_.size()) {
        LOG_INFO("Melody", "Finished");
        finish();
        return;
    }
    const Micros carry = waited_;
    begin_entry(index_ + 1);
    waited_ = carry;
}

void MelodySequencer::finish() {
    now_sounding_.reset();
    entries_.clear();
    index_ = 0;
    waited_ = Micros{0};
    state_ = State::Idle;
}

} // namespace fretboard
