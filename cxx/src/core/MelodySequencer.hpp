/**
 * @file MelodySequencer.hpp
 * @brief Plays a finite playlist one tone at a time under cooperative ticks.
 */

#ifndef FRETBOARD_MELODY_SEQUENCER_HPP
#define FRETBOARD_MELODY_SEQUENCER_HPP

#include "Clock.hpp"
#include "PitchModel.hpp"
#include "TonePlayer.hpp"
#include "TrainerConfig.hpp"
#include <optional>
#include <vector>

namespace fretboard {

/**
 * @brief Explicit state machine in place of a suspended playback loop.
 *
 * play() sounds entry 0 and waits. Each tick() consumes wait time; when the
 * current entry's duration has elapsed the sequencer resumes: it checks the
 * cancellation token and either stops or sounds the next entry. A tone is
 * never cut short and playback cannot be paused, only cancelled.
 */
class MelodySequencer {
public:
    enum class State {
        Idle,
        Playing,
        Cancelling
    };

    MelodySequencer(TonePlayer& player, const Tuning& tuning);

    /**
     * @brief Start from the first entry.
     *
     * @return false, doing nothing, while a previous run still holds the
     *         playback token (Playing or Cancelling).
     * @throws std::out_of_range if an entry lies off the fretboard.
     */
    bool play(const std::vector<MelodyEntry>& entries);

    /**
     * @brief Request an early stop, honoured before the next entry begins.
     */
    void cancel();

    void tick(double delta_seconds);

    State state() const { return state_; }
    bool active() const { return state_ != State::Idle; }

    /**
     * @brief The entry currently sounding, for display.
     */
    std::optional<Position> now_sounding() const { return now_sounding_; }

    /**
     * @brief Index of the entry currently sounding.
     */
    size_t index() const { return index_; }

private:
    void begin_entry(size_t index);
    void resume();
    void finish();

    TonePlayer& player_;
    const Tuning& tuning_;
    State state_ = State::Idle;
    std::vector<MelodyEntry> entries_;
    size_t index_ = 0;
    Micros waited_{0};
    std::optional<Position> now_sounding_;
};

} // namespace fretboard

#endif // FRETBOARD_MELODY_SEQUENCER_HPP
