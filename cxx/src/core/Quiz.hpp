/**
 * @file Quiz.hpp
 * @brief Timed note-naming quiz with study and sweat modes.
 */

#ifndef FRETBOARD_QUIZ_HPP
#define FRETBOARD_QUIZ_HPP

#include "Clock.hpp"
#include "CountdownTimer.hpp"
#include "MelodySequencer.hpp"
#include "PitchModel.hpp"
#include "PositionSource.hpp"
#include "TonePlayer.hpp"
#include "TrainerConfig.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace fretboard {

/**
 * @brief Owns the quiz target, score, feedback and mode.
 *
 * Every transition runs to completion on the caller's thread. Time enters
 * only through tick(), which drives the sweat-mode countdown, the pending
 * auto-advance after a correct answer and the melody sequencer. Transitions
 * that do not apply to the current phase are rejected by returning false.
 */
class Quiz {
public:
    enum class Phase {
        Asking,     ///< Waiting for a guess
        Advancing,  ///< Correct answer shown, next question pending
        Answered    ///< Wrong answer or timeout revealed, waiting for advance()
    };

    enum class Mode {
        Normal,
        Study,
        Sweat
    };

    struct Score {
        unsigned int correct = 0;
        unsigned int total = 0;

        int accuracy_percent() const;
        bool operator==(const Score& other) const = default;
    };

    struct Feedback {
        std::string message;
        bool correct = false;
    };

    /**
     * @brief Draws the first target silently; no tone before user input.
     */
    Quiz(const TrainerConfig& config, TonePlayer& player, PositionSource& positions);

    Quiz(const Quiz&) = delete;
    Quiz& operator=(const Quiz&) = delete;

    /**
     * @brief New random target, feedback cleared, countdown restarted in sweat mode.
     */
    void start_question();

    bool guess(std::string_view answer);

    /**
     * @brief Automatic wrong answer when the sweat countdown expires.
     */
    bool timeout();

    /**
     * @brief Answered -> Asking with a fresh target.
     */
    bool advance();

    /**
     * @brief Zero the score and start over from any phase.
     */
    void reset();

    void set_study_mode(bool on);
    void set_sweat_mode(bool on);
    void toggle_study_mode() { set_study_mode(mode_ != Mode::Study); }
    void toggle_sweat_mode() { set_sweat_mode(mode_ != Mode::Sweat); }

    /**
     * @brief Replay the current target.
     */
    void play_current();

    /**
     * @brief Sound any position; allowed in study mode only and never scored.
     * @throws std::out_of_range for a position off the fretboard.
     */
    bool play_position(const Position& position);

    /**
     * @brief Start the configured melody; stops the countdown while it plays.
     */
    bool play_melody();
    void cancel_melody();

    void tick(double delta_seconds);

    Position position() const { return position_; }
    PitchClass target_pitch() const;

    /**
     * @brief The target's pitch class, only once it is revealed.
     */
    std::optional<PitchClass> revealed_pitch() const;

    const Score& score() const { return score_; }
    const std::optional<Feedback>& feedback() const { return feedback_; }
    Phase phase() const { return phase_; }
    Mode mode() const { return mode_; }
    double time_remaining() const { return countdown_.remaining(); }
    bool countdown_running() const { return countdown_.running(); }
    std::optional<Position> now_sounding() const { return sequencer_.now_sounding(); }
    bool melody_playing() const { return sequencer_.active(); }
    const TrainerConfig& config() const { return config_; }

private:
    void begin_question(bool audible);
    void reveal(std::string message);
    void play_target();
    void resume_after_melody();

    const TrainerConfig config_;
    TonePlayer& player_;
    PositionSource& positions_;
    CountdownTimer countdown_;
    MelodySequencer sequencer_;

    Position position_;
    Score score_;
    std::optional<Feedback> feedback_;
    Phase phase_ = Phase::Asking;
    Mode mode_ = Mode::Normal;
    Micros advance_wait_{0};
    Micros advance_delay_{0};
};

} // namespace fretboard

#endif // FRETBOARD_QUIZ_HPP
