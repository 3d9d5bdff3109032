#include "Quiz.hpp"
#include "Logger.hpp"
#include <cmath>

namespace fretboard {

int Quiz::Score::accuracy_percent() const {
    if (total == 0) return 0;
    return static_cast<int>(std::lround(100.0 * correct / total));
}

Quiz::Quiz(const TrainerConfig& config, TonePlayer& player, PositionSource& positions)
    : config_(config)
    , player_(player)
    , positions_(positions)
    , countdown_(config.quiz.sweat_budget_seconds)
    , sequencer_(player, config_.tuning)
{
    begin_question(false);
}

void Quiz::start_question() {
    begin_question(true);
}

void Quiz::begin_question(bool audible) {
    const Position next = positions_.next();
    validate_position(next);

    position_ = next;
    feedback_.reset();
    phase_ = Phase::Asking;
    advance_wait_ = Micros{0};

    if (mode_ == Mode::Sweat && !sequencer_.active()) {
        countdown_.start(config_.quiz.sweat_budget_seconds);
    }
    if (audible) {
        play_target();
    }
}

PitchClass Quiz::target_pitch() const {
    return note_at(config_.tuning, position_);
}

std::optional<PitchClass> Quiz::revealed_pitch() const {
    if (phase_ == Phase::Asking) return std::nullopt;
    return target_pitch();
}

bool Quiz::guess(std::string_view answer) {
    if (mode_ == Mode::Study || phase_ != Phase::Asking) {
        LOG_DEBUG("Quiz", "Rejected guess: not asking");
        return false;
    }
    if (!parse_pitch_class(answer)) {
        LOG_DEBUG("Quiz", "Rejected guess: unknown pitch name");
        return false;
    }

    countdown_.stop();

    const PitchClass target = target_pitch();
    const bool correct = is_equivalent(answer, pitch_name(target));

    ++score_.total;
    if (correct) ++score_.correct;

    play_target();

    if (correct) {
        feedback_ = Feedback{"Correct!", true};
        phase_ = Phase::Advancing;
        advance_wait_ = Micros{0};
        advance_delay_ = to_micros(mode_ == Mode::Sweat ? config_.quiz.sweat_correct_delay_seconds
                                                        : config_.quiz.correct_delay_seconds);
    } else {
        reveal("Incorrect. That was " + display_name(target));
    }
    return true;
}

bool Quiz::timeout() {
    if (mode_ != Mode::Sweat || phase_ != Phase::Asking) {
        LOG_DEBUG("Quiz", "Rejected timeout: not asking in sweat mode");
        return false;
    }
    if (countdown_.state() != CountdownTimer::State::Expired) {
        LOG_DEBUG("Quiz", "Rejected timeout: countdown has not expired");
        return false;
    }
    countdown_.stop();
    ++score_.total;
    play_target();
    reveal("Time's up! That was " + display_name(target_pitch()));
    return true;
}

void Quiz::reveal(std::string message) {
    feedback_ = Feedback{std::move(message), false};
    phase_ = Phase::Answered;
}

bool Quiz::advance() {
    if (phase_ != Phase::Answered) {
        LOG_DEBUG("Quiz", "Rejected advance: answer not revealed");
        return false;
    }
    countdown_.reset(config_.quiz.sweat_budget_seconds);
    start_question();
    return true;
}

void Quiz::reset() {
    score_ = Score{};
    countdown_.stop();
    countdown_.reset(config_.quiz.sweat_budget_seconds);
    start_question();
}

void Quiz::set_study_mode(bool on) {
    if (on) {
        mode_ = Mode::Study;
        countdown_.stop();
    } else if (mode_ == Mode::Study) {
        mode_ = Mode::Normal;
    }
}

void Quiz::set_sweat_mode(bool on) {
    if (on) {
        mode_ = Mode::Sweat;
        countdown_.reset(config_.quiz.sweat_budget_seconds);
        if (phase_ == Phase::Asking && !sequencer_.active()) {
            countdown_.start(config_.quiz.sweat_budget_seconds);
        }
    } else if (mode_ == Mode::Sweat) {
        mode_ = Mode::Normal;
        countdown_.stop();
    }
}

void Quiz::play_current() {
    play_target();
}

bool Quiz::play_position(const Position& position) {
    validate_position(position);
    if (mode_ != Mode::Study) {
        LOG_DEBUG("Quiz", "Rejected free play outside study mode");
        return false;
    }
    player_.play(frequency(config_.tuning, position));
    return true;
}

bool Quiz::play_melody() {
    if (!sequencer_.play(config_.melody)) {
        return false;
    }
    countdown_.stop();
    if (!sequencer_.active()) {
        resume_after_melody();
    }
    return true;
}

void Quiz::cancel_melody() {
    sequencer_.cancel();
}

void Quiz::tick(double delta_seconds) {
    if (sequencer_.active()) {
        sequencer_.tick(delta_seconds);
        if (!sequencer_.active()) {
            resume_after_melody();
        }
        return;
    }

    if (phase_ == Phase::Advancing) {
        advance_wait_ += to_micros(delta_seconds);
        if (advance_wait_ >= advance_delay_) {
            start_question();
        }
    } else if (phase_ == Phase::Asking && mode_ == Mode::Sweat) {
        if (countdown_.tick(delta_seconds)) {
            timeout();
        }
    }
}

void Quiz::resume_after_melody() {
    if (phase_ == Phase::Asking && mode_ == Mode::Sweat) {
        countdown_.start(config_.quiz.sweat_budget_seconds);
    }
}

void Quiz::play_target() {
    player_.play(frequency(config_.tuning, position_));
}

} // namespace fretboard
