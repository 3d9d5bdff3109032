/**
 * @file PluckEnvelopeProcessor.hpp
 * @brief Linear attack, exponential decay envelope of a plucked string.
 */

#ifndef FRETBOARD_PLUCK_ENVELOPE_PROCESSOR_HPP
#define FRETBOARD_PLUCK_ENVELOPE_PROCESSOR_HPP

#include "EnvelopeProcessor.hpp"
#include <algorithm>
#include <cmath>

namespace fretboard {

/**
 * @brief Pluck Envelope Processor.
 *
 * From gate_on: 0 -> peak linearly over the attack, then an exponential ramp
 * from peak toward the floor that would reach it exactly at the end of the
 * decay window. The window end stops the envelope (output 0, Idle), so the
 * floor itself is never sounded. Gate off is ignored; a pluck always rings out.
 */
class PluckEnvelopeProcessor : public EnvelopeProcessor {
public:
    enum class State {
        Idle,
        Attack,
        Decay
    };

    /**
     * @param peak Level reached at the end of the attack.
     * @param attack_seconds Linear rise time.
     * @param window_seconds Time from onset to stop, attack included.
     * @param floor Exponential ramp target at the window end.
     */
    PluckEnvelopeProcessor(int sample_rate, float peak, double attack_seconds, double window_seconds, float floor)
        : sample_rate_(sample_rate)
        , state_(State::Idle)
        , peak_(peak)
        , floor_(floor)
        , current_level_(0.0f)
        , samples_left_(0)
    {
        attack_samples_ = std::max<long>(1, std::lround(attack_seconds * sample_rate_));
        const long window_samples = std::lround(window_seconds * sample_rate_);
        decay_samples_ = std::max<long>(1, window_samples - attack_samples_);
        attack_step_ = peak_ / static_cast<float>(attack_samples_);
        decay_ratio_ = std::pow(static_cast<double>(floor_) / peak_, 1.0 / static_cast<double>(decay_samples_));
    }

    void gate_on() override {
        state_ = State::Attack;
        current_level_ = 0.0f;
        samples_left_ = attack_samples_;
    }

    void gate_off() override {
    }

    bool is_active() const override {
        return state_ != State::Idle;
    }

    void reset() override {
        state_ = State::Idle;
        current_level_ = 0.0f;
        samples_left_ = 0;
    }

    State state() const { return state_; }
    float peak() const { return peak_; }

    /**
     * @brief Samples from gate_on until the envelope goes Idle.
     */
    long length_samples() const { return attack_samples_ + decay_samples_; }

protected:
    void do_pull(std::span<float> output) override {
        for (auto& sample : output) {
            sample = process_sample();
        }
    }

private:
    float process_sample() {
        switch (state_) {
            case State::Attack:
                current_level_ += attack_step_;
                if (--samples_left_ <= 0) {
                    current_level_ = peak_;
                    decay_level_ = peak_;
                    state_ = State::Decay;
                    samples_left_ = decay_samples_;
                }
                break;

            case State::Decay:
                decay_level_ *= decay_ratio_;
                current_level_ = static_cast<float>(decay_level_);
                if (--samples_left_ <= 0) {
                    current_level_ = 0.0f;
                    state_ = State::Idle;
                }
                break;

            case State::Idle:
                current_level_ = 0.0f;
                break;
        }
        return current_level_;
    }

    int sample_rate_;
    State state_;
    float peak_;
    float floor_;
    float current_level_;
    double decay_level_ = 0.0;
    long samples_left_;
    long attack_samples_;
    long decay_samples_;
    float attack_step_;
    double decay_ratio_;
};

} // namespace fretboard

#endif // FRETBOARD_PLUCK_ENVELOPE_PROCESSOR_HPP
