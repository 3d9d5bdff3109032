/**
 * @file OscillatorProcessor.hpp
 * @brief Pitched source with a nominal frequency and a detune in cents.
 */

#ifndef FRETBOARD_OSCILLATOR_PROCESSOR_HPP
#define FRETBOARD_OSCILLATOR_PROCESSOR_HPP

#include "dsp/Processor.hpp"
#include <cmath>

namespace fretboard {

/**
 * @brief Base class for the partial oscillators of a pluck.
 *
 * The effective frequency f * 2^(cents / 1200) is recomputed only when the
 * pitch changes; subclasses refresh their per-sample increment in
 * on_pitch_changed() and produce one sample per next_sample() call.
 */
class OscillatorProcessor : public Processor {
public:
    static constexpr double TWO_PI = 6.28318530717958647692;

    explicit OscillatorProcessor(int sample_rate)
        : sample_rate_(sample_rate)
    {
    }

    void set_frequency(double hz) {
        frequency_ = hz;
        retune();
    }

    void set_detune_cents(double cents) {
        detune_cents_ = cents;
        retune();
    }

    double get_frequency() const { return frequency_; }
    double get_detune_cents() const { return detune_cents_; }
    double get_effective_frequency() const { return effective_frequency_; }
    int sample_rate() const { return sample_rate_; }

    /**
     * @brief Rewind to the start phase; pitch is kept.
     */
    void reset() override {
        restart_phase();
    }

protected:
    /**
     * @return Next sample in [-1.0, 1.0].
     */
    virtual double next_sample() = 0;

    virtual void restart_phase() = 0;

    virtual void on_pitch_changed() = 0;

    void do_pull(std::span<float> output) override {
        for (auto& sample : output) {
            sample = static_cast<float>(next_sample());
        }
    }

    /**
     * @brief Fraction of a cycle advanced per sample.
     */
    double cycles_per_sample() const {
        return sample_rate_ > 0 ? effective_frequency_ / sample_rate_ : 0.0;
    }

    int sample_rate_;

private:
    void retune() {
        effective_frequency_ = detune_cents_ == 0.0
            ? frequency_
            : frequency_ * std::pow(2.0, detune_cents_ / 1200.0);
        on_pitch_changed();
    }

    double frequency_ = 0.0;
    double detune_cents_ = 0.0;
    double effective_frequency_ = 0.0;
};

} // namespace fretboard

#endif // FRETBOARD_OSCILLATOR_PROCESSOR_HPP
