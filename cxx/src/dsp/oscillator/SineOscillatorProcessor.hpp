/**
 * @file SineOscillatorProcessor.hpp
 * @brief Sine overtone generated by rotating a unit phasor.
 */

#ifndef FRETBOARD_SINE_OSCILLATOR_PROCESSOR_HPP
#define FRETBOARD_SINE_OSCILLATOR_PROCESSOR_HPP

#include "OscillatorProcessor.hpp"
#include <cmath>

namespace fretboard {

/**
 * @brief Sine partial of a pluck.
 *
 * The phasor (re, im) is multiplied by a fixed rotation each sample, so no
 * sin() is evaluated in the audio loop. Its length is pulled back to 1 every
 * RENORMALIZE_EVERY samples; a pluck lasts 1.5 s, well inside the drift a
 * double can take between renormalizations.
 */
class SineOscillatorProcessor : public OscillatorProcessor {
public:
    explicit SineOscillatorProcessor(int sample_rate)
        : OscillatorProcessor(sample_rate)
    {
    }

protected:
    static constexpr int RENORMALIZE_EVERY = 1024;

    void restart_phase() override {
        re_ = 1.0;
        im_ = 0.0;
        since_renormalize_ = 0;
    }

    void on_pitch_changed() override {
        const double step = TWO_PI * cycles_per_sample();
        rot_re_ = std::cos(step);
        rot_im_ = std::sin(step);
    }

    double next_sample() override {
        const double out = im_;

        const double re = re_ * rot_re_ - im_ * rot_im_;
        im_ = re_ * rot_im_ + im_ * rot_re_;
        re_ = re;

        if (++since_renormalize_ == RENORMALIZE_EVERY) {
            const double length = std::hypot(re_, im_);
            re_ /= length;
            im_ /= length;
            since_renormalize_ = 0;
        }
        return out;
    }

private:
    double re_ = 1.0;
    double im_ = 0.0;   // sin(phase)
    double rot_re_ = 1.0;
    double rot_im_ = 0.0;
    int since_renormalize_ = 0;
};

} // namespace fretboard

#endif // FRETBOARD_SINE_OSCILLATOR_PROCESSOR_HPP
