/**
 * @file TriangleOscillatorProcessor.hpp
 * @brief Triangle fundamental of a pluck.
 */

#ifndef FRETBOARD_TRIANGLE_OSCILLATOR_PROCESSOR_HPP
#define FRETBOARD_TRIANGLE_OSCILLATOR_PROCESSOR_HPP

#include "OscillatorProcessor.hpp"
#include <cmath>

namespace fretboard {

/**
 * @brief Naive triangle from a phase accumulator in [0, 1).
 *
 * Harmonics of a triangle fall off at 1/n^2, so aliasing stays inaudible at
 * guitar pitches without band limiting. Phase 0.25 maps to 0 on a rising
 * slope, so the fundamental starts in step with the sine overtones.
 */
class TriangleOscillatorProcessor : public OscillatorProcessor {
public:
    explicit TriangleOscillatorProcessor(int sample_rate)
        : OscillatorProcessor(sample_rate)
    {
    }

protected:
    static constexpr double START_PHASE = 0.25;

    void restart_phase() override {
        phase_ = START_PHASE;
    }

    void on_pitch_changed() override {
        increment_ = cycles_per_sample();
    }

    double next_sample() override {
        // -1 at p=0, +1 at p=0.5
        const double out = 1.0 - std::abs(4.0 * phase_ - 2.0);

        phase_ += increment_;
        phase_ -= std::floor(phase_);
        return out;
    }

private:
    double phase_ = START_PHASE;
    double increment_ = 0.0;
};

} // namespace fretboard

#endif // FRETBOARD_TRIANGLE_OSCILLATOR_PROCESSOR_HPP
