/**
 * @file PluckTone.hpp
 * @brief One plucked note: a stack of enveloped harmonics into a master gain.
 */

#ifndef FRETBOARD_PLUCK_TONE_HPP
#define FRETBOARD_PLUCK_TONE_HPP

#include "Processor.hpp"
#include "envelope/PluckEnvelopeProcessor.hpp"
#include "oscillator/OscillatorProcessor.hpp"
#include "core/TrainerConfig.hpp"
#include <array>
#include <memory>

namespace fretboard {

/**
 * @brief Self-contained processor graph for a single play() call.
 *
 * Partial n (1-based) runs at n x the fundamental with its own detune and
 * its own pluck envelope peaking at harmonic_gains[n-1]. The fundamental is
 * a triangle, the overtones are sines. The sum passes through the master
 * gain. Nothing is shared between tones, so any number may overlap.
 */
class PluckTone : public Processor {
public:
    static constexpr int NUM_PARTIALS = ToneSettings::NUM_PARTIALS;
    static constexpr size_t MAX_BLOCK_SIZE = 1024;

    /**
     * @param detune_cents Per-partial detune, already randomized by the caller.
     */
    PluckTone(int sample_rate, double frequency_hz, const ToneSettings& settings,
              const std::array<double, NUM_PARTIALS>& detune_cents);

    /**
     * @brief True once every partial has reached the end of the decay window.
     */
    bool is_finished() const;

    double frequency() const { return frequency_; }
    long length_samples() const { return length_samples_; }
    long rendered_samples() const { return rendered_samples_; }

    const OscillatorProcessor& partial_oscillator(int index) const { return *partials_[index].oscillator; }
    const PluckEnvelopeProcessor& partial_envelope(int index) const { return *partials_[index].envelope; }

    /**
     * @brief Start every envelope from zero again.
     */
    void reset() override;

protected:
    void do_pull(std::span<float> output) override;

private:
    struct Partial {
        std::unique_ptr<OscillatorProcessor> oscillator;
        std::unique_ptr<PluckEnvelopeProcessor> envelope;
    };

    void render_block(std::span<float> output);

    double frequency_;
    float master_gain_;
    std::array<Partial, NUM_PARTIALS> partials_;
    long length_samples_;
    long rendered_samples_ = 0;
};

} // namespace fretboard

#endif // FRETBOARD_PLUCK_TONE_HPP
