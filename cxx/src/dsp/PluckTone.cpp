#include "PluckTone.hpp"
#include "oscillator/SineOscillatorProcessor.hpp"
#include "oscillator/TriangleOscillatorProcessor.hpp"
#include <algorithm>

namespace fretboard {

PluckTone::PluckTone(int sample_rate, double frequency_hz, const ToneSettings& settings,
                     const std::array<double, NUM_PARTIALS>& detune_cents)
    : frequency_(frequency_hz)
    , master_gain_(static_cast<float>(settings.master_gain))
    , length_samples_(0)
{
    for (int i = 0; i < NUM_PARTIALS; ++i) {
        auto& partial = partials_[i];
        if (i == 0) {
            partial.oscillator = std::make_unique<TriangleOscillatorProcessor>(sample_rate);
        } else {
            partial.oscillator = std::make_unique<SineOscillatorProcessor>(sample_rate);
        }
        partial.oscillator->set_frequency(frequency_hz * (i + 1));
        partial.oscillator->set_detune_cents(detune_cents[i]);
        partial.oscillator->reset();

        partial.envelope = std::make_unique<PluckEnvelopeProcessor>(
            sample_rate,
            static_cast<float>(settings.harmonic_gains[i]),
            settings.attack_seconds,
            settings.decay_seconds,
            static_cast<float>(settings.decay_floor));
        partial.envelope->gate_on();
        length_samples_ = std::max(length_samples_, partial.envelope->length_samples());
    }
}

bool PluckTone::is_finished() const {
    return std::none_of(partials_.begin(), partials_.end(),
                        [](const Partial& p) { return p.envelope->is_active(); });
}

void PluckTone::reset() {
    for (auto& partial : partials_) {
        partial.oscillator->reset();
        partial.envelope->reset();
        partial.envelope->gate_on();
    }
    rendered_samples_ = 0;
}

void PluckTone::do_pull(std::span<float> output) {
    // Scratch buffers are fixed; long blocks are rendered in chunks.
    for (size_t offset = 0; offset < output.size(); offset += MAX_BLOCK_SIZE) {
        const size_t frames = std::min(MAX_BLOCK_SIZE, output.size() - offset);
        render_block(output.subspan(offset, frames));
    }
}

void PluckTone::render_block(std::span<float> output) {
    std::fill(output.begin(), output.end(), 0.0f);
    if (is_finished()) {
        return;
    }

    float osc_scratch[MAX_BLOCK_SIZE];
    float env_scratch[MAX_BLOCK_SIZE];
    const size_t frames = output.size();
    std::span<float> osc_span(osc_scratch, frames);
    std::span<float> env_span(env_scratch, frames);

    for (auto& partial : partials_) {
        if (!partial.envelope->is_active()) continue;
        partial.oscillator->pull(osc_span);
        partial.envelope->pull(env_span);
        for (size_t i = 0; i < frames; ++i) {
            output[i] += osc_scratch[i] * env_scratch[i];
        }
    }

    for (float& sample : output) {
        sample *= master_gain_;
    }
    rendered_samples_ += static_cast<long>(frames);
}

} // namespace fretboard
