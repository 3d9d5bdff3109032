#include "ToneSynthesizer.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace fretboard {

ToneSynthesizer::ToneSynthesizer(std::unique_ptr<AudioOutput> output, const ToneSettings& settings, uint32_t seed)
    : output_(std::move(output))
    , settings_(settings)
    , rng_(seed)
{
}

bool ToneSynthesizer::ensure_device() {
    switch (device_state_) {
        case DeviceState::Ready:
            return true;
        case DeviceState::Unavailable:
            return false;
        case DeviceState::Unacquired:
            break;
    }

    if (output_ && output_->open()) {
        device_state_ = DeviceState::Ready;
        LOG_INFO("Synth", "Audio output ready at " + std::to_string(output_->sample_rate()) + " Hz");
        return true;
    }
    device_state_ = DeviceState::Unavailable;
    LOG_WARN("Synth", "Audio unavailable; continuing silently");
    return false;
}

std::array<double, ToneSettings::NUM_PARTIALS> ToneSynthesizer::draw_detune() {
    const double half = settings_.detune_spread_cents / 2.0;
    std::uniform_real_distribution<double> dist(-half, half);
    std::array<double, ToneSettings::NUM_PARTIALS> cents{};
    for (auto& c : cents) {
        c = half > 0.0 ? dist(rng_) : 0.0;
    }
    return cents;
}

void ToneSynthesizer::play(double frequency_hz) {
    if (!std::isfinite(frequency_hz) || frequency_hz <= 0.0) {
        throw std::invalid_argument("Tone frequency must be positive: " + std::to_string(frequency_hz));
    }
    if (!ensure_device()) {
        return;
    }

    const auto detune = draw_detune();
    auto tone = std::make_shared<PluckTone>(output_->sample_rate(), frequency_hz, settings_, detune);
    output_->schedule(std::move(tone), output_->current_frame());
    ++tones_started_;
}

} // namespace fretboard
