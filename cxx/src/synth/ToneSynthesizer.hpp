/**
 * @file ToneSynthesizer.hpp
 * @brief Turns a frequency into a plucked-string tone on the output device.
 */

#ifndef FRETBOARD_TONE_SYNTHESIZER_HPP
#define FRETBOARD_TONE_SYNTHESIZER_HPP

#include "AudioOutput.hpp"
#include "core/TonePlayer.hpp"
#include "core/TrainerConfig.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <random>

namespace fretboard {

/**
 * @brief Fire-and-forget pluck synthesizer.
 *
 * The output is owned here and opened on the first play(). If opening
 * fails the synthesizer stays silent for the rest of its life: the failure
 * is logged once and later calls return immediately. Each play() builds an
 * independent PluckTone, so overlapping calls never share envelope state.
 */
class ToneSynthesizer : public TonePlayer {
public:
    enum class DeviceState {
        Unacquired,
        Ready,
        Unavailable
    };

    ToneSynthesizer(std::unique_ptr<AudioOutput> output, const ToneSettings& settings, uint32_t seed);

    /**
     * @throws std::invalid_argument for a non-positive or non-finite frequency.
     */
    void play(double frequency_hz) override;

    /**
     * @brief False once acquisition has failed; true before the first attempt.
     */
    bool audio_available() const { return device_state_ != DeviceState::Unavailable; }

    DeviceState device_state() const { return device_state_; }
    uint64_t tones_started() const { return tones_started_; }

    /**
     * @brief One random detune per partial, uniform in +/- spread/2 cents.
     */
    std::array<double, ToneSettings::NUM_PARTIALS> draw_detune();

private:
    bool ensure_device();

    std::unique_ptr<AudioOutput> output_;
    ToneSettings settings_;
    std::mt19937 rng_;
    DeviceState device_state_ = DeviceState::Unacquired;
    uint64_t tones_started_ = 0;
};

} // namespace fretboard

#endif // FRETBOARD_TONE_SYNTHESIZER_HPP
