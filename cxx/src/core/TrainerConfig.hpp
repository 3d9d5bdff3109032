/**
 * @file TrainerConfig.hpp
 * @brief Static tables and constants of the trainer, overridable from JSON.
 */

#ifndef FRETBOARD_TRAINER_CONFIG_HPP
#define FRETBOARD_TRAINER_CONFIG_HPP

#include "PitchModel.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace fretboard {

/**
 * @brief One note of a fixed playlist.
 */
struct MelodyEntry {
    Position position;
    uint32_t duration_ms = 0;

    bool operator==(const MelodyEntry& other) const {
        return position == other.position && duration_ms == other.duration_ms;
    }
};

/**
 * @brief Pluck synthesis parameters.
 */
struct ToneSettings {
    static constexpr int NUM_PARTIALS = 5;

    std::array<double, NUM_PARTIALS> harmonic_gains{1.0, 0.5, 0.25, 0.125, 0.0625};
    double attack_seconds = 0.005;
    double decay_seconds = 1.5;     // Window from onset to source stop
    double decay_floor = 0.001;     // Exponential ramp target, never reached
    double master_gain = 0.4;
    double detune_spread_cents = 5.0; // Uniform in [-spread/2, +spread/2]

    bool operator==(const ToneSettings& other) const = default;
};

struct QuizSettings {
    double sweat_budget_seconds = 5.0;
    double correct_delay_seconds = 1.2;
    double sweat_correct_delay_seconds = 0.8;
    double tick_seconds = 0.1;

    bool operator==(const QuizSettings& other) const = default;
};

struct AudioDeviceSettings {
    std::string device = "default";
    int sample_rate = 48000;
    int block_size = 512;
    int channels = 2;

    bool operator==(const AudioDeviceSettings& other) const = default;
};

/**
 * @brief The happy bouncy tune played by the hidden melody action (19 notes).
 */
std::vector<MelodyEntry> fun_melody();

struct TrainerConfig {
    int version = 1;
    Tuning tuning = standard_tuning();
    ToneSettings tone;
    QuizSettings quiz;
    AudioDeviceSettings audio;
    std::vector<MelodyEntry> melody = fun_melody();
};

} // namespace fretboard

#endif // FRETBOARD_TRAINER_CONFIG_HPP
