/**
 * @file PitchModel.cpp
 * @brief Pitch lookups over the tuning tables.
 */

#include "PitchModel.hpp"
#include <cmath>
#include <stdexcept>

namespace fretboard {

namespace {

constexpr std::array<std::string_view, NUM_PITCH_CLASSES> SHARP_NAMES = {
    "A", "A#", "B", "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#"
};

// Empty entry: no flat alias.
constexpr std::array<std::string_view, NUM_PITCH_CLASSES> FLAT_NAMES = {
    "", "Bb", "", "", "Db", "", "Eb", "", "", "Gb", "", "Ab"
};

constexpr std::array<std::string_view, NUM_STRINGS> STRING_LABELS = {
    "6 (Low E)", "5 (A)", "4 (D)", "3 (G)", "2 (B)", "1 (High E)"
};

const double SEMITONE_RATIO = std::pow(2.0, 1.0 / 12.0);

void check_string_and_fret(int string_index, int fret) {
    if (string_index < 0 || string_index >= NUM_STRINGS) {
        throw std::out_of_range("String index out of range: " + std::to_string(string_index));
    }
    if (fret < 0) {
        throw std::out_of_range("Fret must not be negative: " + std::to_string(fret));
    }
}

} // namespace

Tuning standard_tuning() {
    return Tuning{
        {82.41, 110.0, 146.83, 196.0, 246.94, 329.63},
        {PitchClass::E, PitchClass::A, PitchClass::D, PitchClass::G, PitchClass::B, PitchClass::E}
    };
}

void validate_position(const Position& position) {
    if (position.string < 0 || position.string >= NUM_STRINGS ||
        position.fret < 0 || position.fret > NUM_FRETS) {
        throw std::out_of_range("Position out of range: string " + std::to_string(position.string) +
                                ", fret " + std::to_string(position.fret));
    }
}

Position make_position(int string, int fret) {
    Position position{string, fret};
    validate_position(position);
    return position;
}

double frequency(const Tuning& tuning, int string_index, int fret) {
    check_string_and_fret(string_index, fret);
    return tuning.open_frequencies[static_cast<size_t>(string_index)] *
           std::pow(SEMITONE_RATIO, static_cast<double>(fret));
}

double frequency(const Tuning& tuning, const Position& position) {
    return frequency(tuning, position.string, position.fret);
}

PitchClass note_at(const Tuning& tuning, int string_index, int fret) {
    check_string_and_fret(string_index, fret);
    const int open = static_cast<int>(tuning.open_pitches[static_cast<size_t>(string_index)]);
    return static_cast<PitchClass>((open + fret) % NUM_PITCH_CLASSES);
}

PitchClass note_at(const Tuning& tuning, const Position& position) {
    return note_at(tuning, position.string, position.fret);
}

std::string_view pitch_name(PitchClass pitch) {
    return SHARP_NAMES[static_cast<size_t>(pitch)];
}

std::optional<std::string_view> flat_alias(PitchClass pitch) {
    const std::string_view flat = FLAT_NAMES[static_cast<size_t>(pitch)];
    if (flat.empty()) return std::nullopt;
    return flat;
}

std::string display_name(PitchClass pitch) {
    std::string name(pitch_name(pitch));
    if (auto flat = flat_alias(pitch)) {
        name += " / ";
        name += *flat;
    }
    return name;
}

bool is_natural(PitchClass pitch) {
    return !flat_alias(pitch).has_value();
}

std::optional<PitchClass> parse_pitch_class(std::string_view name) {
    for (size_t i = 0; i < SHARP_NAMES.size(); ++i) {
        if (name == SHARP_NAMES[i] || (!FLAT_NAMES[i].empty() && name == FLAT_NAMES[i])) {
            return static_cast<PitchClass>(i);
        }
    }
    return std::nullopt;
}

bool is_equivalent(std::string_view answer, std::string_view target) {
    if (answer == target) return true;

    for (size_t i = 0; i < SHARP_NAMES.size(); ++i) {
        if (FLAT_NAMES[i].empty()) continue;
        // answer is the flat spelling of a sharp target
        if (target == SHARP_NAMES[i] && answer == FLAT_NAMES[i]) return true;
        // target is a flat spelling and answer its sharp
        if (target == FLAT_NAMES[i] && answer == SHARP_NAMES[i]) return true;
    }
    return false;
}

std::string_view string_label(int string_index) {
    if (string_index < 0 || string_index >= NUM_STRINGS) {
        throw std::out_of_range("String index out of range: " + std::to_string(string_index));
    }
    return STRING_LABELS[static_cast<size_t>(string_index)];
}

bool has_fret_marker(int fret) {
    return fret == 3 || fret == 5 || fret == 7 || fret == 9 || fret == 12;
}

bool has_double_fret_marker(int fret) {
    return fret == 12;
}

} // namespace fretboard
