/**
 * @file PitchModel.hpp
 * @brief Fretboard positions, pitch classes and equal-tempered string frequencies.
 */

#ifndef FRETBOARD_PITCH_MODEL_HPP
#define FRETBOARD_PITCH_MODEL_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fretboard {

constexpr int NUM_STRINGS = 6;
constexpr int NUM_FRETS = 12;
constexpr int NUM_PITCH_CLASSES = 12;

/**
 * @brief The twelve pitch classes in semitone order starting at A.
 *
 * Sharp spelling is canonical; five classes carry a flat alias.
 */
enum class PitchClass : uint8_t {
    A, ASharp, B, C, CSharp, D, DSharp, E, F, FSharp, G, GSharp
};

/**
 * @brief A fretboard location. String 0 is the low E string, fret 0 is open.
 */
struct Position {
    int string = 0;
    int fret = 0;

    bool operator==(const Position& other) const {
        return string == other.string && fret == other.fret;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

/**
 * @brief Open-string table for a six-string instrument, low to high.
 */
struct Tuning {
    std::array<double, NUM_STRINGS> open_frequencies;
    std::array<PitchClass, NUM_STRINGS> open_pitches;

    bool operator==(const Tuning& other) const {
        return open_frequencies == other.open_frequencies && open_pitches == other.open_pitches;
    }
};

/**
 * @brief Standard tuning E2 A2 D3 G3 B3 E4.
 */
Tuning standard_tuning();

/**
 * @brief Build a validated Position.
 * @throws std::out_of_range if string is outside [0,6) or fret outside [0,12].
 */
Position make_position(int string, int fret);

/**
 * @throws std::out_of_range for a Position that make_position() would reject.
 */
void validate_position(const Position& position);

/**
 * @brief open_frequency * 2^(fret/12).
 *
 * Frets beyond the twelfth are allowed so callers can reason about octaves.
 * @throws std::out_of_range on a bad string index or a negative fret.
 */
double frequency(const Tuning& tuning, int string_index, int fret);
double frequency(const Tuning& tuning, const Position& position);

/**
 * @brief Pitch class sounding at a string/fret, periodic in fret with period 12.
 * @throws std::out_of_range on a bad string index or a negative fret.
 */
PitchClass note_at(const Tuning& tuning, int string_index, int fret);
PitchClass note_at(const Tuning& tuning, const Position& position);

std::string_view pitch_name(PitchClass pitch);
std::optional<std::string_view> flat_alias(PitchClass pitch);

/**
 * @brief "A# / Bb" for accidentals, the bare name otherwise.
 */
std::string display_name(PitchClass pitch);

bool is_natural(PitchClass pitch);

/**
 * @brief Parse a sharp, natural or flat spelling ("C#", "Db", "E").
 */
std::optional<PitchClass> parse_pitch_class(std::string_view name);

/**
 * @brief Answer check that accepts either spelling of an accidental.
 *
 * True if answer equals target, answer is the flat spelling of target,
 * or target is a flat spelling whose sharp spelling is answer.
 */
bool is_equivalent(std::string_view answer, std::string_view target);

/**
 * @brief "6 (Low E)" .. "1 (High E)" for string indices 0..5.
 */
std::string_view string_label(int string_index);

bool has_fret_marker(int fret);
bool has_double_fret_marker(int fret);

} // namespace fretboard

#endif // FRETBOARD_PITCH_MODEL_HPP
