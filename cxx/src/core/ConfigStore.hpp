/**
 * @file ConfigStore.hpp
 * @brief Human-readable JSON persistence for TrainerConfig.
 */

#ifndef FRETBOARD_CONFIG_STORE_HPP
#define FRETBOARD_CONFIG_STORE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "TrainerConfig.hpp"

namespace fretboard {

using json = nlohmann::json;

// Pitch classes travel by name; flats are accepted on input.
void to_json(json& j, const PitchClass& p);
void from_json(const json& j, PitchClass& p);

void to_json(json& j, const Position& p);
void from_json(const json& j, Position& p);

void to_json(json& j, const MelodyEntry& e);
void from_json(const json& j, MelodyEntry& e);

// Missing keys keep their defaults.
void to_json(json& j, const Tuning& t);
void from_json(const json& j, Tuning& t);

void to_json(json& j, const ToneSettings& s);
void from_json(const json& j, ToneSettings& s);

void to_json(json& j, const QuizSettings& s);
void from_json(const json& j, QuizSettings& s);

void to_json(json& j, const AudioDeviceSettings& s);
void from_json(const json& j, AudioDeviceSettings& s);

void to_json(json& j, const TrainerConfig& c);
void from_json(const json& j, TrainerConfig& c);

/**
 * @brief Manages saving and loading of TrainerConfig.
 *
 * Every entry point reports failure through its return value and leaves
 * the destination untouched when it fails.
 */
class ConfigStore {
public:
    static bool save_to_file(const TrainerConfig& config, const std::string& path);
    static bool load_from_file(TrainerConfig& config, const std::string& path);

    /**
     * @brief Convert TrainerConfig to an indented JSON string.
     */
    static std::string serialize(const TrainerConfig& config);

    /**
     * @brief Parse and validate. Defaults fill any key the document omits.
     */
    static bool deserialize(TrainerConfig& config, const std::string& data);

    /**
     * @brief Range checks that the JSON schema alone cannot express.
     * @return empty string when valid, otherwise the first problem found.
     */
    static std::string validate(const TrainerConfig& config);
};

} // namespace fretboard

#endif // FRETBOARD_CONFIG_STORE_HPP
