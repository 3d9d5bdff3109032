#include "ConfigStore.hpp"
#include "Logger.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace fretboard {

namespace {

template<typename T, size_t N>
void read_fixed_array(const json& j, const char* key, std::array<T, N>& out) {
    if (!j.contains(key)) return;
    const json& arr = j.at(key);
    if (!arr.is_array() || arr.size() != N) {
        throw std::invalid_argument(std::string(key) + " must be an array of " + std::to_string(N));
    }
    for (size_t i = 0; i < N; ++i) {
        out[i] = arr.at(i).get<T>();
    }
}

} // namespace

void to_json(json& j, const PitchClass& p) {
    j = std::string(pitch_name(p));
}

void from_json(const json& j, PitchClass& p) {
    const auto name = j.get<std::string>();
    auto parsed = parse_pitch_class(name);
    if (!parsed) {
        throw std::invalid_argument("Unknown pitch name: " + name);
    }
    p = *parsed;
}

void to_json(json& j, const Position& p) {
    j = json{{"string", p.string}, {"fret", p.fret}};
}

void from_json(const json& j, Position& p) {
    p.string = j.at("string").get<int>();
    p.fret = j.at("fret").get<int>();
}

void to_json(json& j, const MelodyEntry& e) {
    j = json{{"string", e.position.string}, {"fret", e.position.fret}, {"duration_ms", e.duration_ms}};
}

void from_json(const json& j, MelodyEntry& e) {
    from_json(j, e.position);
    const json& duration = j.at("duration_ms");
    if (!duration.is_number_integer()) {
        throw std::invalid_argument("melody duration_ms must be an integer");
    }
    const auto ms = duration.get<int64_t>();
    if (ms <= 0 || ms > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw std::invalid_argument("melody duration_ms out of range: " + duration.dump());
    }
    e.duration_ms = static_cast<uint32_t>(ms);
}

void to_json(json& j, const Tuning& t) {
    j = json{{"open_frequencies", t.open_frequencies}, {"open_pitches", t.open_pitches}};
}

void from_json(const json& j, Tuning& t) {
    read_fixed_array(j, "open_frequencies", t.open_frequencies);
    read_fixed_array(j, "open_pitches", t.open_pitches);
}

void to_json(json& j, const ToneSettings& s) {
    j = json{
        {"harmonic_gains", s.harmonic_gains},
        {"attack_seconds", s.attack_seconds},
        {"decay_seconds", s.decay_seconds},
        {"decay_floor", s.decay_floor},
        {"master_gain", s.master_gain},
        {"detune_spread_cents", s.detune_spread_cents}
    };
}

void from_json(const json& j, ToneSettings& s) {
    read_fixed_array(j, "harmonic_gains", s.harmonic_gains);
    s.attack_seconds = j.value("attack_seconds", s.attack_seconds);
    s.decay_seconds = j.value("decay_seconds", s.decay_seconds);
    s.decay_floor = j.value("decay_floor", s.decay_floor);
    s.master_gain = j.value("master_gain", s.master_gain);
    s.detune_spread_cents = j.value("detune_spread_cents", s.detune_spread_cents);
}

void to_json(json& j, const QuizSettings& s) {
    j = json{
        {"sweat_budget_seconds", s.sweat_budget_seconds},
        {"correct_delay_seconds", s.correct_delay_seconds},
        {"sweat_correct_delay_seconds", s.sweat_correct_delay_seconds},
        {"tick_seconds", s.tick_seconds}
    };
}

void from_json(const json& j, QuizSettings& s) {
    s.sweat_budget_seconds = j.value("sweat_budget_seconds", s.sweat_budget_seconds);
    s.correct_delay_seconds = j.value("correct_delay_seconds", s.correct_delay_seconds);
    s.sweat_correct_delay_seconds = j.value("sweat_correct_delay_seconds", s.sweat_correct_delay_seconds);
    s.tick_seconds = j.value("tick_seconds", s.tick_seconds);
}

void to_json(json& j, const AudioDeviceSettings& s) {
    j = json{
        {"device", s.device},
        {"sample_rate", s.sample_rate},
        {"block_size", s.block_size},
        {"channels", s.channels}
    };
}

void from_json(const json& j, AudioDeviceSettings& s) {
    s.device = j.value("device", s.device);
    s.sample_rate = j.value("sample_rate", s.sample_rate);
    s.block_size = j.value("block_size", s.block_size);
    s.channels = j.value("channels", s.channels);
}

void to_json(json& j, const TrainerConfig& c) {
    j = json{
        {"version", c.version},
        {"tuning", c.tuning},
        {"tone", c.tone},
        {"quiz", c.quiz},
        {"audio", c.audio},
        {"melody", c.melody}
    };
}

void from_json(const json& j, TrainerConfig& c) {
    c.version = j.value("version", c.version);
    if (j.contains("tuning")) from_json(j.at("tuning"), c.tuning);
    if (j.contains("tone")) from_json(j.at("tone"), c.tone);
    if (j.contains("quiz")) from_json(j.at("quiz"), c.quiz);
    if (j.contains("audio")) from_json(j.at("audio"), c.audio);
    if (j.contains("melody")) c.melody = j.at("melody").get<std::vector<MelodyEntry>>();
}

std::string ConfigStore::serialize(const TrainerConfig& config) {
    json j = config;
    return j.dump(4);
}

std::string ConfigStore::validate(const TrainerConfig& config) {
    for (double f : config.tuning.open_frequencies) {
        if (!std::isfinite(f) || f <= 0.0) return "open string frequencies must be positive";
    }
    for (double g : config.tone.harmonic_gains) {
        if (!std::isfinite(g) || g <= 0.0) return "harmonic gains must be positive";
    }
    const auto& tone = config.tone;
    if (!(tone.attack_seconds > 0.0) || !(tone.decay_seconds > tone.attack_seconds)) {
        return "decay window must be longer than the attack";
    }
    if (!(tone.decay_floor > 0.0)) return "decay floor must be positive";
    for (double g : tone.harmonic_gains) {
        if (!(tone.decay_floor < g)) return "decay floor must be below every harmonic gain";
    }
    if (!(tone.master_gain >= 0.0 && tone.master_gain <= 1.0)) return "master gain must be within [0,1]";
    if (!(tone.detune_spread_cents >= 0.0)) return "detune spread must not be negative";

    const auto& quiz = config.quiz;
    if (!(quiz.sweat_budget_seconds > 0.0)) return "sweat budget must be positive";
    if (!(quiz.correct_delay_seconds >= 0.0) || !(quiz.sweat_correct_delay_seconds >= 0.0)) {
        return "correct-answer delays must not be negative";
    }
    if (!(quiz.tick_seconds > 0.0)) return "tick must be positive";

    const auto& audio = config.audio;
    if (audio.device.empty()) return "audio device name must not be empty";
    if (audio.sample_rate <= 0 || audio.block_size <= 0) return "sample rate and block size must be positive";
    if (audio.channels < 1 || audio.channels > 2) return "channels must be 1 or 2";

    for (size_t i = 0; i < config.melody.size(); ++i) {
        const auto& entry = config.melody[i];
        const auto& p = entry.position;
        if (p.string < 0 || p.string >= NUM_STRINGS || p.fret < 0 || p.fret > NUM_FRETS) {
            return "melody entry " + std::to_string(i) + " is off the fretboard";
        }
        if (entry.duration_ms == 0) {
            return "melody entry " + std::to_string(i) + " has zero duration";
        }
    }
    return {};
}

bool ConfigStore::deserialize(TrainerConfig& config, const std::string& data) {
    TrainerConfig parsed = config;
    try {
        json j = json::parse(data);
        if (!j.is_object()) {
            LOG_ERROR("Config", "Top-level JSON value must be an object");
            return false;
        }
        from_json(j, parsed);
    } catch (const std::exception& e) {
        LOG_ERROR("Config", e.what());
        return false;
    }

    const std::string problem = validate(parsed);
    if (!problem.empty()) {
        LOG_ERROR("Config", problem);
        return false;
    }

    config = std::move(parsed);
    return true;
}

bool ConfigStore::save_to_file(const TrainerConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config", "Failed to open for writing: " + path);
        return false;
    }
    file << serialize(config) << "\n";
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(TrainerConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config", "Failed to open file: " + path);
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    const bool success = deserialize(config, content);
    if (success) {
        LOG_INFO("Config", "Loaded " + path);
    } else {
        LOG_ERROR("Config", "Failed to load config from: " + path);
    }
    return success;
}

} // namespace fretboard
