/**
 * @file TrainerBridge.cpp
 * @brief C-compatible API bridge for the quiz, synthesizer and pitch model.
 */

#include "CInterface.h"
#include "core/ConfigStore.hpp"
#include "core/Logger.hpp"
#include "core/PitchModel.hpp"
#include "core/PositionSource.hpp"
#include "core/Quiz.hpp"
#include "hal/DriverFactory.hpp"
#include "synth/AudioOutput.hpp"
#include "synth/ToneSynthesizer.hpp"
#include <algorithm>
#include <cstring>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

// Internal handle structure (hidden from C API). Members are declared in
// dependency order: the quiz holds references to the synth and positions.
struct TrainerHandleImpl {
    fretboard::TrainerConfig config;
    std::unique_ptr<fretboard::ToneSynthesizer> synth;
    fretboard::RandomPositionSource positions;
    std::unique_ptr<fretboard::Quiz> quiz;

    TrainerHandleImpl(const fretboard::TrainerConfig& cfg, bool mute, uint32_t seed)
        : config(cfg)
        , positions(seed)
    {
        std::unique_ptr<fretboard::AudioOutput> output;
        if (mute) {
            output = std::make_unique<fretboard::NullAudioOutput>(config.audio.sample_rate);
        } else {
            const auto device = config.audio;
            output = std::make_unique<fretboard::DriverAudioOutput>([device]() {
                return hal::create_driver(device);
            });
        }
        synth = std::make_unique<fretboard::ToneSynthesizer>(std::move(output), config.tone, seed + 1);
        quiz = std::make_unique<fretboard::Quiz>(config, *synth, positions);
    }
};

TrainerHandleImpl* to_impl(TrainerHandle handle) {
    return static_cast<TrainerHandleImpl*>(handle);
}

void copy_text(const std::string& text, char* buffer, size_t capacity) {
    const size_t n = std::min(text.size(), capacity - 1);
    std::memcpy(buffer, text.data(), n);
    buffer[n] = '\0';
}

/**
 * Runs an action against a live handle; exceptions become -1.
 */
template<typename Fn>
int guarded(TrainerHandle handle, Fn&& fn) {
    if (!handle) return -1;
    try {
        return fn(*to_impl(handle));
    } catch (const std::exception& e) {
        LOG_ERROR("Bridge", e.what());
        return -1;
    }
}

int applied(bool accepted) {
    return accepted ? 1 : 0;
}

} // namespace

extern "C" {

TrainerHandle trainer_create(const char* config_path, int mute, uint32_t seed) {
    try {
        fretboard::TrainerConfig config;
        if (config_path && config_path[0] != '\0') {
            if (!fretboard::ConfigStore::load_from_file(config, config_path)) {
                return nullptr;
            }
        }
        if (seed == 0) {
            seed = std::random_device{}();
        }
        return static_cast<TrainerHandle>(new TrainerHandleImpl(config, mute != 0, seed));
    } catch (const std::exception& e) {
        LOG_ERROR("Bridge", std::string("trainer_create failed: ") + e.what());
        return nullptr;
    }
}

void trainer_destroy(TrainerHandle handle) {
    if (handle) {
        delete to_impl(handle);
    }
}

int trainer_guess(TrainerHandle handle, const char* pitch_name) {
    if (!pitch_name) return -1;
    return guarded(handle, [pitch_name](TrainerHandleImpl& impl) {
        return applied(impl.quiz->guess(pitch_name));
    });
}

int trainer_next(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        return applied(impl.quiz->advance());
    });
}

int trainer_reset(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        impl.quiz->reset();
        return 1;
    });
}

int trainer_set_study_mode(TrainerHandle handle, int on) {
    return guarded(handle, [on](TrainerHandleImpl& impl) {
        impl.quiz->set_study_mode(on != 0);
        return 1;
    });
}

int trainer_set_sweat_mode(TrainerHandle handle, int on) {
    return guarded(handle, [on](TrainerHandleImpl& impl) {
        impl.quiz->set_sweat_mode(on != 0);
        return 1;
    });
}

int trainer_toggle_study_mode(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        impl.quiz->toggle_study_mode();
        return 1;
    });
}

int trainer_toggle_sweat_mode(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        impl.quiz->toggle_sweat_mode();
        return 1;
    });
}

int trainer_play_current(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        impl.quiz->play_current();
        return 1;
    });
}

int trainer_play_position(TrainerHandle handle, int string_index, int fret) {
    return guarded(handle, [string_index, fret](TrainerHandleImpl& impl) {
        return applied(impl.quiz->play_position(fretboard::Position{string_index, fret}));
    });
}

int trainer_play_melody(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        return applied(impl.quiz->play_melody());
    });
}

int trainer_cancel_melody(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        impl.quiz->cancel_melody();
        return 1;
    });
}

int trainer_tick(TrainerHandle handle, double delta_seconds) {
    return guarded(handle, [delta_seconds](TrainerHandleImpl& impl) {
        impl.quiz->tick(delta_seconds);
        return 1;
    });
}

int trainer_get_position(TrainerHandle handle, int* string_index, int* fret) {
    if (!string_index || !fret) return -1;
    return guarded(handle, [string_index, fret](TrainerHandleImpl& impl) {
        const auto pos = impl.quiz->position();
        *string_index = pos.string;
        *fret = pos.fret;
        return 1;
    });
}

int trainer_get_revealed_note(TrainerHandle handle, char* buffer, size_t capacity) {
    if (!buffer || capacity == 0) return -1;
    return guarded(handle, [buffer, capacity](TrainerHandleImpl& impl) {
        const auto pitch = impl.quiz->revealed_pitch();
        if (!pitch) {
            buffer[0] = '\0';
            return 0;
        }
        copy_text(fretboard::display_name(*pitch), buffer, capacity);
        return 1;
    });
}

int trainer_get_score(TrainerHandle handle, unsigned int* correct, unsigned int* total) {
    if (!correct || !total) return -1;
    return guarded(handle, [correct, total](TrainerHandleImpl& impl) {
        *correct = impl.quiz->score().correct;
        *total = impl.quiz->score().total;
        return 1;
    });
}

int trainer_get_accuracy(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        return impl.quiz->score().accuracy_percent();
    });
}

int trainer_get_feedback(TrainerHandle handle, char* buffer, size_t capacity, int* is_correct) {
    if (!buffer || capacity == 0) return -1;
    return guarded(handle, [buffer, capacity, is_correct](TrainerHandleImpl& impl) {
        const auto& feedback = impl.quiz->feedback();
        if (!feedback) {
            buffer[0] = '\0';
            return 0;
        }
        copy_text(feedback->message, buffer, capacity);
        if (is_correct) *is_correct = feedback->correct ? 1 : 0;
        return 1;
    });
}

int trainer_get_mode(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        switch (impl.quiz->mode()) {
            case fretboard::Quiz::Mode::Study: return static_cast<int>(TRAINER_MODE_STUDY);
            case fretboard::Quiz::Mode::Sweat: return static_cast<int>(TRAINER_MODE_SWEAT);
            case fretboard::Quiz::Mode::Normal: break;
        }
        return static_cast<int>(TRAINER_MODE_NORMAL);
    });
}

int trainer_get_phase(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        switch (impl.quiz->phase()) {
            case fretboard::Quiz::Phase::Advancing: return static_cast<int>(TRAINER_PHASE_ADVANCING);
            case fretboard::Quiz::Phase::Answered: return static_cast<int>(TRAINER_PHASE_ANSWERED);
            case fretboard::Quiz::Phase::Asking: break;
        }
        return static_cast<int>(TRAINER_PHASE_ASKING);
    });
}

int trainer_get_time_remaining(TrainerHandle handle, double* seconds) {
    if (!seconds) return -1;
    return guarded(handle, [seconds](TrainerHandleImpl& impl) {
        *seconds = impl.quiz->time_remaining();
        return 1;
    });
}

int trainer_get_now_sounding(TrainerHandle handle, int* string_index, int* fret) {
    if (!string_index || !fret) return -1;
    return guarded(handle, [string_index, fret](TrainerHandleImpl& impl) {
        const auto pos = impl.quiz->now_sounding();
        if (!pos) return 0;
        *string_index = pos->string;
        *fret = pos->fret;
        return 1;
    });
}

int trainer_audio_available(TrainerHandle handle) {
    return guarded(handle, [](TrainerHandleImpl& impl) {
        return impl.synth->audio_available() ? 1 : 0;
    });
}

int trainer_poll_log(char* buffer, size_t capacity) {
    if (!buffer || capacity == 0) return -1;
    auto entry = fretboard::Logger::instance().pop_entry();
    if (!entry) {
        buffer[0] = '\0';
        return 0;
    }
    std::ostringstream line;
    fretboard::Logger::format(line, *entry);
    std::string text = line.str();
    if (!text.empty() && text.back() == '\n') text.pop_back();
    copy_text(text, buffer, capacity);
    return 1;
}

int fretboard_frequency(int string_index, int fret, double* frequency_hz) {
    if (!frequency_hz) return -1;
    try {
        *frequency_hz = fretboard::frequency(fretboard::standard_tuning(), string_index, fret);
        return 1;
    } catch (const std::out_of_range& e) {
        LOG_DEBUG("Bridge", e.what());
        return -1;
    }
}

int fretboard_note_name(int string_index, int fret, char* buffer, size_t capacity) {
    if (!buffer || capacity == 0) return -1;
    try {
        const auto pitch = fretboard::note_at(fretboard::standard_tuning(), string_index, fret);
        copy_text(std::string(fretboard::pitch_name(pitch)), buffer, capacity);
        return 1;
    } catch (const std::out_of_range& e) {
        LOG_DEBUG("Bridge", e.what());
        return -1;
    }
}

} // extern "C"
