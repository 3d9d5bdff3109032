/**
 * @file audio_check.cpp
 * @brief Audible verification: open strings, then the fun melody, through ALSA.
 */

#include "core/Clock.hpp"
#include "core/Logger.hpp"
#include "core/MelodySequencer.hpp"
#include "core/TrainerConfig.hpp"
#include "hal/DriverFactory.hpp"
#include "synth/AudioOutput.hpp"
#include "synth/ToneSynthesizer.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

int main(int argc, char** argv) {
    fretboard::TrainerConfig config;
    if (argc > 1) {
        config.audio.device = argv[1];
    }

    auto& logger = fretboard::Logger::instance();
    logger.set_log_to_console(true);

    std::cout << "--- Audible Verification on '" << config.audio.device << "' ---" << std::endl;

    const auto device = config.audio;
    fretboard::ToneSynthesizer synth(
        std::make_unique<fretboard::DriverAudioOutput>([device]() { return hal::create_driver(device); }),
        config.tone, 1234);

    std::cout << "Open strings, low to high..." << std::endl;
    for (int s = 0; s < fretboard::NUM_STRINGS; ++s) {
        synth.play(fretboard::frequency(config.tuning, s, 0));
        logger.flush(std::cerr);
        if (!synth.audio_available()) {
            std::cerr << "Failed to start audio driver!" << std::endl;
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
    }

    std::cout << "Melody (" << config.melody.size() << " notes)..." << std::endl;
    fretboard::MelodySequencer sequencer(synth, config.tuning);
    if (!sequencer.play(config.melody)) {
        std::cerr << "Sequencer busy" << std::endl;
        return 1;
    }

    fretboard::SteadyClock clock;
    double last = clock.now_seconds();
    while (sequencer.active()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        const double now = clock.now_seconds();
        sequencer.tick(now - last);
        last = now;
    }

    // Let the last note ring out
    std::this_thread::sleep_for(std::chrono::milliseconds(
        static_cast<int>(config.tone.decay_seconds * 1000.0)));

    logger.flush(std::cerr);
    std::cout << "--- Test Complete (" << synth.tones_started() << " tones) ---" << std::endl;
    return 0;
}
