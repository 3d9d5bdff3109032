/**
 * @file main.cpp
 * @brief Interactive fretboard note trainer for the terminal.
 *
 * The main thread owns the quiz. A CLI thread reads stdin and queues
 * commands; the loop applies them, then ticks the quiz every 100 ms from
 * the steady clock. Audio runs on the driver's own thread.
 */

#include "core/Clock.hpp"
#include "core/ConfigStore.hpp"
#include "core/Logger.hpp"
#include "core/PositionSource.hpp"
#include "core/Quiz.hpp"
#include "hal/DriverFactory.hpp"
#include "synth/AudioOutput.hpp"
#include "synth/ToneSynthesizer.hpp"
#include "ui/Cli.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void handle_sigint(int) {
    g_running.store(false);
}

struct Options {
    std::string config_path;
    std::string device;
    std::optional<uint32_t> seed;
    bool mute = false;
    bool dump_config = false;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>   load settings from a JSON file\n"
              << "  --device <name>   ALSA playback device (default: from config)\n"
              << "  --seed <n>        seed the question generator\n"
              << "  --mute            run without audio\n"
              << "  --dump-config     print the effective configuration and exit\n"
              << "  --help            show this message\n";
}

// Returns false (after printing why) on a malformed command line
bool parse_args(int argc, char** argv, Options& opts, bool& show_help) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << name << " needs a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--config") {
            const char* v = value("--config");
            if (!v) return false;
            opts.config_path = v;
        } else if (arg == "--device") {
            const char* v = value("--device");
            if (!v) return false;
            opts.device = v;
        } else if (arg == "--seed") {
            const char* v = value("--seed");
            if (!v) return false;
            char* end = nullptr;
            const unsigned long n = std::strtoul(v, &end, 10);
            if (end == v || *end != '\0') {
                std::cerr << "--seed expects a number, got '" << v << "'\n";
                return false;
            }
            opts.seed = static_cast<uint32_t>(n);
        } else if (arg == "--mute") {
            opts.mute = true;
        } else if (arg == "--dump-config") {
            opts.dump_config = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// What the user last saw; the loop reprints status when any of it changes
struct StatusSnapshot {
    fretboard::Position position;
    fretboard::Quiz::Phase phase = fretboard::Quiz::Phase::Asking;
    std::optional<std::string> feedback;
    std::optional<fretboard::Position> sounding;

    static StatusSnapshot of(const fretboard::Quiz& quiz) {
        StatusSnapshot s;
        s.position = quiz.position();
        s.phase = quiz.phase();
        if (quiz.feedback()) s.feedback = quiz.feedback()->message;
        s.sounding = quiz.now_sounding();
        return s;
    }

    bool operator==(const StatusSnapshot& other) const {
        return position == other.position && phase == other.phase &&
               feedback == other.feedback && sounding == other.sounding;
    }
};

void apply(const ui::Command& cmd, fretboard::Quiz& quiz) {
    using T = ui::Command::Type;
    switch (cmd.type) {
        case T::Help:
            ui::print_help();
            break;
        case T::Status:
            ui::print_status(quiz);
            break;
        case T::Board:
            ui::print_fretboard(quiz.config().tuning, quiz.mode() == fretboard::Quiz::Mode::Study,
                                quiz.mode() == fretboard::Quiz::Mode::Study
                                    ? std::nullopt : std::optional<fretboard::Position>(quiz.position()));
            break;
        case T::Guess:
            if (!quiz.guess(cmd.text)) {
                std::cout << "Not accepted now.\n";
            }
            break;
        case T::Next:
            if (!quiz.advance()) {
                std::cout << "Answer the current question first.\n";
            }
            break;
        case T::Reset:
            quiz.reset();
            break;
        case T::Study:
            quiz.toggle_study_mode();
            std::cout << "Mode: " << ui::mode_name(quiz.mode()) << "\n";
            if (quiz.mode() == fretboard::Quiz::Mode::Study) {
                ui::print_fretboard(quiz.config().tuning, true, std::nullopt);
            }
            break;
        case T::Sweat:
            quiz.toggle_sweat_mode();
            std::cout << "Mode: " << ui::mode_name(quiz.mode()) << "\n";
            break;
        case T::PlayCurrent:
            quiz.play_current();
            break;
        case T::PlayPosition:
            try {
                const auto pos = fretboard::make_position(cmd.a, cmd.b);
                if (quiz.play_position(pos)) {
                    std::cout << fretboard::string_label(pos.string) << " fret " << pos.fret << ": "
                              << fretboard::display_name(fretboard::note_at(quiz.config().tuning, pos)) << "\n";
                } else {
                    std::cout << "Positions can be played in study mode only.\n";
                }
            } catch (const std::out_of_range& e) {
                std::cout << e.what() << "\n";
            }
            break;
        case T::Melody:
            if (!quiz.play_melody()) {
                std::cout << "Already playing.\n";
            }
            break;
        case T::StopMelody:
            quiz.cancel_melody();
            break;
        case T::Quit:
            g_running.store(false);
            break;
    }
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    bool show_help = false;
    if (!parse_args(argc, argv, opts, show_help)) {
        print_usage(argv[0]);
        return 2;
    }
    if (show_help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& logger = fretboard::Logger::instance();
    logger.set_log_to_console(true);
    logger.set_min_level(fretboard::LogEntry::Level::Info);

    fretboard::TrainerConfig config;
    if (!opts.config_path.empty() && !fretboard::ConfigStore::load_from_file(config, opts.config_path)) {
        logger.flush(std::cerr);
        return 1;
    }
    if (!opts.device.empty()) {
        config.audio.device = opts.device;
    }
    if (opts.dump_config) {
        std::cout << fretboard::ConfigStore::serialize(config) << "\n";
        return 0;
    }

    const uint32_t seed = opts.seed ? *opts.seed : std::random_device{}();

    std::unique_ptr<fretboard::AudioOutput> output;
    if (opts.mute) {
        output = std::make_unique<fretboard::NullAudioOutput>(config.audio.sample_rate);
    } else {
        const auto device = config.audio;
        output = std::make_unique<fretboard::DriverAudioOutput>([device]() {
            return hal::create_driver(device);
        });
    }

    fretboard::ToneSynthesizer synth(std::move(output), config.tone, seed + 1);
    fretboard::RandomPositionSource positions(seed);
    fretboard::Quiz quiz(config, synth, positions);

    std::signal(SIGINT, handle_sigint);

    ui::CommandQueue cq;
    auto cli_thread = ui::start_cli(g_running, cq);
    std::cout << "Fretboard trainer ready. Type a note name, or 'help'.\n";
    ui::print_status(quiz);

    fretboard::SteadyClock clock;
    double last = clock.now_seconds();
    auto shown = StatusSnapshot::of(quiz);

    const auto period = std::chrono::microseconds(fretboard::to_micros(config.quiz.tick_seconds));
    auto next = std::chrono::steady_clock::now();

    while (g_running.load()) {
        // Commands are applied only here, on the main thread
        bool had_command = false;
        for (auto& cmd : cq.drain()) {
            apply(cmd, quiz);
            had_command = true;
        }

        const double now = clock.now_seconds();
        quiz.tick(now - last);
        last = now;

        const auto current = StatusSnapshot::of(quiz);
        if (had_command || !(current == shown)) {
            ui::print_status(quiz);
            shown = current;
        }

        logger.flush(std::cerr);

        next += period;
        std::this_thread::sleep_until(next);
    }

    g_running.store(false);
    if (cli_thread.joinable()) cli_thread.join();
    logger.flush(std::cerr);
    std::cout << "Final score: " << quiz.score().correct << "/" << quiz.score().total << "\n";
    return 0;
}
