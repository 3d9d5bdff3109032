/**
 * @file Cli.hpp
 * @brief Line-oriented terminal front end: stdin thread, command queue, printouts.
 */

#ifndef FRETBOARD_UI_CLI_HPP
#define FRETBOARD_UI_CLI_HPP

#include "core/PitchModel.hpp"
#include "core/Quiz.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <poll.h>
#include <unistd.h>

namespace ui {

// One parsed line from stdin, applied on the main thread
struct Command {
    enum class Type {
        Help, Status, Board,
        Guess, Next, Reset,
        Study, Sweat,
        PlayCurrent, PlayPosition,
        Melody, StopMelody,
        Quit
    } type{Type::Help};

    std::string text;  // Guess
    int a{0}, b{0};    // PlayPosition string/fret
};

// Minimal thread-safe queue (CLI thread -> main). Not on the audio path.
class CommandQueue {
public:
    void push(const Command& cmd) {
        std::lock_guard<std::mutex> lg(mu_);
        q_.push_back(cmd);
    }

    // Take everything queued so far without blocking
    std::deque<Command> drain() {
        std::lock_guard<std::mutex> lg(mu_);
        std::deque<Command> out;
        out.swap(q_);
        return out;
    }

private:
    std::mutex mu_;
    std::deque<Command> q_;
};

inline void print_help() {
    std::cout <<
        "Commands:\n"
        "  <note>            - answer with a pitch name (E, F#, Bb, ...)\n"
        "  guess <note>      - same as above\n"
        "  next | n          - next question after a wrong answer\n"
        "  reset             - zero the score and start over\n"
        "  study             - toggle study mode (play any position, no scoring)\n"
        "  sweat             - toggle sweat mode (5 second countdown)\n"
        "  play | p          - replay the current note\n"
        "  pos <str> <fret>  - study mode: play string 0..5 (low E = 0), fret 0..12\n"
        "  board             - print the fretboard\n"
        "  status | s        - print the current question and score\n"
        "  melody            - play a happy bouncy tune\n"
        "  stop              - stop the tune\n"
        "  help              - show this help\n"
        "  quit              - exit\n";
}

/**
 * @brief Fretboard grid, high E on top as seen by the player.
 *
 * Study mode prints every note; otherwise only the target cell is marked.
 */
inline void print_fretboard(const fretboard::Tuning& tuning, bool show_notes,
                            std::optional<fretboard::Position> highlight) {
    using namespace fretboard;
    std::cout << "            ";
    for (int fret = 0; fret <= NUM_FRETS; ++fret) {
        char cell[8];
        std::snprintf(cell, sizeof(cell), "%-5d", fret);
        std::cout << cell;
    }
    std::cout << "\n";

    for (int s = NUM_STRINGS - 1; s >= 0; --s) {
        char label[16];
        std::snprintf(label, sizeof(label), "%-12s", std::string(string_label(s)).c_str());
        std::cout << label;
        for (int fret = 0; fret <= NUM_FRETS; ++fret) {
            std::string cell = "-";
            if (highlight && highlight->string == s && highlight->fret == fret) {
                cell = show_notes ? "[" + std::string(pitch_name(note_at(tuning, s, fret))) + "]" : "[?]";
            } else if (show_notes) {
                // Accidentals in parentheses so the natural-note shapes stand out
                const PitchClass pitch = note_at(tuning, s, fret);
                cell = is_natural(pitch) ? std::string(pitch_name(pitch))
                                         : "(" + std::string(pitch_name(pitch)) + ")";
            }
            char padded[8];
            std::snprintf(padded, sizeof(padded), "%-5s", cell.c_str());
            std::cout << padded;
        }
        std::cout << "\n";
    }

    std::cout << "            ";
    for (int fret = 0; fret <= NUM_FRETS; ++fret) {
        std::cout << (has_double_fret_marker(fret) ? "**   " : has_fret_marker(fret) ? "*    " : "     ");
    }
    std::cout << "\n";
}

inline const char* mode_name(fretboard::Quiz::Mode mode) {
    switch (mode) {
        case fretboard::Quiz::Mode::Study: return "study";
        case fretboard::Quiz::Mode::Sweat: return "sweat";
        case fretboard::Quiz::Mode::Normal: break;
    }
    return "normal";
}

inline void print_status(const fretboard::Quiz& quiz) {
    const auto pos = quiz.position();
    const auto& score = quiz.score();
    std::cout << "Mode: " << mode_name(quiz.mode())
              << " | Score: " << score.correct << "/" << score.total
              << " (" << score.accuracy_percent() << "%)";
    if (quiz.countdown_running()) {
        char remaining[16];
        std::snprintf(remaining, sizeof(remaining), "%.1f", quiz.time_remaining());
        std::cout << " | Time: " << remaining << "s";
    }
    std::cout << "\n";

    if (quiz.mode() != fretboard::Quiz::Mode::Study) {
        std::cout << "Which note is string " << fretboard::string_label(pos.string)
                  << ", fret " << pos.fret << "?\n";
    }
    if (const auto& feedback = quiz.feedback()) {
        std::cout << feedback->message << "\n";
    }
    if (const auto sounding = quiz.now_sounding()) {
        std::cout << "Playing: string " << fretboard::string_label(sounding->string)
                  << ", fret " << sounding->fret << "\n";
    }
}

/**
 * @brief Wait until a line can be read or shutdown is requested.
 *
 * getline() alone would block past shutdown, so the owner could not join.
 */
inline bool wait_for_input(const std::atomic<bool>& running) {
    while (running.load()) {
        if (std::cin.rdbuf()->in_avail() > 0) return true;
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 100);
        if (ready > 0) return true;
        if (ready < 0 && errno != EINTR) return false;
    }
    return false;
}

// CLI thread: reads stdin, turns lines into Commands and queues them.
// Stops on quit, end of input, or when running is cleared; the owner joins it.
inline std::thread start_cli(std::atomic<bool>& running, CommandQueue& cq) {
    return std::thread([&running, &cq]() {
        print_help();
        std::string line;
        while (wait_for_input(running) && std::getline(std::cin, line)) {
            if (!running.load()) break;
            std::istringstream iss(line);
            std::string cmd;
            iss >> cmd;
            if (cmd.empty()) continue;

            Command c;
            if      (cmd == "help")   { c.type = Command::Type::Help; }
            else if (cmd == "status" || cmd == "s") { c.type = Command::Type::Status; }
            else if (cmd == "board")  { c.type = Command::Type::Board; }
            else if (cmd == "guess")  { c.type = Command::Type::Guess; iss >> c.text; }
            else if (cmd == "next" || cmd == "n") { c.type = Command::Type::Next; }
            else if (cmd == "reset")  { c.type = Command::Type::Reset; }
            else if (cmd == "study")  { c.type = Command::Type::Study; }
            else if (cmd == "sweat")  { c.type = Command::Type::Sweat; }
            else if (cmd == "play" || cmd == "p") { c.type = Command::Type::PlayCurrent; }
            else if (cmd == "pos") {
                c.type = Command::Type::PlayPosition;
                if (!(iss >> c.a >> c.b)) {
                    std::cout << "Usage: pos <string 0..5> <fret 0..12>\n";
                    continue;
                }
            }
            else if (cmd == "melody") { c.type = Command::Type::Melody; }
            else if (cmd == "stop")   { c.type = Command::Type::StopMelody; }
            else if (cmd == "quit" || cmd == "exit") {
                c.type = Command::Type::Quit;
                cq.push(c);
                break;
            }
            else if (fretboard::parse_pitch_class(cmd)) {
                c.type = Command::Type::Guess;
                c.text = cmd;
            }
            else {
                std::cout << "Unknown. Type 'help'.\n";
                continue;
            }
            cq.push(c);
        }
        running.store(false);
    });
}

} // namespace ui

#endif // FRETBOARD_UI_CLI_HPP
