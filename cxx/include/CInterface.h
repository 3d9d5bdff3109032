/**
 * @file CInterface.h
 * @brief C-compatible API layer for the fretboard trainer.
 *
 * Lets a GUI written in another language (Swift, C#, a Qt or GTK front
 * end) drive the quiz. Every user-facing action and every observable
 * output of the trainer is reachable from here. No C++ exception crosses
 * this boundary: failures are reported as -1 (or a null handle).
 */

#ifndef FRETBOARD_C_INTERFACE_H
#define FRETBOARD_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Quiz mode, mirrors fretboard::Quiz::Mode
enum TrainerMode {
    TRAINER_MODE_NORMAL = 0,
    TRAINER_MODE_STUDY  = 1,
    TRAINER_MODE_SWEAT  = 2
};

// Quiz phase, mirrors fretboard::Quiz::Phase
enum TrainerPhase {
    TRAINER_PHASE_ASKING    = 0,
    TRAINER_PHASE_ADVANCING = 1,
    TRAINER_PHASE_ANSWERED  = 2
};

// Opaque handle type
typedef void* TrainerHandle;

/**
 * Lifecycle.
 * config_path may be NULL for built-in defaults. A non-zero mute discards
 * all audio; otherwise the platform driver is opened on the first tone.
 * seed == 0 seeds the position generator from std::random_device.
 * Returns NULL if the config cannot be loaded.
 */
TrainerHandle trainer_create(const char* config_path, int mute, uint32_t seed);
void trainer_destroy(TrainerHandle handle);

/**
 * Actions. Return 1 when applied, 0 when rejected as an invalid transition,
 * -1 on a bad handle or argument.
 */
int trainer_guess(TrainerHandle handle, const char* pitch_name);
int trainer_next(TrainerHandle handle);
int trainer_reset(TrainerHandle handle);
int trainer_set_study_mode(TrainerHandle handle, int on);
int trainer_set_sweat_mode(TrainerHandle handle, int on);
int trainer_toggle_study_mode(TrainerHandle handle);
int trainer_toggle_sweat_mode(TrainerHandle handle);
int trainer_play_current(TrainerHandle handle);
int trainer_play_position(TrainerHandle handle, int string_index, int fret);
int trainer_play_melody(TrainerHandle handle);
int trainer_cancel_melody(TrainerHandle handle);

// Advance countdown, auto-advance and melody by delta_seconds
int trainer_tick(TrainerHandle handle, double delta_seconds);

/**
 * Observable state. Text getters write a NUL-terminated string, truncated
 * to capacity. Optional values return 1 when present and 0 when absent.
 */
int trainer_get_position(TrainerHandle handle, int* string_index, int* fret);
int trainer_get_revealed_note(TrainerHandle handle, char* buffer, size_t capacity);
int trainer_get_score(TrainerHandle handle, unsigned int* correct, unsigned int* total);
int trainer_get_accuracy(TrainerHandle handle);
int trainer_get_feedback(TrainerHandle handle, char* buffer, size_t capacity, int* is_correct);
int trainer_get_mode(TrainerHandle handle);
int trainer_get_phase(TrainerHandle handle);
int trainer_get_time_remaining(TrainerHandle handle, double* seconds);
int trainer_get_now_sounding(TrainerHandle handle, int* string_index, int* fret);
int trainer_audio_available(TrainerHandle handle);

/**
 * Pop one formatted log line. Returns 1 if a line was written, 0 if the
 * log is empty.
 */
int trainer_poll_log(char* buffer, size_t capacity);

// Pure lookups on standard tuning. Return 1 on success, -1 for an
// out-of-range position or a null buffer.
int fretboard_frequency(int string_index, int fret, double* frequency_hz);
int fretboard_note_name(int string_index, int fret, char* buffer, size_t capacity);

#ifdef __cplusplus
}
#endif

#endif // FRETBOARD_C_INTERFACE_H
