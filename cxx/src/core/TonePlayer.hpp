/**
 * @file TonePlayer.hpp
 * @brief Fire-and-forget tone sink used by the quiz and the melody sequencer.
 */

#ifndef FRETBOARD_TONE_PLAYER_HPP
#define FRETBOARD_TONE_PLAYER_HPP

namespace fretboard {

class TonePlayer {
public:
    virtual ~TonePlayer() = default;

    /**
     * @brief Start a tone and return immediately.
     *
     * Implementations must tolerate overlapping calls and must not throw on
     * a missing audio device.
     */
    virtual void play(double frequency_hz) = 0;
};

} // namespace fretboard

#endif // FRETBOARD_TONE_PLAYER_HPP
