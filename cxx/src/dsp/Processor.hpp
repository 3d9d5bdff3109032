/**
 * @file Processor.hpp
 * @brief Block processing interface shared by oscillators, envelopes and tones.
 */

#ifndef FRETBOARD_PROCESSOR_HPP
#define FRETBOARD_PROCESSOR_HPP

#include <span>

namespace fretboard {

/**
 * @brief A node in a pluck's signal chain (Pull Model).
 *
 * The audio callback pulls a mono block from the mixer, the mixer pulls each
 * tone and each tone pulls its oscillators and envelopes. Nothing is pushed.
 * Processors are not thread-safe; each one is owned by a single tone.
 */
class Processor {
public:
    virtual ~Processor() = default;

    /**
     * @brief Overwrite every sample of the block.
     */
    void pull(std::span<float> output) {
        if (output.empty()) return;
        do_pull(output);
    }

    /**
     * @brief Return to the state right after construction.
     */
    virtual void reset() = 0;

protected:
    virtual void do_pull(std::span<float> output) = 0;
};

} // namespace fretboard

#endif // FRETBOARD_PROCESSOR_HPP
