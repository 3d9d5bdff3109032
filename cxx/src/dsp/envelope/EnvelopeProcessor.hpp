/**
 * @file EnvelopeProcessor.hpp
 * @brief Base class for envelope processors.
 */

#ifndef FRETBOARD_ENVELOPE_PROCESSOR_HPP
#define FRETBOARD_ENVELOPE_PROCESSOR_HPP

#include "dsp/Processor.hpp"

namespace fretboard {

/**
 * @brief Base class for envelope processors.
 *
 * Envelopes produce a gain curve rather than audio; a tone multiplies its
 * oscillator output by the pulled envelope block.
 */
class EnvelopeProcessor : public Processor {
public:
    virtual ~EnvelopeProcessor() = default;

    /**
     * @brief Trigger the envelope's "on" stage (e.g., Attack).
     */
    virtual void gate_on() = 0;

    /**
     * @brief Trigger the envelope's "off" stage, if it has one.
     */
    virtual void gate_off() = 0;

    /**
     * @return true while the envelope is processing, false once it has finished.
     */
    virtual bool is_active() const = 0;
};

} // namespace fretboard

#endif // FRETBOARD_ENVELOPE_PROCESSOR_HPP
