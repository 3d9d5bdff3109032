/**
 * @file AudioDriver.hpp
 * @brief Playback device seam between the synthesizer and the OS sound stack.
 */

#ifndef FRETBOARD_HAL_AUDIO_DRIVER_HPP
#define FRETBOARD_HAL_AUDIO_DRIVER_HPP

#include <functional>
#include <span>
#include <string>

namespace hal {

/**
 * @brief A playback device that pulls mono blocks from a render callback.
 *
 * The driver owns its own thread once started. Channel layout and sample
 * format are the driver's business; the callback only ever sees mono floats.
 */
class AudioDriver {
public:
    using AudioCallback = std::function<void(std::span<float> output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Install the render callback. Must be called before start().
     */
    virtual void set_callback(AudioCallback callback) = 0;

    /**
     * @return false if the device cannot be opened; the driver stays stopped.
     */
    virtual bool start() = 0;

    /**
     * @brief Join the playback thread and close the device. Safe to repeat.
     */
    virtual void stop() = 0;

    /**
     * @return Negotiated rate in Hz; the requested rate before start().
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Human-readable device summary for logs.
     */
    virtual std::string description() const = 0;
};

} // namespace hal

#endif // FRETBOARD_HAL_AUDIO_DRIVER_HPP
