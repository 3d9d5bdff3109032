/**
 * @file AudioOutput.hpp
 * @brief The output device as the synthesizer sees it.
 */

#ifndef FRETBOARD_AUDIO_OUTPUT_HPP
#define FRETBOARD_AUDIO_OUTPUT_HPP

#include "dsp/PluckTone.hpp"
#include "dsp/routing/ToneMixer.hpp"
#include "hal/AudioDriver.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace fretboard {

/**
 * @brief Output capability: acquire, read the output clock, schedule tones.
 *
 * open() is called lazily by the synthesizer before the first tone and may
 * fail (no device, device busy); the other calls are only made after a
 * successful open().
 */
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    /**
     * @return false if the device could not be acquired.
     */
    virtual bool open() = 0;

    virtual int sample_rate() const = 0;

    /**
     * @brief Output clock: frames rendered since open().
     */
    virtual uint64_t current_frame() const = 0;

    /**
     * @brief Hand a tone to the device, onset at the given output frame.
     */
    virtual void schedule(std::shared_ptr<PluckTone> tone, uint64_t start_frame) = 0;
};

/**
 * @brief Accepts and discards every tone. Used for --mute.
 */
class NullAudioOutput : public AudioOutput {
public:
    explicit NullAudioOutput(int sample_rate = 48000) : sample_rate_(sample_rate) {}

    bool open() override { return true; }
    int sample_rate() const override { return sample_rate_; }
    uint64_t current_frame() const override { return 0; }
    void schedule(std::shared_ptr<PluckTone>, uint64_t) override {}

private:
    int sample_rate_;
};

/**
 * @brief Renders scheduled tones through a hal::AudioDriver.
 *
 * The driver is built by the factory inside open(), so constructing this
 * object never touches hardware.
 */
class DriverAudioOutput : public AudioOutput {
public:
    using DriverFactory = std::function<std::unique_ptr<hal::AudioDriver>()>;

    explicit DriverAudioOutput(DriverFactory factory);
    ~DriverAudioOutput() override;

    DriverAudioOutput(const DriverAudioOutput&) = delete;
    DriverAudioOutput& operator=(const DriverAudioOutput&) = delete;

    bool open() override;
    int sample_rate() const override;
    uint64_t current_frame() const override { return frame_clock_.load(std::memory_order_acquire); }
    void schedule(std::shared_ptr<PluckTone> tone, uint64_t start_frame) override;

    /**
     * @brief Render callback body, exposed so tests can pull blocks offline.
     */
    void render(std::span<float> output);

    size_t active_tones() { return mixer_.active_count(); }

private:
    DriverFactory factory_;
    std::unique_ptr<hal::AudioDriver> driver_;
    ToneMixer mixer_;
    std::atomic<uint64_t> frame_clock_{0};
};

} // namespace fretboard

#endif // FRETBOARD_AUDIO_OUTPUT_HPP
