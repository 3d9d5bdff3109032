/**
 * @file AlsaDriver.hpp
 * @brief ALSA playback driver.
 */

#ifndef FRETBOARD_HAL_ALSA_DRIVER_HPP
#define FRETBOARD_HAL_ALSA_DRIVER_HPP

#include "hal/AudioDriver.hpp"
#include "core/TrainerConfig.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace hal {

/**
 * @brief Blocking snd_pcm_writei loop on a dedicated thread.
 *
 * Each mono block from the callback is copied to every hardware channel and
 * written interleaved as S32_LE, or S16_LE when the device refuses 32-bit.
 * Rate, period and channel count are negotiated with the *_near setters, so
 * the values read back after start() may differ from the settings.
 */
class AlsaDriver : public AudioDriver {
public:
    explicit AlsaDriver(const fretboard::AudioDeviceSettings& settings);
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    void set_callback(AudioCallback callback) override;
    bool start() override;
    void stop() override;

    int sample_rate() const override { return sample_rate_; }
    std::string description() const override;

private:
    bool open_pcm();
    void close_pcm();
    void playback_loop();
    void write_period();
    void recover(int err);
    void interleave();

    std::string device_;
    int sample_rate_;
    int period_frames_;
    int channels_;
    bool s32_ = true;

    snd_pcm_t* pcm_ = nullptr;
    AudioCallback callback_;
    std::atomic<bool> running_{false};
    std::thread playback_thread_;

    std::vector<float> mono_;
    std::vector<int32_t> out_s32_;
    std::vector<int16_t> out_s16_;
};

} // namespace hal

#endif // FRETBOARD_HAL_ALSA_DRIVER_HPP
