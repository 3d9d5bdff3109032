/**
 * @file AlsaDriver.cpp
 * @brief ALSA playback driver.
 */

#include "AlsaDriver.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <pthread.h>

namespace hal {

namespace {

constexpr int RT_PRIORITY = 80;
constexpr unsigned int PERIODS_PER_BUFFER = 4;

std::string alsa_error(const std::string& what, int err) {
    return what + " (" + snd_strerror(err) + ")";
}

// Frees a hw_params block on every exit path of open_pcm().
struct HwParams {
    snd_pcm_hw_params_t* ptr = nullptr;
    ~HwParams() {
        if (ptr) snd_pcm_hw_params_free(ptr);
    }
};

} // namespace

AlsaDriver::AlsaDriver(const fretboard::AudioDeviceSettings& settings)
    : device_(settings.device)
    , sample_rate_(settings.sample_rate)
    , period_frames_(settings.block_size)
    , channels_(settings.channels)
{
}

AlsaDriver::~AlsaDriver() {
    stop();
}

void AlsaDriver::set_callback(AudioCallback callback) {
    callback_ = std::move(callback);
}

std::string AlsaDriver::description() const {
    return "ALSA " + device_ + " " + std::to_string(sample_rate_) + " Hz, " +
           std::to_string(period_frames_) + " frames, " + std::to_string(channels_) + " ch, " +
           (s32_ ? "S32_LE" : "S16_LE");
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!open_pcm()) {
        close_pcm();
        return false;
    }

    running_ = true;
    playback_thread_ = std::thread(&AlsaDriver::playback_loop, this);
    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (playback_thread_.joinable()) {
        playback_thread_.join();
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_) {
        snd_pcm_drop(pcm_);
        snd_pcm_close(pcm_);
        pcm_ = nullptr;
    }
}

bool AlsaDriver::open_pcm() {
    int err = snd_pcm_open(&pcm_, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        pcm_ = nullptr;
        LOG_ERROR("ALSA", alsa_error("Cannot open audio device " + device_, err));
        return false;
    }

    HwParams hw;
    if ((err = snd_pcm_hw_params_malloc(&hw.ptr)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Cannot allocate hardware parameters", err));
        return false;
    }
    if ((err = snd_pcm_hw_params_any(pcm_, hw.ptr)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Cannot read hardware configuration space", err));
        return false;
    }
    if ((err = snd_pcm_hw_params_set_access(pcm_, hw.ptr, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Interleaved access not supported", err));
        return false;
    }

    s32_ = snd_pcm_hw_params_set_format(pcm_, hw.ptr, SND_PCM_FORMAT_S32_LE) >= 0;
    if (!s32_) {
        LOG_WARN("ALSA", "S32_LE refused, trying S16_LE");
        if ((err = snd_pcm_hw_params_set_format(pcm_, hw.ptr, SND_PCM_FORMAT_S16_LE)) < 0) {
            LOG_ERROR("ALSA", alsa_error("No supported sample format", err));
            return false;
        }
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_, hw.ptr, &rate, nullptr)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Cannot set sample rate", err));
        return false;
    }

    unsigned int channels = static_cast<unsigned int>(channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_, hw.ptr, &channels)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Cannot set channel count", err));
        return false;
    }

    snd_pcm_uframes_t period = static_cast<snd_pcm_uframes_t>(period_frames_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_, hw.ptr, &period, nullptr)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Cannot set period size", err));
        return false;
    }

    unsigned int periods = PERIODS_PER_BUFFER;
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_, hw.ptr, &periods, nullptr)) < 0) {
        LOG_DEBUG("ALSA", alsa_error("Keeping default period count", err));
    }

    if ((err = snd_pcm_hw_params(pcm_, hw.ptr)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Cannot apply hardware parameters", err));
        return false;
    }
    if ((err = snd_pcm_prepare(pcm_)) < 0) {
        LOG_ERROR("ALSA", alsa_error("Cannot prepare device", err));
        return false;
    }

    sample_rate_ = static_cast<int>(rate);
    channels_ = static_cast<int>(channels);
    period_frames_ = static_cast<int>(period);

    const size_t interleaved = static_cast<size_t>(period_frames_) * static_cast<size_t>(channels_);
    mono_.assign(static_cast<size_t>(period_frames_), 0.0f);
    out_s32_.assign(s32_ ? interleaved : 0, 0);
    out_s16_.assign(s32_ ? 0 : interleaved, 0);

    LOG_INFO("ALSA", "Opened " + description());
    return true;
}

void AlsaDriver::playback_loop() {
    // Without real-time priority playback still works, with more risk of xruns.
    sched_param param{};
    param.sched_priority = RT_PRIORITY;
    const int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res == EPERM) {
        LOG_WARN("ALSA", "SCHED_FIFO denied (raise ulimit -r to 80)");
    } else if (res != 0) {
        LOG_WARN("ALSA", "SCHED_FIFO failed: " + std::to_string(res));
    } else {
        LOG_DEBUG("ALSA", "Playback thread at SCHED_FIFO 80");
    }

    while (running_) {
        if (!callback_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        write_period();
    }
}

void AlsaDriver::write_period() {
    std::fill(mono_.begin(), mono_.end(), 0.0f);

    const auto begin = std::chrono::steady_clock::now();
    callback_(std::span<float>(mono_));
    const auto render_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - begin).count();
    // Only renders that ate the whole period are worth reporting
    const auto budget_us = static_cast<long long>(period_frames_) * 1000000LL / sample_rate_;
    if (render_us > budget_us) {
        fretboard::Logger::instance().log_event("PROC_US", static_cast<float>(render_us));
    }

    interleave();
    const void* data = s32_ ? static_cast<const void*>(out_s32_.data())
                            : static_cast<const void*>(out_s16_.data());

    const snd_pcm_sframes_t written =
        snd_pcm_writei(pcm_, data, static_cast<snd_pcm_uframes_t>(period_frames_));
    if (written < 0) {
        recover(static_cast<int>(written));
    }
}

void AlsaDriver::interleave() {
    const size_t stride = static_cast<size_t>(channels_);
    for (size_t i = 0; i < mono_.size(); ++i) {
        const float sample = std::clamp(mono_[i], -1.0f, 1.0f);
        if (s32_) {
            const auto value = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
            std::fill_n(out_s32_.begin() + static_cast<std::ptrdiff_t>(i * stride), stride, value);
        } else {
            const auto value = static_cast<int16_t>(sample * 32767.0f);
            std::fill_n(out_s16_.begin() + static_cast<std::ptrdiff_t>(i * stride), stride, value);
        }
    }
}

void AlsaDriver::recover(int err) {
    fretboard::Logger::instance().log_event("XRUN", static_cast<float>(err));
    if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_)) == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    if (err < 0) {
        const int prepared = snd_pcm_prepare(pcm_);
        if (prepared < 0) {
            LOG_ERROR("ALSA", alsa_error("Cannot recover from write error", prepared));
            running_ = false;
        }
    }
}

} // namespace hal
