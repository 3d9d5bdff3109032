#include "AudioOutput.hpp"
#include "core/Logger.hpp"

namespace fretboard {

DriverAudioOutput::DriverAudioOutput(DriverFactory factory)
    : factory_(std::move(factory))
{
}

DriverAudioOutput::~DriverAudioOutput() {
    if (driver_) {
        driver_->stop();
    }
}

bool DriverAudioOutput::open() {
    if (driver_) return true;
    if (!factory_) return false;

    auto driver = factory_();
    if (!driver) {
        LOG_ERROR("Output", "No audio driver for this platform");
        return false;
    }

    driver->set_callback([this](std::span<float> output) {
        render(output);
    });

    if (!driver->start()) {
        return false;
    }
    LOG_DEBUG("Output", "Rendering to " + driver->description());
    driver_ = std::move(driver);
    return true;
}

int DriverAudioOutput::sample_rate() const {
    return driver_ ? driver_->sample_rate() : 0;
}

void DriverAudioOutput::schedule(std::shared_ptr<PluckTone> tone, uint64_t start_frame) {
    mixer_.schedule(std::move(tone), start_frame);
}

void DriverAudioOutput::render(std::span<float> output) {
    const uint64_t block_start = frame_clock_.load(std::memory_order_relaxed);
    mixer_.render(output, block_start);
    frame_clock_.store(block_start + output.size(), std::memory_order_release);
}

} // namespace fretboard
