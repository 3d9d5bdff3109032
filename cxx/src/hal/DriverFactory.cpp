#include "DriverFactory.hpp"
#include "core/Logger.hpp"

#if defined(__linux__)
#include "alsa/AlsaDriver.hpp"
#endif

namespace hal {

std::unique_ptr<AudioDriver> create_driver(const fretboard::AudioDeviceSettings& settings) {
#if defined(__linux__)
    return std::make_unique<AlsaDriver>(settings);
#else
    (void)settings;
    LOG_ERROR("HAL", "No audio driver supported on this platform");
    return nullptr;
#endif
}

} // namespace hal
