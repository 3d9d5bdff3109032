/**
 * @file DriverFactory.hpp
 * @brief Builds the native audio driver for the current platform.
 */

#ifndef FRETBOARD_HAL_DRIVER_FACTORY_HPP
#define FRETBOARD_HAL_DRIVER_FACTORY_HPP

#include "AudioDriver.hpp"
#include "core/TrainerConfig.hpp"
#include <memory>

namespace hal {

/**
 * @return nullptr on platforms without a driver.
 */
std::unique_ptr<AudioDriver> create_driver(const fretboard::AudioDeviceSettings& settings);

} // namespace hal

#endif // FRETBOARD_HAL_DRIVER_FACTORY_HPP
