/**
 * @file PositionSource.hpp
 * @brief Injectable generator of quiz targets.
 */

#ifndef FRETBOARD_POSITION_SOURCE_HPP
#define FRETBOARD_POSITION_SOURCE_HPP

#include "PitchModel.hpp"
#include <cstdint>
#include <random>

namespace fretboard {

class PositionSource {
public:
    virtual ~PositionSource() = default;
    virtual Position next() = 0;
};

/**
 * @brief Uniform positions: string in [0,6), fret in [0,13).
 */
class RandomPositionSource : public PositionSource {
public:
    explicit RandomPositionSource(uint32_t seed);

    Position next() override;

private:
    std::mt19937 engine_;
    std::uniform_int_distribution<int> string_dist_;
    std::uniform_int_distribution<int> fret_dist_;
};

} // namespace fretboard

#endif // FRETBOARD_POSITION_SOURCE_HPP
