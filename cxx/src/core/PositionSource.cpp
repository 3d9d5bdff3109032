#include "PositionSource.hpp"

namespace fretboard {

RandomPositionSource::RandomPositionSource(uint32_t seed)
    : engine_(seed)
    , string_dist_(0, NUM_STRINGS - 1)
    , fret_dist_(0, NUM_FRETS)
{
}

Position RandomPositionSource::next() {
    const int string = string_dist_(engine_);
    const int fret = fret_dist_(engine_);
    return Position{string, fret};
}

} // namespace fretboard
