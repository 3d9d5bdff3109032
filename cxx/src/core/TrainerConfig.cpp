#include "TrainerConfig.hpp"

namespace fretboard {

std::vector<MelodyEntry> fun_melody() {
    return {
        // G major opening
        {{2, 0}, 250}, // D
        {{3, 0}, 250}, // G
        {{4, 0}, 250}, // B
        {{3, 0}, 250}, // G
        // Climb
        {{5, 0}, 200}, // E
        {{5, 3}, 200}, // G
        {{5, 5}, 300}, // A
        // Bounce
        {{4, 3}, 200}, // D
        {{5, 5}, 200}, // A
        {{4, 3}, 200}, // D
        {{5, 3}, 300}, // G
        // Descending run
        {{3, 4}, 180}, // B
        {{3, 2}, 180}, // A
        {{3, 0}, 180}, // G
        {{2, 2}, 180}, // E
        {{2, 0}, 300}, // D
        // Finish
        {{1, 2}, 250}, // B
        {{2, 2}, 250}, // E
        {{3, 0}, 400}, // G (hold)
    };
}

} // namespace fretboard
