#pragma once

#include <cstdint>

namespace folio::core {

// Resume rewind that grows with the length of the pause on a log curve.
class SmartRewind {
public:
    static constexpr int64_t MIN_PAUSE_MS = 3000;

    // Whole seconds to rewind after a pause of `pause_ms`, capped at
    // `max_seconds`. Pauses shorter than MIN_PAUSE_MS rewind nothing.
    [[nodiscard]] static int seconds_for_pause(int64_t pause_ms, int max_seconds);

    // Resume position after rewinding from `position`. Never moves before
    // `chapter_start` and never forward.
    [[nodiscard]] static double resume_position(double position, double chapter_start,
                                                int64_t pause_ms, int max_seconds);
};

}  // namespace folio::core
