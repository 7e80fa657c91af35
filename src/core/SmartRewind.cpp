#include "core/SmartRewind.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace folio::core {

namespace {

struct Anchor {
    double pause_seconds;
    double rewind_seconds;
};

// 3s -> 3s, 30s -> 10s, 5min -> 20s, 1h -> 30s, 24h -> 60s
constexpr std::array<Anchor, 5> ANCHORS{{
    {3.0, 3.0},
    {30.0, 10.0},
    {300.0, 20.0},
    {3600.0, 30.0},
    {86400.0, 60.0},
}};

}  // namespace

int SmartRewind::seconds_for_pause(int64_t pause_ms, int max_seconds) {
    if (pause_ms < MIN_PAUSE_MS || max_seconds <= 0) {
        return 0;
    }

    double pause = static_cast<double>(pause_ms) / 1000.0;
    double rewind = ANCHORS.back().rewind_seconds;

    for (size_t i = 1; i < ANCHORS.size(); ++i) {
        const auto& lo = ANCHORS[i - 1];
        const auto& hi = ANCHORS[i];
        if (pause <= hi.pause_seconds) {
            double t = std::log(pause / lo.pause_seconds) / std::log(hi.pause_seconds / lo.pause_seconds);
            rewind = lo.rewind_seconds + t * (hi.rewind_seconds - lo.rewind_seconds);
            break;
        }
    }

    return std::min(static_cast<int>(std::lround(rewind)), max_seconds);
}

double SmartRewind::resume_position(double position, double chapter_start,
                                    int64_t pause_ms, int max_seconds) {
    int rewind = seconds_for_pause(pause_ms, max_seconds);
    if (rewind <= 0 || position <= chapter_start) {
        return position;
    }
    return std::max(chapter_start, position - rewind);
}

}  // namespace folio::core
