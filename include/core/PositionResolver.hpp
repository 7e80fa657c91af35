#pragma once

#include "model/Records.hpp"
#include <cstdint>
#include <optional>

namespace folio::core {

struct RemotePosition {
    double current_time = 0.0;
    int64_t updated_at = 0;  // epoch ms
};

// Picks the resume position when a book starts.
class PositionResolver {
public:
    static constexpr int64_t SAME_SESSION_WINDOW_MS = 30000;
    static constexpr double CONFLICT_THRESHOLD_SECONDS = 120.0;

    // Local and server positions saved within SAME_SESSION_WINDOW_MS of each
    // other are the same listening session and the further one wins.
    // Otherwise the more recently updated one wins.
    [[nodiscard]] static double resolve(const std::optional<model::ProgressRecord>& local,
                                        const std::optional<RemotePosition>& server);

    // Clamps into [0, duration]; a position at or past the end restarts the
    // book from 0.
    [[nodiscard]] static double start_position(double resolved, double duration);
};

}  // namespace folio::core
