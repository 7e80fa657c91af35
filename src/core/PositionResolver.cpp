#include "core/PositionResolver.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace folio::core {

double PositionResolver::resolve(const std::optional<model::ProgressRecord>& local,
                                 const std::optional<RemotePosition>& server) {
    if (!local && !server) return 0.0;
    if (!server) return local->current_time;
    if (!local) return server->current_time;

    if (std::abs(local->current_time - server->current_time) > CONFLICT_THRESHOLD_SECONDS) {
        util::Logger::warn(std::format("PositionResolver: Local {:.1f}s and server {:.1f}s disagree",
                                       local->current_time, server->current_time));
    }

    if (std::llabs(local->updated_at - server->updated_at) <= SAME_SESSION_WINDOW_MS) {
        return std::max(local->current_time, server->current_time);
    }
    return local->updated_at > server->updated_at ? local->current_time : server->current_time;
}

double PositionResolver::start_position(double resolved, double duration) {
    if (!std::isfinite(resolved) || resolved < 0.0) return 0.0;
    if (duration > 0.0 && resolved >= duration) {
        util::Logger::info("PositionResolver: Saved position is at the end, restarting from 0");
        return 0.0;
    }
    return resolved;
}

}  // namespace folio::core
