#include "util/TimeFormat.hpp"
#include <cmath>
#include <format>

namespace folio::util {

std::string format_duration(double seconds) {
    long total = std::isfinite(seconds) && seconds > 0.0 ? static_cast<long>(seconds) : 0;
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;
    if (hours > 0) {
        return std::format("{}:{:02}:{:02}", hours, minutes, secs);
    }
    return std::format("{}:{:02}", minutes, secs);
}

}  // namespace folio::util
