#pragma once

#include <string>

namespace folio::util {

// "m:ss" below an hour, "h:mm:ss" from an hour up. Negative values format as 0.
std::string format_duration(double seconds);

}  // namespace folio::util
