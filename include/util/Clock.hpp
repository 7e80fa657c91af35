#pragma once

#include <cstdint>

namespace folio::util {

// Wall-clock source in epoch milliseconds. Timers and throttles read time
// only through this interface so tests can drive it by hand.
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] int64_t now_ms() const override;
};

}  // namespace folio::util
