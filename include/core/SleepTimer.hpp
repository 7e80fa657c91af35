#pragma once

#include "events/Scheduler.hpp"
#include "model/Playback.hpp"
#include <functional>

namespace folio::core {

// Countdown measured against a wall-clock deadline, so skipped or late
// ticks never stretch it. The end-of-chapter kind holds no countdown: the
// reconciler watches the position and calls chapter_end_reached().
class SleepTimer {
public:
    using ExpireCallback = std::function<void()>;
    using ChangeListener = std::function<void()>;

    SleepTimer(events::Scheduler& scheduler, ExpireCallback on_expire);
    ~SleepTimer();

    SleepTimer(const SleepTimer&) = delete;
    SleepTimer& operator=(const SleepTimer&) = delete;

    // Rejects non-positive and non-finite durations.
    bool set(double minutes);
    bool set_end_of_chapter(double chapter_end);
    void retarget_chapter_end(double chapter_end);

    // Pushes a running countdown out, or starts one if the timer is off.
    bool extend(double minutes);

    // Stops the timer without pausing playback.
    void clear();

    void chapter_end_reached();

    void set_on_change(ChangeListener listener) { on_change_ = std::move(listener); }

    [[nodiscard]] const model::SleepTimerState& state() const { return state_; }
    [[nodiscard]] bool active() const { return state_.kind != model::SleepTimerKind::Off; }

private:
    void tick();
    void expire();
    int compute_remaining() const;
    void notify();

    events::Scheduler& scheduler_;
    ExpireCallback on_expire_;
    ChangeListener on_change_;

    model::SleepTimerState state_;
    events::TaskHandle ticker_;
};

}  // namespace folio::core
