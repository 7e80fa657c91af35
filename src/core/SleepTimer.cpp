#include "core/SleepTimer.hpp"
#include "util/Logger.hpp"
#include <chrono>
#include <cmath>
#include <format>

namespace folio::core {

SleepTimer::SleepTimer(events::Scheduler& scheduler, ExpireCallback on_expire)
    : scheduler_(scheduler), on_expire_(std::move(on_expire)) {}

SleepTimer::~SleepTimer() {
    ticker_.cancel();
}

bool SleepTimer::set(double minutes) {
    if (!std::isfinite(minutes) || minutes <= 0.0) {
        util::Logger::warn(std::format("SleepTimer: Rejected duration of {} minutes", minutes));
        return false;
    }

    ticker_.cancel();
    state_ = model::SleepTimerState{};
    state_.kind = model::SleepTimerKind::Countdown;
    state_.deadline_ms = scheduler_.clock().now_ms() + std::llround(minutes * 60000.0);
    state_.remaining_seconds = compute_remaining();

    ticker_ = scheduler_.schedule("sleep-timer", std::chrono::seconds(1), [this]() { tick(); });

    util::Logger::info(std::format("SleepTimer: Set for {} minutes", minutes));
    notify();
    return true;
}

bool SleepTimer::set_end_of_chapter(double chapter_end) {
    if (!std::isfinite(chapter_end) || chapter_end <= 0.0) {
        util::Logger::warn("SleepTimer: Rejected end-of-chapter target");
        return false;
    }

    ticker_.cancel();
    state_ = model::SleepTimerState{};
    state_.kind = model::SleepTimerKind::EndOfChapter;
    state_.chapter_end = chapter_end;

    util::Logger::info(std::format("SleepTimer: Sleeping at end of chapter ({:.1f}s)", chapter_end));
    notify();
    return true;
}

void SleepTimer::retarget_chapter_end(double chapter_end) {
    if (state_.kind != model::SleepTimerKind::EndOfChapter || state_.chapter_end == chapter_end) {
        return;
    }
    state_.chapter_end = chapter_end;
    util::Logger::debug(std::format("SleepTimer: End-of-chapter target moved to {:.1f}s", chapter_end));
    notify();
}

bool SleepTimer::extend(double minutes) {
    if (!std::isfinite(minutes) || minutes <= 0.0) {
        util::Logger::warn(std::format("SleepTimer: Rejected extension of {} minutes", minutes));
        return false;
    }

    switch (state_.kind) {
        case model::SleepTimerKind::Off:
            return set(minutes);
        case model::SleepTimerKind::EndOfChapter:
            util::Logger::warn("SleepTimer: Cannot extend an end-of-chapter timer");
            return false;
        case model::SleepTimerKind::Countdown:
            break;
    }

    state_.deadline_ms += std::llround(minutes * 60000.0);
    state_.remaining_seconds = compute_remaining();
    util::Logger::info(std::format("SleepTimer: Extended by {} minutes, {}s left", minutes, state_.remaining_seconds));
    notify();
    return true;
}

void SleepTimer::clear() {
    ticker_.cancel();
    if (state_.kind == model::SleepTimerKind::Off) {
        return;
    }
    state_ = model::SleepTimerState{};
    util::Logger::info("SleepTimer: Cleared");
    notify();
}

void SleepTimer::chapter_end_reached() {
    if (state_.kind != model::SleepTimerKind::EndOfChapter) {
        return;
    }
    expire();
}

void SleepTimer::tick() {
    if (state_.kind != model::SleepTimerKind::Countdown) {
        ticker_.cancel();
        return;
    }

    state_.remaining_seconds = compute_remaining();
    if (state_.remaining_seconds <= 0) {
        expire();
        return;
    }
    notify();
}

void SleepTimer::expire() {
    ticker_.cancel();
    state_ = model::SleepTimerState{};
    util::Logger::info("SleepTimer: Expired");
    notify();
    if (on_expire_) {
        on_expire_();
    }
}

int SleepTimer::compute_remaining() const {
    int64_t left_ms = state_.deadline_ms - scheduler_.clock().now_ms();
    if (left_ms <= 0) return 0;
    return static_cast<int>((left_ms + 999) / 1000);
}

void SleepTimer::notify() {
    if (on_change_) {
        on_change_();
    }
}

}  // namespace folio::core
