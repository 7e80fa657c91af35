#pragma once

#include "model/Playback.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace folio::engine {

// Bounded hand-off from the decode thread to the loop thread. When the
// consumer falls behind the oldest status is dropped; only the newest
// position matters to the reader.
//
// Each status carries the seek epoch the producer had applied when it took
// the reading. drain(min_epoch) discards anything older, so a position read
// before a seek can never surface after it.
class StatusChannel {
public:
    explicit StatusChannel(size_t capacity = 64) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(const model::PlaybackStatus& status, uint64_t epoch = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back({epoch, status});
    }

    std::vector<model::PlaybackStatus> drain(uint64_t min_epoch = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<model::PlaybackStatus> out;
        out.reserve(queue_.size());
        for (const auto& entry : queue_) {
            if (entry.epoch >= min_epoch) {
                out.push_back(entry.status);
            } else {
                ++stale_;
            }
        }
        queue_.clear();
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

    [[nodiscard]] uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    [[nodiscard]] uint64_t stale() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stale_;
    }

private:
    struct Entry {
        uint64_t epoch;
        model::PlaybackStatus status;
    };

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Entry> queue_;
    uint64_t dropped_ = 0;
    uint64_t stale_ = 0;
};

}  // namespace folio::engine
