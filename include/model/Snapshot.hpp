#pragma once

#include "model/Playback.hpp"
#include "model/Records.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio::model {

/// Read-only view of the player handed to the UI.
///
/// `position` is the display position: the pending seek target while a
/// seek is in progress, the authoritative position otherwise.
///
/// Bookmarks are shared, not copied: a new list is allocated only when
/// the bookmarks change, so publishing on every position update stays cheap.
struct Snapshot {
    uint64_t seq = 0;

    std::string book_id;
    std::string title;
    double position = 0.0;
    double duration = 0.0;
    bool is_playing = false;
    bool is_buffering = false;
    bool is_loading = false;
    bool is_loaded = false;
    double playback_rate = 1.0;

    bool is_seeking = false;
    std::optional<SeekDirection> seek_direction;

    int current_chapter_index = 0;
    int chapter_count = 0;
    std::string current_chapter_title;

    SleepTimerKind sleep_timer_kind = SleepTimerKind::Off;
    int sleep_timer_remaining = 0;

    std::shared_ptr<const std::vector<Bookmark>> bookmarks;
    std::string last_error;

    bool operator==(const Snapshot&) const = default;
};

}  // namespace folio::model
