#pragma once

#include "model/Book.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio::model {

// Snapshot pushed by the audio engine. Positions are book-global.
struct PlaybackStatus {
    double position = 0.0;
    double duration = 0.0;
    bool is_playing = false;
    bool is_buffering = false;
    bool did_just_finish = false;

    bool operator==(const PlaybackStatus&) const = default;
};

enum class SeekDirection {
    Forward,
    Backward,
};

enum class SeekMode {
    Idle,
    Discrete,
    Continuous,
};

// seek_position and direction are meaningful only while is_seeking.
struct SeekState {
    bool is_seeking = false;
    double seek_position = 0.0;
    double seek_start_position = 0.0;
    std::optional<SeekDirection> direction;
    SeekMode mode = SeekMode::Idle;

    bool operator==(const SeekState&) const = default;
};

// The authoritative transport view owned by the coordinator.
struct TransportState {
    double position = 0.0;
    double duration = 0.0;
    bool is_playing = false;
    bool is_buffering = false;
    bool is_loaded = false;
    bool is_loading = false;
    double playback_rate = 1.0;

    bool operator==(const TransportState&) const = default;
};

enum class SleepTimerKind {
    Off,
    Countdown,
    EndOfChapter,
};

struct SleepTimerState {
    SleepTimerKind kind = SleepTimerKind::Off;
    int remaining_seconds = 0;
    int64_t deadline_ms = 0;   // Countdown only
    double chapter_end = 0.0;  // EndOfChapter only, seconds

    bool operator==(const SleepTimerState&) const = default;
};

// Per-session bookkeeping. Reset by every load.
struct PlaybackSession {
    std::string book_id;
    double duration = 0.0;
    std::vector<Chapter> chapters;
    BookMetadata metadata;
    bool is_offline = true;

    uint64_t load_generation = 0;
    int64_t last_progress_save_ms = 0;
    bool finish_handled = false;
    bool finish_pending = false;  // Engine finished while a seek was open
};

}  // namespace folio::model
