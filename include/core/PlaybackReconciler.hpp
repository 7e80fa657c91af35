#pragma once

#include "backend/ProgressStore.hpp"
#include "core/SeekCoordinator.hpp"
#include "core/SleepTimer.hpp"
#include "model/Playback.hpp"
#include "util/Clock.hpp"
#include <chrono>

namespace folio::core {

// Folds engine status snapshots into the authoritative TransportState.
// While a seek is in progress the engine's position is ignored.
class PlaybackReconciler {
public:
    struct Settings {
        std::chrono::milliseconds save_interval{30000};
        double finish_tolerance_seconds = 5.0;
        double chapter_end_tolerance_seconds = 1.0;
    };

    struct Result {
        bool finished = false;             // Book finished on this snapshot
        bool chapter_end_reached = false;  // End-of-chapter sleep target crossed
        bool saved = false;                // Throttled or final save succeeded
    };

    PlaybackReconciler(model::TransportState& transport, model::PlaybackSession& session,
                       const SeekCoordinator& seek, const SleepTimer& sleep_timer,
                       backend::ProgressGateway& progress, const util::Clock& clock,
                       Settings settings);

    Result apply(const model::PlaybackStatus& status);

    // Writes the current position now. Returns false when nothing was
    // written (no book, or the gateway failed).
    bool save_progress(bool is_finished = false);

    // A seek that lands before the tail re-arms finish detection. A finish
    // the engine reported while the seek was open is decided here, against
    // the committed position.
    Result on_seek_committed(double position);

    void set_settings(Settings settings) { settings_ = settings; }

private:
    bool is_genuine_finish() const;
    void handle_finish(Result& result);

    model::TransportState& transport_;
    model::PlaybackSession& session_;
    const SeekCoordinator& seek_;
    const SleepTimer& sleep_timer_;
    backend::ProgressGateway& progress_;
    const util::Clock& clock_;
    Settings settings_;
};

}  // namespace folio::core
