#pragma once

#include "backend/Config.hpp"
#include "core/PlaybackReconciler.hpp"
#include "core/SeekCoordinator.hpp"

namespace folio::core {

struct PlaybackSettings {
    static constexpr double MIN_RATE = 0.5;
    static constexpr double MAX_RATE = 3.0;

    double skip_forward_seconds = 30.0;
    double skip_backward_seconds = 30.0;
    double playback_rate = 1.0;
    double chapter_restart_threshold_seconds = 3.0;
    bool smart_rewind = true;
    int smart_rewind_max_seconds = 30;
    double sleep_extend_minutes = 15.0;

    SeekCoordinator::Settings seek;
    PlaybackReconciler::Settings reconcile;

    static PlaybackSettings from_config(const backend::Config& cfg);
};

}  // namespace folio::core
