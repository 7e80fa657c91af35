#include "core/PlaybackSettings.hpp"
#include <algorithm>

namespace folio::core {

PlaybackSettings PlaybackSettings::from_config(const backend::Config& cfg) {
    PlaybackSettings s;
    s.skip_forward_seconds = std::max(1, cfg.skip_forward_seconds);
    s.skip_backward_seconds = std::max(1, cfg.skip_backward_seconds);
    s.playback_rate = std::clamp(cfg.playback_rate, MIN_RATE, MAX_RATE);
    s.chapter_restart_threshold_seconds = std::max(0.0, cfg.chapter_restart_threshold_seconds);
    s.smart_rewind = cfg.smart_rewind;
    s.smart_rewind_max_seconds = std::max(0, cfg.smart_rewind_max_seconds);
    s.sleep_extend_minutes = std::max(1, cfg.sleep_extend_minutes);

    s.seek.rewind_step_seconds = std::max(0.1, cfg.rewind_step_seconds);
    s.seek.fast_forward_step_seconds = std::max(0.1, cfg.fast_forward_step_seconds);
    s.seek.tick_interval = std::chrono::milliseconds(std::max(10, cfg.continuous_interval_ms));

    s.reconcile.save_interval = std::chrono::seconds(std::max(1, cfg.progress_save_interval_seconds));
    s.reconcile.finish_tolerance_seconds = std::max(0.0, cfg.finish_tolerance_seconds);
    s.reconcile.chapter_end_tolerance_seconds = std::max(0.0, cfg.chapter_end_tolerance_seconds);
    return s;
}

}  // namespace folio::core
