#pragma once

#include "engine/AudioEngine.hpp"
#include "events/Scheduler.hpp"
#include "model/Playback.hpp"
#include <chrono>
#include <functional>
#include <optional>

namespace folio::core {

// Owns SeekState and decides when a user seek becomes the authoritative
// position. States: Idle, Discrete (scrubbing), Continuous (hold-to-seek).
//
// Engine seeks are fire-and-forget: a rejected seek is logged and the
// pending seek position is kept. Only commit_seek() and cancel_seek()
// write TransportState::position.
class SeekCoordinator {
public:
    struct Settings {
        double rewind_step_seconds = 2.0;
        double fast_forward_step_seconds = 5.0;
        std::chrono::milliseconds tick_interval{100};
    };

    using ChangeListener = std::function<void()>;
    using CommitListener = std::function<void(double position)>;

    SeekCoordinator(engine::AudioEngine& engine, events::Scheduler& scheduler,
                    model::TransportState& transport, Settings settings);
    ~SeekCoordinator();

    SeekCoordinator(const SeekCoordinator&) = delete;
    SeekCoordinator& operator=(const SeekCoordinator&) = delete;

    void start_seeking(std::optional<model::SeekDirection> direction = std::nullopt);
    void update_seek_position(double target);
    void commit_seek();
    void cancel_seek();

    // Start + update + commit in one step.
    void seek_to(double target);

    void start_continuous_seeking(model::SeekDirection direction);
    void stop_continuous_seeking();

    // Drops any seek in progress without touching the engine. Used when the
    // session is torn down.
    void reset();

    void set_settings(Settings settings) { settings_ = settings; }
    void set_on_change(ChangeListener listener) { on_change_ = std::move(listener); }
    void set_on_commit(CommitListener listener) { on_commit_ = std::move(listener); }

    [[nodiscard]] const model::SeekState& state() const { return state_; }
    [[nodiscard]] bool is_seeking() const { return state_.is_seeking; }
    [[nodiscard]] double display_position() const;

private:
    double clamp(double position) const;
    void issue_seek(double position);
    bool step();
    bool at_boundary(double position) const;
    void finish(double final_position);
    void notify();

    engine::AudioEngine& engine_;
    events::Scheduler& scheduler_;
    model::TransportState& transport_;
    Settings settings_;

    model::SeekState state_;
    events::TaskHandle ticker_;
    bool resume_after_continuous_ = false;

    ChangeListener on_change_;
    CommitListener on_commit_;
};

}  // namespace folio::core
