#include "core/SeekCoordinator.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace folio::core {

SeekCoordinator::SeekCoordinator(engine::AudioEngine& engine, events::Scheduler& scheduler,
                                 model::TransportState& transport, Settings settings)
    : engine_(engine), scheduler_(scheduler), transport_(transport), settings_(settings) {}

SeekCoordinator::~SeekCoordinator() {
    ticker_.cancel();
}

void SeekCoordinator::start_seeking(std::optional<model::SeekDirection> direction) {
    if (state_.is_seeking) {
        return;
    }

    state_.is_seeking = true;
    state_.seek_start_position = transport_.position;
    state_.seek_position = transport_.position;
    state_.direction = direction;
    state_.mode = model::SeekMode::Discrete;

    util::Logger::debug(std::format("SeekCoordinator: Seek started at {:.2f}s", state_.seek_start_position));
    notify();
}

void SeekCoordinator::update_seek_position(double target) {
    if (!state_.is_seeking) {
        start_seeking();
    }

    double clamped = clamp(target);
    state_.seek_position = clamped;
    issue_seek(clamped);
    notify();
}

void SeekCoordinator::commit_seek() {
    if (!state_.is_seeking) {
        return;
    }
    if (state_.mode == model::SeekMode::Continuous) {
        stop_continuous_seeking();
        return;
    }

    double target = state_.seek_position;
    issue_seek(target);
    finish(target);
}

void SeekCoordinator::cancel_seek() {
    if (!state_.is_seeking) {
        return;
    }

    bool resume = state_.mode == model::SeekMode::Continuous && resume_after_continuous_;
    ticker_.cancel();
    resume_after_continuous_ = false;

    double target = state_.seek_start_position;
    util::Logger::debug(std::format("SeekCoordinator: Seek cancelled, back to {:.2f}s", target));
    issue_seek(target);

    state_ = model::SeekState{};
    transport_.position = target;
    if (resume) {
        if (engine_.play()) {
            transport_.is_playing = true;
        } else {
            util::Logger::warn("SeekCoordinator: Engine rejected resume after cancelled seek");
        }
    }
    notify();
}

void SeekCoordinator::seek_to(double target) {
    if (state_.mode == model::SeekMode::Continuous) {
        stop_continuous_seeking();
    }
    start_seeking();
    update_seek_position(target);
    commit_seek();
}

void SeekCoordinator::start_continuous_seeking(model::SeekDirection direction) {
    bool resume = false;

    // Unwind whatever seek is running. A previous hold keeps its resume
    // intent so playback does not flap between the two holds.
    if (state_.mode == model::SeekMode::Continuous) {
        ticker_.cancel();
        resume = resume_after_continuous_;
        resume_after_continuous_ = false;
        double target = state_.seek_position;
        issue_seek(target);
        finish(target);
    } else if (state_.is_seeking) {
        commit_seek();
    }

    if (transport_.is_playing) {
        if (engine_.pause()) {
            transport_.is_playing = false;
            resume = true;
        } else {
            util::Logger::warn("SeekCoordinator: Engine rejected pause for continuous seek");
        }
    }
    resume_after_continuous_ = resume;

    state_.is_seeking = true;
    state_.seek_start_position = transport_.position;
    state_.seek_position = transport_.position;
    state_.direction = direction;
    state_.mode = model::SeekMode::Continuous;

    util::Logger::debug(std::string("SeekCoordinator: Continuous ") +
                        (direction == model::SeekDirection::Forward ? "fast-forward" : "rewind") +
                        " from " + std::to_string(state_.seek_start_position));

    if (step()) {
        stop_continuous_seeking();
        return;
    }

    ticker_ = scheduler_.schedule("continuous-seek", settings_.tick_interval, [this]() {
        if (state_.mode != model::SeekMode::Continuous) return;
        if (step()) {
            stop_continuous_seeking();
        }
    });
    notify();
}

void SeekCoordinator::stop_continuous_seeking() {
    ticker_.cancel();
    if (state_.mode != model::SeekMode::Continuous) {
        return;
    }

    bool resume = resume_after_continuous_;
    resume_after_continuous_ = false;

    double target = state_.seek_position;
    issue_seek(target);
    finish(target);

    if (resume) {
        if (engine_.play()) {
            transport_.is_playing = true;
            notify();
        } else {
            util::Logger::warn("SeekCoordinator: Engine rejected resume after continuous seek");
        }
    }
}

void SeekCoordinator::reset() {
    ticker_.cancel();
    resume_after_continuous_ = false;
    state_ = model::SeekState{};
}

double SeekCoordinator::display_position() const {
    return state_.is_seeking ? state_.seek_position : transport_.position;
}

double SeekCoordinator::clamp(double position) const {
    if (!(position > 0.0)) return 0.0;
    if (transport_.duration > 0.0) {
        return std::min(position, transport_.duration);
    }
    return position;
}

void SeekCoordinator::issue_seek(double position) {
    if (!engine_.seek_to(position)) {
        util::Logger::warn(std::format("SeekCoordinator: Engine rejected seek to {:.2f}s", position));
    }
}

bool SeekCoordinator::step() {
    double delta = state_.direction == model::SeekDirection::Backward
                       ? -settings_.rewind_step_seconds
                       : settings_.fast_forward_step_seconds;
    double next = clamp(state_.seek_position + delta);
    state_.seek_position = next;
    issue_seek(next);
    notify();
    return at_boundary(next);
}

bool SeekCoordinator::at_boundary(double position) const {
    return position <= 0.0 || (transport_.duration > 0.0 && position >= transport_.duration);
}

void SeekCoordinator::finish(double final_position) {
    state_ = model::SeekState{};
    transport_.position = final_position;

    util::Logger::debug(std::format("SeekCoordinator: Seek committed at {:.2f}s", final_position));
    if (on_commit_) {
        on_commit_(final_position);
    }
    notify();
}

void SeekCoordinator::notify() {
    if (on_change_) {
        on_change_();
    }
}

}  // namespace folio::core
