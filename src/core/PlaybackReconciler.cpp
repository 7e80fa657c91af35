#include "core/PlaybackReconciler.hpp"
#include "util/Logger.hpp"
#include <format>

namespace folio::core {

PlaybackReconciler::PlaybackReconciler(model::TransportState& transport, model::PlaybackSession& session,
                                       const SeekCoordinator& seek, const SleepTimer& sleep_timer,
                                       backend::ProgressGateway& progress, const util::Clock& clock,
                                       Settings settings)
    : transport_(transport), session_(session), seek_(seek), sleep_timer_(sleep_timer),
      progress_(progress), clock_(clock), settings_(settings) {}

PlaybackReconciler::Result PlaybackReconciler::apply(const model::PlaybackStatus& status) {
    Result result;
    if (!transport_.is_loaded) {
        return result;
    }

    bool seeking = seek_.is_seeking();

    if (status.duration > 0.0 && status.duration != transport_.duration) {
        transport_.duration = status.duration;
        session_.duration = status.duration;
    }
    transport_.is_buffering = status.is_buffering;

    if (!seeking) {
        transport_.position = status.position;
        // Buffering reports is_playing == false; keep what we had
        if (!status.is_buffering) {
            transport_.is_playing = status.is_playing;
        }
    }

    auto now = clock_.now_ms();
    if (transport_.is_playing &&
        now - session_.last_progress_save_ms >= settings_.save_interval.count()) {
        result.saved = save_progress();
        // Failed saves wait for the next interval too
        session_.last_progress_save_ms = now;
    }

    if (status.did_just_finish && !session_.finish_handled) {
        if (seeking) {
            // The position is not authoritative until the seek commits
            session_.finish_pending = true;
            util::Logger::debug("PlaybackReconciler: Finish reported mid-seek, deferring");
        } else if (is_genuine_finish()) {
            handle_finish(result);
            return result;
        } else {
            util::Logger::debug(std::format("PlaybackReconciler: Ignoring finish at {:.1f}s of {:.1f}s",
                                            transport_.position, transport_.duration));
        }
    }

    const auto& sleep = sleep_timer_.state();
    if (!seeking && sleep.kind == model::SleepTimerKind::EndOfChapter &&
        transport_.position >= sleep.chapter_end - settings_.chapter_end_tolerance_seconds) {
        result.chapter_end_reached = true;
    }

    return result;
}

bool PlaybackReconciler::save_progress(bool is_finished) {
    if (session_.book_id.empty() || !transport_.is_loaded) {
        return false;
    }

    double position = is_finished ? transport_.duration : transport_.position;
    if (!progress_.save_local(session_.book_id, position, transport_.duration, is_finished)) {
        util::Logger::warn("PlaybackReconciler: Progress save failed for " + session_.book_id);
        return false;
    }
    session_.last_progress_save_ms = clock_.now_ms();
    return true;
}

PlaybackReconciler::Result PlaybackReconciler::on_seek_committed(double position) {
    Result result;
    if (session_.finish_handled && position < transport_.duration - settings_.finish_tolerance_seconds) {
        session_.finish_handled = false;
    }

    bool pending = session_.finish_pending;
    session_.finish_pending = false;
    if (pending && !session_.finish_handled && transport_.is_loaded) {
        if (is_genuine_finish()) {
            handle_finish(result);
        } else {
            util::Logger::debug(std::format("PlaybackReconciler: Dropping deferred finish, seek landed at {:.1f}s",
                                            position));
        }
    }
    return result;
}

void PlaybackReconciler::handle_finish(Result& result) {
    session_.finish_handled = true;
    transport_.is_playing = false;
    util::Logger::info(std::format("PlaybackReconciler: Book {} finished at {:.1f}s",
                                   session_.book_id, transport_.position));
    result.saved = save_progress(true);
    result.finished = true;
}

bool PlaybackReconciler::is_genuine_finish() const {
    return transport_.duration > 0.0 &&
           transport_.position >= transport_.duration - settings_.finish_tolerance_seconds;
}

}  // namespace folio::core
