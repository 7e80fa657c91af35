#include "core/PlaybackCoordinator.hpp"
#include "core/ChapterLocator.hpp"
#include "core/PlaybackError.hpp"
#include "core/SmartRewind.hpp"
#include "util/Logger.hpp"
#include "util/TimeFormat.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace folio::core {

PlaybackCoordinator::PlaybackCoordinator(engine::AudioEngine& engine,
                                         backend::ProgressGateway& progress,
                                         backend::BookmarkStore& bookmarks,
                                         events::Scheduler& scheduler,
                                         events::EventBus& bus,
                                         backend::SnapshotPublisher& publisher,
                                         PlaybackSettings settings)
    : engine_(engine),
      progress_(progress),
      bookmark_store_(bookmarks),
      scheduler_(scheduler),
      bus_(bus),
      publisher_(publisher),
      settings_(settings),
      seek_(engine, scheduler, transport_, settings.seek),
      sleep_timer_(scheduler, [this]() { on_sleep_expired(); }),
      reconciler_(transport_, session_, seek_, sleep_timer_, progress, scheduler.clock(), settings.reconcile),
      bookmarks_(std::make_shared<const std::vector<model::Bookmark>>()),
      lifetime_(std::make_shared<bool>(true)) {
    transport_.playback_rate = std::clamp(settings_.playback_rate, PlaybackSettings::MIN_RATE,
                                          PlaybackSettings::MAX_RATE);
    seek_.set_on_change([this]() { publish_view(); });
    seek_.set_on_commit([this](double position) { on_seek_committed(position); });
    sleep_timer_.set_on_change([this]() { publish_view(); });
    publish_view();
}

PlaybackCoordinator::~PlaybackCoordinator() {
    engine_.set_status_callback(nullptr);
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

void PlaybackCoordinator::load_book(const model::LoadRequest& request,
                                    std::optional<double> start_position,
                                    std::optional<RemotePosition> server_position,
                                    bool auto_play,
                                    LoadCompletion done) {
    util::Logger::info("PlaybackCoordinator: Loading " + request.book_id);

    if (transport_.is_loaded || transport_.is_loading) {
        seek_.reset();
        sleep_timer_.clear();
        if (transport_.is_loaded) {
            save_progress();
        }
        engine_.unload();
    }

    uint64_t generation = session_.load_generation + 1;
    session_ = model::PlaybackSession{};
    session_.load_generation = generation;
    session_.book_id = request.book_id;
    session_.duration = request.duration;
    session_.chapters = request.chapters;
    session_.metadata = request.metadata;
    session_.is_offline = request.is_offline;

    double rate = transport_.playback_rate;
    transport_ = model::TransportState{};
    transport_.playback_rate = rate;
    transport_.duration = request.duration;
    transport_.is_loading = true;
    paused_at_ms_.reset();
    last_error_.clear();

    double resolved = start_position
        ? *start_position
        : PositionResolver::resolve(progress_.get_local_record(request.book_id), server_position);
    double start = PositionResolver::start_position(resolved, request.duration);
    transport_.position = start;

    set_bookmarks(bookmark_store_.load(request.book_id));

    std::weak_ptr<bool> alive = lifetime_;
    engine_.set_status_callback([this, alive, generation](const model::PlaybackStatus& status) {
        if (alive.expired()) return;
        on_status(generation, status);
    });
    publish_view();

    auto completion = [this, alive, generation, start, auto_play, done](bool ok, const std::string& error) {
        if (alive.expired()) return;
        on_load_complete(generation, start, auto_play, ok, error, done);
    };

    util::Logger::debug(std::format("PlaybackCoordinator: Generation {} starting at {:.1f}s", generation, start));
    if (!request.tracks.empty()) {
        engine_.load_tracks(request.tracks, start, request.metadata, auto_play, completion);
    } else {
        engine_.load_audio(request.url, start, request.metadata, auto_play, completion);
    }
}

void PlaybackCoordinator::on_load_complete(uint64_t generation, double start, bool auto_play,
                                           bool ok, const std::string& error,
                                           const LoadCompletion& done) {
    if (generation != session_.load_generation) {
        util::Logger::debug("PlaybackCoordinator: Load generation " + std::to_string(generation) +
                            " superseded, ignoring completion");
        return;
    }

    transport_.is_loading = false;

    if (!ok) {
        last_error_ = error;
        util::Logger::error("PlaybackCoordinator: Failed to load " + session_.book_id + ": " + error);
        bus_.publish({events::Event::Type::LoadFailed, session_.book_id, start, error});
        publish_view();
        if (done) {
            done(std::make_exception_ptr(
                PlaybackError(PlaybackError::Kind::LoadFailed, "Failed to load " + session_.book_id + ": " + error)));
        }
        return;
    }

    transport_.is_loaded = true;
    transport_.position = start;
    transport_.is_playing = auto_play;
    session_.last_progress_save_ms = scheduler_.clock().now_ms();

    if (!engine_.set_playback_rate(transport_.playback_rate)) {
        util::Logger::warn(std::format("PlaybackCoordinator: Engine rejected rate {:.2f}", transport_.playback_rate));
    }

    util::Logger::info(std::format("PlaybackCoordinator: Loaded {} ({}, {} chapters) at {}",
                                   session_.book_id, util::format_duration(transport_.duration),
                                   session_.chapters.size(), util::format_duration(start)));
    bus_.publish({events::Event::Type::BookLoaded, session_.book_id, start, ""});
    publish_view();
    if (done) {
        done(nullptr);
    }
}

void PlaybackCoordinator::unload() {
    seek_.reset();
    sleep_timer_.clear();

    bool had_book = transport_.is_loaded || transport_.is_loading;
    if (transport_.is_loaded) {
        save_progress();
    }
    if (had_book) {
        util::Logger::info("PlaybackCoordinator: Unloading " + session_.book_id);
        engine_.unload();
    }

    // Bump the generation so a late load completion is ignored
    uint64_t generation = session_.load_generation + 1;
    session_ = model::PlaybackSession{};
    session_.load_generation = generation;

    double rate = transport_.playback_rate;
    transport_ = model::TransportState{};
    transport_.playback_rate = rate;
    paused_at_ms_.reset();
    set_bookmarks({});
    publish_view();
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------

void PlaybackCoordinator::play() {
    if (!transport_.is_loaded) {
        throw PlaybackError(PlaybackError::Kind::EngineUnavailable, "No audio loaded");
    }

    if (settings_.smart_rewind && paused_at_ms_ && !seek_.is_seeking()) {
        int64_t paused_for = scheduler_.clock().now_ms() - *paused_at_ms_;
        double chapter_start = session_.chapters.empty()
            ? 0.0
            : session_.chapters[ChapterLocator::locate(session_.chapters, transport_.position)].start;
        double target = SmartRewind::resume_position(transport_.position, chapter_start, paused_for,
                                                     settings_.smart_rewind_max_seconds);
        if (target < transport_.position) {
            util::Logger::info(std::format("PlaybackCoordinator: Smart rewind {:.0f}s after {}s pause",
                                           transport_.position - target, paused_for / 1000));
            seek_.seek_to(target);
        }
    }
    paused_at_ms_.reset();

    if (!engine_.play()) {
        throw PlaybackError(PlaybackError::Kind::EngineCommandFailed, "Engine refused to play");
    }
    transport_.is_playing = true;
    publish_view();
}

void PlaybackCoordinator::pause() {
    if (!transport_.is_loaded) {
        throw PlaybackError(PlaybackError::Kind::EngineUnavailable, "No audio loaded");
    }

    if (!engine_.pause()) {
        throw PlaybackError(PlaybackError::Kind::EngineCommandFailed, "Engine refused to pause");
    }
    transport_.is_playing = false;
    paused_at_ms_ = scheduler_.clock().now_ms();
    save_progress();
    publish_view();
}

void PlaybackCoordinator::toggle_play_pause() {
    if (transport_.is_playing) {
        pause();
    } else {
        play();
    }
}

void PlaybackCoordinator::set_playback_rate(double rate) {
    if (!std::isfinite(rate)) {
        util::Logger::warn("PlaybackCoordinator: Ignoring non-finite playback rate");
        return;
    }

    double clamped = std::clamp(rate, PlaybackSettings::MIN_RATE, PlaybackSettings::MAX_RATE);
    transport_.playback_rate = clamped;
    if (transport_.is_loaded && !engine_.set_playback_rate(clamped)) {
        util::Logger::warn(std::format("PlaybackCoordinator: Engine rejected rate {:.2f}", clamped));
    }
    publish_view();
}

// ---------------------------------------------------------------------------
// Seeking
// ---------------------------------------------------------------------------

void PlaybackCoordinator::seek_to(double position) {
    if (!require_loaded("seek_to")) return;
    seek_.seek_to(position);
}

void PlaybackCoordinator::start_seeking(std::optional<model::SeekDirection> direction) {
    if (!require_loaded("start_seeking")) return;
    seek_.start_seeking(direction);
}

void PlaybackCoordinator::update_seek_position(double position) {
    if (!require_loaded("update_seek_position")) return;
    seek_.update_seek_position(position);
}

void PlaybackCoordinator::commit_seek() {
    seek_.commit_seek();
}

void PlaybackCoordinator::cancel_seek() {
    seek_.cancel_seek();
}

void PlaybackCoordinator::start_continuous_seeking(model::SeekDirection direction) {
    if (!require_loaded("start_continuous_seeking")) return;
    seek_.start_continuous_seeking(direction);
}

void PlaybackCoordinator::stop_continuous_seeking() {
    seek_.stop_continuous_seeking();
}

void PlaybackCoordinator::skip_forward(std::optional<double> seconds) {
    if (!require_loaded("skip_forward")) return;
    seek_.seek_to(seek_.display_position() + seconds.value_or(settings_.skip_forward_seconds));
}

void PlaybackCoordinator::skip_backward(std::optional<double> seconds) {
    if (!require_loaded("skip_backward")) return;
    seek_.seek_to(seek_.display_position() - seconds.value_or(settings_.skip_backward_seconds));
}

// ---------------------------------------------------------------------------
// Chapters
// ---------------------------------------------------------------------------

bool PlaybackCoordinator::jump_to_chapter(int index) {
    if (!require_loaded("jump_to_chapter")) return false;

    const auto* chapter = ChapterLocator::chapter_at(session_.chapters, index);
    if (!chapter) {
        util::Logger::warn("PlaybackCoordinator: No chapter " + std::to_string(index));
        return false;
    }
    seek_.seek_to(chapter->start);
    return true;
}

bool PlaybackCoordinator::next_chapter() {
    if (!require_loaded("next_chapter") || session_.chapters.empty()) return false;

    auto next = ChapterLocator::next_index(session_.chapters, seek_.display_position());
    if (!next) {
        util::Logger::debug("PlaybackCoordinator: Already in the last chapter");
        return false;
    }
    seek_.seek_to(session_.chapters[*next].start);
    return true;
}

bool PlaybackCoordinator::prev_chapter() {
    if (!require_loaded("prev_chapter") || session_.chapters.empty()) return false;

    int index = ChapterLocator::previous_index(session_.chapters, seek_.display_position(),
                                               settings_.chapter_restart_threshold_seconds);
    seek_.seek_to(session_.chapters[index].start);
    return true;
}

int PlaybackCoordinator::current_chapter_index() const {
    if (session_.chapters.empty()) return 0;
    return ChapterLocator::locate(session_.chapters, seek_.display_position());
}

// ---------------------------------------------------------------------------
// Sleep timer
// ---------------------------------------------------------------------------

bool PlaybackCoordinator::set_sleep_timer(double minutes) {
    return sleep_timer_.set(minutes);
}

bool PlaybackCoordinator::set_sleep_timer_end_of_chapter() {
    if (!require_loaded("set_sleep_timer_end_of_chapter")) return false;
    return sleep_timer_.set_end_of_chapter(chapter_end_for(seek_.display_position()));
}

bool PlaybackCoordinator::extend_sleep_timer(std::optional<double> minutes) {
    return sleep_timer_.extend(minutes.value_or(settings_.sleep_extend_minutes));
}

void PlaybackCoordinator::clear_sleep_timer() {
    sleep_timer_.clear();
}

void PlaybackCoordinator::on_sleep_expired() {
    util::Logger::info("PlaybackCoordinator: Sleep timer expired, pausing");
    bus_.publish({events::Event::Type::SleepTimerExpired, session_.book_id, transport_.position, ""});

    if (!transport_.is_loaded) return;
    try {
        pause();
    } catch (const PlaybackError& e) {
        util::Logger::error(std::string("PlaybackCoordinator: Sleep timer could not pause: ") + e.what());
    }
}

// ---------------------------------------------------------------------------
// Bookmarks
// ---------------------------------------------------------------------------

std::optional<model::Bookmark> PlaybackCoordinator::add_bookmark(const std::string& title, const std::string& note) {
    if (!require_loaded("add_bookmark")) return std::nullopt;

    model::Bookmark bookmark;
    bookmark.time = seek_.display_position();
    bookmark.note = note;
    if (!session_.chapters.empty()) {
        bookmark.chapter_title = session_.chapters[ChapterLocator::locate(session_.chapters, bookmark.time)].title;
    }
    bookmark.title = !title.empty() ? title
        : !bookmark.chapter_title.empty() ? bookmark.chapter_title
        : "Bookmark at " + util::format_duration(bookmark.time);

    auto stored = bookmark_store_.add(session_.book_id, bookmark);
    if (stored) {
        set_bookmarks(bookmark_store_.load(session_.book_id));
        bus_.publish({events::Event::Type::BookmarksChanged, session_.book_id, stored->time, stored->id});
        publish_view();
    }
    return stored;
}

bool PlaybackCoordinator::update_bookmark(const std::string& id, const std::optional<std::string>& title,
                                          const std::optional<std::string>& note) {
    if (session_.book_id.empty()) return false;
    if (!bookmark_store_.update(session_.book_id, id, title, note)) return false;

    set_bookmarks(bookmark_store_.load(session_.book_id));
    bus_.publish({events::Event::Type::BookmarksChanged, session_.book_id, 0.0, id});
    publish_view();
    return true;
}

bool PlaybackCoordinator::remove_bookmark(const std::string& id) {
    if (session_.book_id.empty()) return false;
    if (!bookmark_store_.remove(session_.book_id, id)) return false;

    set_bookmarks(bookmark_store_.load(session_.book_id));
    bus_.publish({events::Event::Type::BookmarksChanged, session_.book_id, 0.0, id});
    publish_view();
    return true;
}

// ---------------------------------------------------------------------------
// Engine status and helpers
// ---------------------------------------------------------------------------

void PlaybackCoordinator::on_status(uint64_t generation, const model::PlaybackStatus& status) {
    if (generation != session_.load_generation) {
        return;
    }

    apply_result(reconciler_.apply(status));
    publish_view();
}

void PlaybackCoordinator::apply_result(const PlaybackReconciler::Result& result) {
    if (result.saved) {
        bus_.publish({events::Event::Type::ProgressSaved, session_.book_id, transport_.position, ""});
    }
    if (result.finished) {
        sleep_timer_.clear();
        bus_.publish({events::Event::Type::BookFinished, session_.book_id, transport_.position, ""});
    }
    if (result.chapter_end_reached) {
        util::Logger::info("PlaybackCoordinator: Reached end of chapter with sleep timer set");
        sleep_timer_.chapter_end_reached();
    }
}

void PlaybackCoordinator::on_seek_committed(double position) {
    auto result = reconciler_.on_seek_committed(position);
    sleep_timer_.retarget_chapter_end(chapter_end_for(position));
    if (!result.finished) {
        save_progress();
    }
    apply_result(result);
    bus_.publish({events::Event::Type::SeekCommitted, session_.book_id, position, ""});
}

bool PlaybackCoordinator::require_loaded(const char* intent) const {
    if (transport_.is_loaded) return true;
    util::Logger::debug(std::string("PlaybackCoordinator: ") + intent + " ignored, nothing loaded");
    return false;
}

double PlaybackCoordinator::chapter_end_for(double position) const {
    if (session_.chapters.empty()) {
        return transport_.duration;
    }
    return session_.chapters[ChapterLocator::locate(session_.chapters, position)].end;
}

void PlaybackCoordinator::save_progress() {
    if (reconciler_.save_progress()) {
        bus_.publish({events::Event::Type::ProgressSaved, session_.book_id, transport_.position, ""});
    }
}

void PlaybackCoordinator::set_bookmarks(std::vector<model::Bookmark> list) {
    bookmarks_ = std::make_shared<const std::vector<model::Bookmark>>(std::move(list));
}

void PlaybackCoordinator::publish_view() {
    publisher_.update([this](model::Snapshot& snap) {
        snap.book_id = session_.book_id;
        snap.title = session_.metadata.title;
        snap.position = seek_.display_position();
        snap.duration = transport_.duration;
        snap.is_playing = transport_.is_playing;
        snap.is_buffering = transport_.is_buffering;
        snap.is_loading = transport_.is_loading;
        snap.is_loaded = transport_.is_loaded;
        snap.playback_rate = transport_.playback_rate;

        const auto& seek = seek_.state();
        snap.is_seeking = seek.is_seeking;
        snap.seek_direction = seek.is_seeking ? seek.direction : std::nullopt;

        snap.chapter_count = static_cast<int>(session_.chapters.size());
        snap.current_chapter_index = current_chapter_index();
        const auto* chapter = ChapterLocator::chapter_at(session_.chapters, snap.current_chapter_index);
        snap.current_chapter_title = chapter ? chapter->title : "";

        const auto& sleep = sleep_timer_.state();
        snap.sleep_timer_kind = sleep.kind;
        snap.sleep_timer_remaining = sleep.remaining_seconds;

        snap.bookmarks = bookmarks_;
        snap.last_error = last_error_;
    });
}

}  // namespace folio::core
