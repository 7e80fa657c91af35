#pragma once

#include "backend/BookmarkStore.hpp"
#include "backend/ProgressStore.hpp"
#include "backend/SnapshotPublisher.hpp"
#include "core/PlaybackReconciler.hpp"
#include "core/PlaybackSettings.hpp"
#include "core/PositionResolver.hpp"
#include "core/SeekCoordinator.hpp"
#include "core/SleepTimer.hpp"
#include "engine/AudioEngine.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "model/Book.hpp"
#include "model/Playback.hpp"
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio::core {

// One player: owns the session, the seek and sleep state machines and the
// reconciler, and turns UI intents into engine commands. Every mutation is
// published to the SnapshotPublisher for the UI to poll.
//
// All members must be called on the event loop thread.
class PlaybackCoordinator {
public:
    // Receives nullptr on success, a PlaybackError otherwise. Not called
    // for a load superseded by a newer one.
    using LoadCompletion = std::function<void(std::exception_ptr)>;

    PlaybackCoordinator(engine::AudioEngine& engine,
                        backend::ProgressGateway& progress,
                        backend::BookmarkStore& bookmarks,
                        events::Scheduler& scheduler,
                        events::EventBus& bus,
                        backend::SnapshotPublisher& publisher,
                        PlaybackSettings settings);
    ~PlaybackCoordinator();

    PlaybackCoordinator(const PlaybackCoordinator&) = delete;
    PlaybackCoordinator& operator=(const PlaybackCoordinator&) = delete;

    // Session
    void load_book(const model::LoadRequest& request,
                   std::optional<double> start_position = std::nullopt,
                   std::optional<RemotePosition> server_position = std::nullopt,
                   bool auto_play = true,
                   LoadCompletion done = nullptr);
    void unload();

    // Transport. play() and pause() throw PlaybackError when nothing is
    // loaded or the engine refuses.
    void play();
    void pause();
    void toggle_play_pause();
    void set_playback_rate(double rate);

    // Seeking
    void seek_to(double position);
    void start_seeking(std::optional<model::SeekDirection> direction = std::nullopt);
    void update_seek_position(double position);
    void commit_seek();
    void cancel_seek();
    void start_continuous_seeking(model::SeekDirection direction);
    void stop_continuous_seeking();
    void skip_forward(std::optional<double> seconds = std::nullopt);
    void skip_backward(std::optional<double> seconds = std::nullopt);

    // Chapters
    bool jump_to_chapter(int index);
    bool next_chapter();
    bool prev_chapter();

    // Sleep timer
    bool set_sleep_timer(double minutes);
    bool set_sleep_timer_end_of_chapter();
    bool extend_sleep_timer(std::optional<double> minutes = std::nullopt);
    void clear_sleep_timer();

    // Bookmarks
    std::optional<model::Bookmark> add_bookmark(const std::string& title = "", const std::string& note = "");
    bool update_bookmark(const std::string& id, const std::optional<std::string>& title,
                         const std::optional<std::string>& note);
    bool remove_bookmark(const std::string& id);

    [[nodiscard]] const model::TransportState& transport() const { return transport_; }
    [[nodiscard]] const model::PlaybackSession& session() const { return session_; }
    [[nodiscard]] const model::SeekState& seek_state() const { return seek_.state(); }
    [[nodiscard]] const model::SleepTimerState& sleep_timer_state() const { return sleep_timer_.state(); }
    [[nodiscard]] double display_position() const { return seek_.display_position(); }
    [[nodiscard]] int current_chapter_index() const;
    [[nodiscard]] const std::vector<model::Bookmark>& bookmarks() const { return *bookmarks_; }

private:
    void on_status(uint64_t generation, const model::PlaybackStatus& status);
    void on_load_complete(uint64_t generation, double start, bool auto_play,
                          bool ok, const std::string& error, const LoadCompletion& done);
    void on_seek_committed(double position);
    void apply_result(const PlaybackReconciler::Result& result);
    void on_sleep_expired();

    bool require_loaded(const char* intent) const;
    double chapter_end_for(double position) const;
    void save_progress();
    void set_bookmarks(std::vector<model::Bookmark> list);
    void publish_view();

    engine::AudioEngine& engine_;
    backend::ProgressGateway& progress_;
    backend::BookmarkStore& bookmark_store_;
    events::Scheduler& scheduler_;
    events::EventBus& bus_;
    backend::SnapshotPublisher& publisher_;
    PlaybackSettings settings_;

    model::TransportState transport_;
    model::PlaybackSession session_;
    SeekCoordinator seek_;
    SleepTimer sleep_timer_;
    PlaybackReconciler reconciler_;

    std::shared_ptr<const std::vector<model::Bookmark>> bookmarks_;
    std::optional<int64_t> paused_at_ms_;
    std::string last_error_;

    // Expires with the coordinator; engine callbacks check it first
    std::shared_ptr<bool> lifetime_;
};

}  // namespace folio::core
