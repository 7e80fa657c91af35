#include "../framework/FakeAudioEngine.hpp"
#include "../framework/ManualClock.hpp"
#include "../framework/SimpleTest.hpp"
#include "../framework/TestSupport.hpp"
#include "backend/BookmarkStore.hpp"
#include "backend/SnapshotPublisher.hpp"
#include "core/PlaybackCoordinator.hpp"
#include "core/PlaybackError.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include <cmath>
#include <exception>
#include <vector>

using namespace folio;
using model::SeekDirection;

namespace {

model::LoadRequest sample_book(const std::string& id = "book-1") {
    model::LoadRequest request;
    request.book_id = id;
    request.url = "/books/" + id + ".m4b";
    request.chapters = test::three_chapters();
    request.duration = 5400.0;
    request.metadata.title = "Sample Book";
    request.metadata.author = "Someone";
    return request;
}

// Whole player wired against a scripted engine and a manual clock.
struct Harness {
    explicit Harness(core::PlaybackSettings settings = {})
        : scheduler(clock),
          dir("coordinator"),
          bookmark_store(dir.path() / "bookmarks", clock),
          coordinator(engine, progress, bookmark_store, scheduler, bus, publisher, settings) {
        for (auto type : {events::Event::Type::BookLoaded, events::Event::Type::LoadFailed,
                          events::Event::Type::BookFinished, events::Event::Type::SleepTimerExpired,
                          events::Event::Type::BookmarksChanged}) {
            bus.subscribe(type, [this](const events::Event& e) { seen.push_back(e); });
        }
    }

    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    void load_at(double start) { coordinator.load_book(sample_book(), start); }

    int count(events::Event::Type type) const {
        int n = 0;
        for (const auto& e : seen) {
            if (e.type == type) n++;
        }
        return n;
    }

    std::shared_ptr<const model::Snapshot> view() const { return publisher.get_current(); }

    test::ManualClock clock;
    events::Scheduler scheduler;
    events::EventBus bus;
    backend::SnapshotPublisher publisher;
    test::MemoryProgressGateway progress;
    test::TempDir dir;
    backend::BookmarkStore bookmark_store;
    test::FakeAudioEngine engine;
    core::PlaybackCoordinator coordinator;
    std::vector<events::Event> seen;
};

}  // namespace

TEST_CASE(test_transport_without_book_throws) {
    Harness h;
    ASSERT_THROWS(h.coordinator.play(), core::PlaybackError);
    ASSERT_EQ(h.engine.play_calls, 0);

    ASSERT_THROWS(h.coordinator.pause(), core::PlaybackError);
    ASSERT_THROWS(h.coordinator.toggle_play_pause(), core::PlaybackError);
    ASSERT_EQ(h.engine.pause_calls, 0);
    ASSERT_FALSE(h.coordinator.transport().is_playing);
}

TEST_CASE(test_load_applies_start_position_and_rate) {
    core::PlaybackSettings settings;
    settings.playback_rate = 1.5;
    Harness h(settings);

    bool completed = false;
    std::exception_ptr failure;
    h.coordinator.load_book(sample_book(), 120.0, std::nullopt, true, [&](std::exception_ptr err) {
        completed = true;
        failure = err;
    });

    ASSERT_TRUE(completed);
    ASSERT_TRUE(failure == nullptr);
    ASSERT_NEAR(h.engine.last_load.start, 120.0, 1e-9);
    ASSERT_TRUE(h.engine.last_load.auto_play);
    ASSERT_TRUE(h.coordinator.transport().is_loaded);
    ASSERT_FALSE(h.coordinator.transport().is_loading);
    ASSERT_TRUE(h.coordinator.transport().is_playing);
    ASSERT_NEAR(h.coordinator.transport().position, 120.0, 1e-9);
    ASSERT_FALSE(h.engine.rates.empty());
    ASSERT_NEAR(h.engine.rates.back(), 1.5, 1e-9);
    ASSERT_EQ(h.count(events::Event::Type::BookLoaded), 1);

    auto view = h.view();
    ASSERT_EQ(view->book_id, std::string("book-1"));
    ASSERT_EQ(view->title, std::string("Sample Book"));
    ASSERT_EQ(view->chapter_count, 3);
    ASSERT_EQ(view->current_chapter_title, std::string("Opening"));
}

TEST_CASE(test_load_resumes_from_saved_progress) {
    Harness h;
    h.progress.save_local("book-1", 600.0, 5400.0, false);
    h.coordinator.load_book(sample_book());
    ASSERT_NEAR(h.engine.last_load.start, 600.0, 1e-9);

    // A newer server position wins over an old local record
    h.coordinator.load_book(sample_book(), std::nullopt,
                            core::RemotePosition{900.0, h.clock.now_ms()});
    ASSERT_NEAR(h.engine.last_load.start, 900.0, 1e-9);

    // A finished book starts over
    h.coordinator.unload();
    h.progress.save_local("book-1", 5400.0, 5400.0, true);
    h.coordinator.load_book(sample_book());
    ASSERT_NEAR(h.engine.last_load.start, 0.0, 1e-9);
}

TEST_CASE(test_superseded_load_completion_is_ignored) {
    Harness h;
    h.engine.defer_loads = true;

    int first_done = 0;
    int second_done = 0;
    h.coordinator.load_book(sample_book("book-1"), 0.0, std::nullopt, true,
                            [&](std::exception_ptr) { first_done++; });
    h.coordinator.load_book(sample_book("book-2"), 50.0, std::nullopt, true,
                            [&](std::exception_ptr) { second_done++; });
    ASSERT_EQ(h.engine.pending.size(), 2u);

    h.engine.complete_load(true);  // book-1, stale
    ASSERT_EQ(first_done, 0);
    ASSERT_FALSE(h.coordinator.transport().is_loaded);
    ASSERT_TRUE(h.coordinator.transport().is_loading);
    ASSERT_EQ(h.count(events::Event::Type::BookLoaded), 0);

    h.engine.complete_load(true);  // book-2
    ASSERT_EQ(second_done, 1);
    ASSERT_TRUE(h.coordinator.transport().is_loaded);
    ASSERT_EQ(h.coordinator.session().book_id, std::string("book-2"));
    ASSERT_NEAR(h.coordinator.transport().position, 50.0, 1e-9);
}

TEST_CASE(test_load_failure_reports_error) {
    Harness h;
    h.engine.fail_loads = true;

    std::exception_ptr failure;
    h.coordinator.load_book(sample_book(), 0.0, std::nullopt, true,
                            [&](std::exception_ptr err) { failure = err; });

    ASSERT_TRUE(failure != nullptr);
    ASSERT_THROWS(std::rethrow_exception(failure), core::PlaybackError);
    ASSERT_FALSE(h.coordinator.transport().is_loaded);
    ASSERT_FALSE(h.coordinator.transport().is_loading);
    ASSERT_EQ(h.count(events::Event::Type::LoadFailed), 1);
    ASSERT_EQ(h.seen.back().data, std::string("scripted failure"));
    ASSERT_EQ(h.view()->last_error, std::string("scripted failure"));
    ASSERT_THROWS(h.coordinator.play(), core::PlaybackError);
}

TEST_CASE(test_sleep_timer_pauses_once) {
    Harness h;
    h.load_at(100.0);
    ASSERT_TRUE(h.coordinator.set_sleep_timer(1.0));
    ASSERT_EQ(h.view()->sleep_timer_remaining, 60);

    // The loop stalled for a minute; the timer still fires exactly once
    h.clock.advance_seconds(61);
    h.scheduler.process();
    h.scheduler.process();

    ASSERT_EQ(h.engine.pause_calls, 1);
    ASSERT_FALSE(h.coordinator.transport().is_playing);
    ASSERT_TRUE(h.coordinator.sleep_timer_state().kind == model::SleepTimerKind::Off);
    ASSERT_EQ(h.coordinator.sleep_timer_state().remaining_seconds, 0);
    ASSERT_EQ(h.count(events::Event::Type::SleepTimerExpired), 1);
}

TEST_CASE(test_end_of_chapter_sleep_pauses_at_boundary) {
    Harness h;
    h.load_at(1700.0);
    ASSERT_TRUE(h.coordinator.set_sleep_timer_end_of_chapter());
    ASSERT_NEAR(h.coordinator.sleep_timer_state().chapter_end, 1800.0, 1e-9);

    h.engine.emit_position(1750.0, 5400.0);
    ASSERT_EQ(h.engine.pause_calls, 0);

    h.engine.emit_position(1799.5, 5400.0);
    ASSERT_EQ(h.engine.pause_calls, 1);
    ASSERT_FALSE(h.coordinator.transport().is_playing);
    ASSERT_EQ(h.count(events::Event::Type::SleepTimerExpired), 1);
}

TEST_CASE(test_end_of_chapter_target_follows_seek) {
    Harness h;
    h.load_at(100.0);
    ASSERT_TRUE(h.coordinator.set_sleep_timer_end_of_chapter());
    h.coordinator.seek_to(2000.0);
    ASSERT_NEAR(h.coordinator.sleep_timer_state().chapter_end, 3600.0, 1e-9);
}

TEST_CASE(test_prev_chapter_near_start_goes_back) {
    Harness h;
    h.load_at(1801.0);
    ASSERT_TRUE(h.coordinator.prev_chapter());
    ASSERT_NEAR(h.engine.seeks.back(), 0.0, 1e-9);
    ASSERT_NEAR(h.coordinator.transport().position, 0.0, 1e-9);

    // Further in, the current chapter restarts
    h.coordinator.seek_to(1900.0);
    ASSERT_TRUE(h.coordinator.prev_chapter());
    ASSERT_NEAR(h.coordinator.transport().position, 1800.0, 1e-9);
}

TEST_CASE(test_next_chapter_and_jump) {
    Harness h;
    h.load_at(100.0);
    ASSERT_TRUE(h.coordinator.next_chapter());
    ASSERT_NEAR(h.coordinator.transport().position, 1800.0, 1e-9);
    ASSERT_EQ(h.coordinator.current_chapter_index(), 1);

    ASSERT_TRUE(h.coordinator.jump_to_chapter(2));
    ASSERT_NEAR(h.coordinator.transport().position, 3600.0, 1e-9);
    ASSERT_FALSE(h.coordinator.next_chapter());
    ASSERT_FALSE(h.coordinator.jump_to_chapter(3));
    ASSERT_FALSE(h.coordinator.jump_to_chapter(-1));
}

TEST_CASE(test_skip_clamps_to_book) {
    Harness h;
    h.load_at(100.0);
    h.coordinator.skip_forward();
    ASSERT_NEAR(h.coordinator.transport().position, 130.0, 1e-9);

    h.coordinator.skip_backward(200.0);
    ASSERT_NEAR(h.coordinator.transport().position, 0.0, 1e-9);

    h.coordinator.seek_to(5390.0);
    h.coordinator.skip_forward();
    ASSERT_NEAR(h.coordinator.transport().position, 5400.0, 1e-9);
}

TEST_CASE(test_playback_rate_is_clamped) {
    Harness h;
    h.load_at(0.0);

    h.coordinator.set_playback_rate(5.0);
    ASSERT_NEAR(h.coordinator.transport().playback_rate, 3.0, 1e-9);
    ASSERT_NEAR(h.engine.rates.back(), 3.0, 1e-9);

    h.coordinator.set_playback_rate(0.1);
    ASSERT_NEAR(h.coordinator.transport().playback_rate, 0.5, 1e-9);

    size_t sent = h.engine.rates.size();
    h.coordinator.set_playback_rate(std::nan(""));
    ASSERT_NEAR(h.coordinator.transport().playback_rate, 0.5, 1e-9);
    ASSERT_EQ(h.engine.rates.size(), sent);
    ASSERT_NEAR(h.view()->playback_rate, 0.5, 1e-9);
}

TEST_CASE(test_smart_rewind_after_long_pause) {
    Harness h;
    h.load_at(1000.0);

    h.coordinator.pause();
    h.clock.advance_seconds(3600);
    h.coordinator.play();

    ASSERT_NEAR(h.coordinator.transport().position, 970.0, 1e-9);
    ASSERT_NEAR(h.engine.seeks.back(), 970.0, 1e-9);
    ASSERT_TRUE(h.coordinator.transport().is_playing);

    // A short pause resumes in place
    size_t seeks = h.engine.seeks.size();
    h.coordinator.pause();
    h.clock.advance_seconds(2);
    h.coordinator.play();
    ASSERT_EQ(h.engine.seeks.size(), seeks);
}

TEST_CASE(test_smart_rewind_stops_at_chapter_start) {
    Harness h;
    h.load_at(1810.0);
    h.coordinator.pause();
    h.clock.advance_seconds(3600);
    h.coordinator.play();
    ASSERT_NEAR(h.coordinator.transport().position, 1800.0, 1e-9);
}

TEST_CASE(test_book_finish_is_published_once) {
    Harness h;
    h.load_at(5390.0);

    model::PlaybackStatus status;
    status.position = 5399.0;
    status.duration = 5400.0;
    status.did_just_finish = true;
    h.engine.emit(status);
    h.engine.emit(status);

    ASSERT_EQ(h.count(events::Event::Type::BookFinished), 1);
    ASSERT_FALSE(h.coordinator.transport().is_playing);
    const auto& record = h.progress.records.at("book-1");
    ASSERT_TRUE(record.is_finished);
    ASSERT_NEAR(record.current_time, 5400.0, 1e-9);
}

TEST_CASE(test_finish_reported_mid_seek_is_published_on_commit) {
    Harness h;
    h.load_at(100.0);

    h.coordinator.start_seeking();
    h.coordinator.update_seek_position(6000.0);

    model::PlaybackStatus status;
    status.position = 5400.0;
    status.duration = 5400.0;
    status.did_just_finish = true;
    h.engine.emit(status);
    ASSERT_EQ(h.count(events::Event::Type::BookFinished), 0);

    h.coordinator.commit_seek();
    status.did_just_finish = false;
    h.engine.emit(status);

    ASSERT_EQ(h.count(events::Event::Type::BookFinished), 1);
    ASSERT_FALSE(h.coordinator.transport().is_playing);
    const auto& record = h.progress.records.at("book-1");
    ASSERT_TRUE(record.is_finished);
    ASSERT_NEAR(record.current_time, 5400.0, 1e-9);
}

TEST_CASE(test_bookmarks_reach_snapshot) {
    Harness h;
    h.load_at(2000.0);
    ASSERT_TRUE(h.view()->bookmarks->empty());

    auto added = h.coordinator.add_bookmark();
    ASSERT_TRUE(added.has_value());
    ASSERT_EQ(added->title, std::string("Middle"));
    ASSERT_EQ(added->chapter_title, std::string("Middle"));
    ASSERT_NEAR(added->time, 2000.0, 1e-9);
    ASSERT_EQ(h.view()->bookmarks->size(), 1u);

    ASSERT_TRUE(h.coordinator.update_bookmark(added->id, std::string("Favourite"), std::nullopt));
    ASSERT_EQ(h.view()->bookmarks->front().title, std::string("Favourite"));

    ASSERT_TRUE(h.coordinator.remove_bookmark(added->id));
    ASSERT_TRUE(h.view()->bookmarks->empty());
    ASSERT_FALSE(h.coordinator.remove_bookmark(added->id));
    ASSERT_EQ(h.count(events::Event::Type::BookmarksChanged), 3);
}

TEST_CASE(test_bookmarks_survive_reload) {
    Harness h;
    h.load_at(2000.0);
    ASSERT_TRUE(h.coordinator.add_bookmark("Keep").has_value());
    h.coordinator.unload();
    ASSERT_TRUE(h.view()->bookmarks->empty());

    h.load_at(0.0);
    ASSERT_EQ(h.coordinator.bookmarks().size(), 1u);
    ASSERT_EQ(h.coordinator.bookmarks().front().title, std::string("Keep"));
}

TEST_CASE(test_unload_saves_and_releases_engine) {
    Harness h;
    h.load_at(300.0);
    h.coordinator.unload();

    ASSERT_EQ(h.engine.unload_calls, 1);
    ASSERT_NEAR(h.progress.records.at("book-1").current_time, 300.0, 1e-9);
    ASSERT_FALSE(h.coordinator.transport().is_loaded);
    ASSERT_TRUE(h.view()->book_id.empty());

    // Late statuses from the released session are dropped
    h.engine.emit_position(999.0, 5400.0);
    ASSERT_NEAR(h.coordinator.transport().position, 0.0, 1e-9);
}

TEST_CASE(test_snapshot_shows_seek_target_while_seeking) {
    Harness h;
    h.load_at(100.0);

    h.coordinator.start_seeking();
    h.coordinator.update_seek_position(500.0);
    ASSERT_NEAR(h.view()->position, 500.0, 1e-9);
    ASSERT_TRUE(h.view()->is_seeking);
    ASSERT_NEAR(h.coordinator.transport().position, 100.0, 1e-9);

    // Engine reports from before the seek do not move the position
    h.engine.emit_position(101.0, 5400.0);
    ASSERT_NEAR(h.coordinator.transport().position, 100.0, 1e-9);

    h.coordinator.commit_seek();
    ASSERT_NEAR(h.coordinator.transport().position, 500.0, 1e-9);
    ASSERT_FALSE(h.view()->is_seeking);
}

TEST_CASE(test_continuous_seek_through_coordinator) {
    Harness h;
    h.load_at(100.0);

    h.coordinator.start_continuous_seeking(SeekDirection::Forward);
    ASSERT_FALSE(h.coordinator.transport().is_playing);
    ASSERT_NEAR(h.view()->position, 105.0, 1e-9);
    ASSERT_TRUE(h.view()->seek_direction == SeekDirection::Forward);

    h.clock.advance_ms(100);
    h.scheduler.process();
    ASSERT_NEAR(h.view()->position, 110.0, 1e-9);

    h.coordinator.stop_continuous_seeking();
    ASSERT_NEAR(h.coordinator.transport().position, 110.0, 1e-9);
    ASSERT_TRUE(h.coordinator.transport().is_playing);
}

int main() {
    return folio::test::TestRunner::instance().run_all();
}
