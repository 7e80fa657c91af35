#include "../framework/ManualClock.hpp"
#include "../framework/SimpleTest.hpp"
#include "../framework/TestSupport.hpp"
#include "backend/BookmarkStore.hpp"
#include "backend/ProgressStore.hpp"
#include "backend/SyncQueue.hpp"
#include <fstream>

using namespace folio;
using namespace folio::backend;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// FileProgressStore
// ---------------------------------------------------------------------------

TEST_CASE(test_progress_missing_file_is_empty) {
    test::TempDir dir("progress");
    test::ManualClock clock;
    FileProgressStore store(dir.path() / "progress.bin", clock);
    ASSERT_TRUE(store.load());
    ASSERT_EQ(store.size(), 0u);
    ASSERT_FALSE(store.get_local("nothing").has_value());
}

TEST_CASE(test_progress_survives_reload) {
    test::TempDir dir("progress");
    test::ManualClock clock;
    auto file = dir.path() / "progress.bin";
    {
        FileProgressStore store(file, clock);
        ASSERT_TRUE(store.save_local("book-a", 1234.5, 5400.0, false));
        clock.advance_ms(500);
        ASSERT_TRUE(store.save_local("book-b", 5400.0, 5400.0, true));
        ASSERT_TRUE(store.mark_synced("book-a"));
    }

    FileProgressStore reloaded(file, clock);
    ASSERT_TRUE(reloaded.load());
    ASSERT_EQ(reloaded.size(), 2u);

    auto a = reloaded.get_local_record("book-a").value();
    ASSERT_NEAR(a.current_time, 1234.5, 1e-9);
    ASSERT_NEAR(a.duration, 5400.0, 1e-9);
    ASSERT_TRUE(a.synced);
    ASSERT_FALSE(a.is_finished);

    auto b = reloaded.get_local_record("book-b").value();
    ASSERT_TRUE(b.is_finished);
    ASSERT_EQ(b.updated_at, clock.now_ms());

    auto unsynced = reloaded.get_unsynced();
    ASSERT_EQ(unsynced.size(), 1u);
    ASSERT_EQ(unsynced[0].item_id, std::string("book-b"));
}

TEST_CASE(test_progress_save_clears_synced_flag) {
    test::TempDir dir("progress");
    test::ManualClock clock;
    FileProgressStore store(dir.path() / "progress.bin", clock);
    store.save_local("book", 10.0, 100.0, false);
    store.mark_synced("book");
    ASSERT_TRUE(store.get_unsynced().empty());

    store.save_local("book", 20.0, 100.0, false);
    ASSERT_EQ(store.get_unsynced().size(), 1u);
    ASSERT_NEAR(store.get_local("book").value(), 20.0, 1e-9);
}

TEST_CASE(test_progress_rejects_bad_input) {
    test::TempDir dir("progress");
    test::ManualClock clock;
    FileProgressStore store(dir.path() / "progress.bin", clock);
    ASSERT_FALSE(store.save_local("", 10.0, 100.0, false));
    ASSERT_FALSE(store.save_local("book", std::nan(""), 100.0, false));
    ASSERT_FALSE(store.mark_synced("unknown"));
    ASSERT_EQ(store.size(), 0u);
}

TEST_CASE(test_progress_foreign_file_is_rejected) {
    test::TempDir dir("progress");
    test::ManualClock clock;
    auto file = dir.path() / "progress.bin";
    {
        std::ofstream out(file, std::ios::binary);
        out << "definitely not a progress file";
    }
    FileProgressStore store(file, clock);
    ASSERT_FALSE(store.load());
    ASSERT_EQ(store.size(), 0u);
}

// ---------------------------------------------------------------------------
// BookmarkStore
// ---------------------------------------------------------------------------

TEST_CASE(test_bookmark_file_name_is_sha256) {
    ASSERT_EQ(BookmarkStore::file_name_for("abc"),
              std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad.bin"));
    ASSERT_TRUE(BookmarkStore::file_name_for("a") != BookmarkStore::file_name_for("b"));
}

TEST_CASE(test_bookmarks_sorted_by_time) {
    test::TempDir dir("bookmarks");
    test::ManualClock clock;
    BookmarkStore store(dir.path(), clock);

    for (double t : {300.0, 100.0, 200.0}) {
        model::Bookmark b;
        b.time = t;
        b.title = "at " + std::to_string(static_cast<int>(t));
        ASSERT_TRUE(store.add("book", b).has_value());
        clock.advance_ms(1);
    }

    auto list = store.load("book");
    ASSERT_EQ(list.size(), 3u);
    ASSERT_NEAR(list[0].time, 100.0, 1e-9);
    ASSERT_NEAR(list[1].time, 200.0, 1e-9);
    ASSERT_NEAR(list[2].time, 300.0, 1e-9);
}

TEST_CASE(test_bookmark_ids_unique_within_same_millisecond) {
    test::TempDir dir("bookmarks");
    test::ManualClock clock(5000);
    BookmarkStore store(dir.path(), clock);

    model::Bookmark b;
    b.time = 10.0;
    auto first = store.add("book", b).value();
    auto second = store.add("book", b).value();
    auto third = store.add("book", b).value();

    ASSERT_EQ(first.id, std::string("book_5000"));
    ASSERT_EQ(second.id, std::string("book_5000_1"));
    ASSERT_EQ(third.id, std::string("book_5000_2"));
    ASSERT_EQ(first.created_at, 5000);
}

TEST_CASE(test_bookmarks_persist_update_and_remove) {
    test::TempDir dir("bookmarks");
    test::ManualClock clock;
    std::string id;
    {
        BookmarkStore store(dir.path(), clock);
        model::Bookmark b;
        b.time = 42.0;
        b.title = "Original";
        b.chapter_title = "Chapter 1";
        id = store.add("book", b)->id;
        ASSERT_TRUE(store.update("book", id, std::string("Renamed"), std::nullopt));
    }

    BookmarkStore reopened(dir.path(), clock);
    auto list = reopened.load("book");
    ASSERT_EQ(list.size(), 1u);
    ASSERT_EQ(list[0].title, std::string("Renamed"));
    ASSERT_EQ(list[0].chapter_title, std::string("Chapter 1"));
    ASSERT_TRUE(list[0].note.empty());

    ASSERT_TRUE(reopened.update("book", id, std::nullopt, std::string("a note")));
    ASSERT_EQ(reopened.load("book")[0].title, std::string("Renamed"));
    ASSERT_EQ(reopened.load("book")[0].note, std::string("a note"));

    ASSERT_FALSE(reopened.update("book", "missing", std::string("x"), std::nullopt));
    ASSERT_FALSE(reopened.remove("book", "missing"));
    ASSERT_TRUE(reopened.remove("book", id));
    ASSERT_TRUE(reopened.load("book").empty());
    ASSERT_TRUE(reopened.load("other-book").empty());
}

TEST_CASE(test_bookmark_requires_book_id) {
    test::TempDir dir("bookmarks");
    test::ManualClock clock;
    BookmarkStore store(dir.path(), clock);
    ASSERT_FALSE(store.add("", model::Bookmark{}).has_value());
}

// ---------------------------------------------------------------------------
// SyncQueue
// ---------------------------------------------------------------------------

namespace {

class ScriptedSink : public RemoteProgressSink {
public:
    bool push(const model::ProgressRecord& record) override {
        pushed.push_back(record.item_id);
        return accept;
    }

    bool accept = true;
    std::vector<std::string> pushed;
};

SyncQueue::Settings fast_settings() {
    SyncQueue::Settings settings;
    settings.interval = 1000ms;
    settings.max_retries = 3;
    settings.retry_base_ms = 2000;
    return settings;
}

}  // namespace

TEST_CASE(test_sync_pushes_unsynced_records) {
    test::ManualClock clock;
    events::Scheduler scheduler(clock);
    test::MemoryProgressGateway gateway;
    ScriptedSink sink;
    gateway.save_local("a", 10.0, 100.0, false);
    gateway.save_local("b", 20.0, 100.0, false);

    SyncQueue queue(gateway, sink, scheduler, fast_settings());
    queue.start();
    clock.advance_ms(1000);
    scheduler.process();

    ASSERT_EQ(sink.pushed.size(), 2u);
    ASSERT_TRUE(gateway.get_unsynced().empty());
    ASSERT_EQ(queue.pending(), 0u);
}

TEST_CASE(test_sync_backs_off_then_abandons) {
    test::ManualClock clock;
    events::Scheduler scheduler(clock);
    test::MemoryProgressGateway gateway;
    ScriptedSink sink;
    sink.accept = false;
    gateway.save_local("a", 10.0, 100.0, false);

    SyncQueue queue(gateway, sink, scheduler, fast_settings());
    queue.process_queue();
    ASSERT_EQ(sink.pushed.size(), 1u);
    ASSERT_EQ(queue.pending(), 1u);

    // Backoff of 2s: nothing before it elapses
    clock.advance_ms(1999);
    queue.process_queue();
    ASSERT_EQ(sink.pushed.size(), 1u);

    clock.advance_ms(1);
    queue.process_queue();
    ASSERT_EQ(sink.pushed.size(), 2u);

    // Second backoff is 4s
    clock.advance_ms(4000);
    queue.process_queue();
    ASSERT_EQ(sink.pushed.size(), 3u);
    ASSERT_TRUE(queue.is_abandoned("a"));
    ASSERT_EQ(queue.pending(), 0u);

    // Abandoned items stay local and are not picked up again on their own
    clock.advance_ms(60000);
    queue.process_queue();
    ASSERT_EQ(sink.pushed.size(), 3u);
    ASSERT_EQ(gateway.get_unsynced().size(), 1u);

    sink.accept = true;
    queue.enqueue("a");
    ASSERT_FALSE(queue.is_abandoned("a"));
    queue.process_queue();
    ASSERT_TRUE(gateway.get_unsynced().empty());
}

TEST_CASE(test_sync_backoff_stops_doubling) {
    test::ManualClock clock;
    events::Scheduler scheduler(clock);
    test::MemoryProgressGateway gateway;
    ScriptedSink sink;
    sink.accept = false;
    gateway.save_local("a", 10.0, 100.0, false);

    auto settings = fast_settings();
    settings.max_retries = 64;
    settings.retry_base_ms = 100;
    const int64_t cap = int64_t{100} << SyncQueue::Settings::MAX_BACKOFF_SHIFT;

    SyncQueue queue(gateway, sink, scheduler, settings);
    queue.process_queue();
    for (size_t attempt = 2; attempt <= 40; ++attempt) {
        clock.advance_ms(cap);
        queue.process_queue();
        ASSERT_EQ(sink.pushed.size(), attempt);
    }

    // Well past the cap the delay is still exactly the capped value
    clock.advance_ms(cap - 1);
    queue.process_queue();
    ASSERT_EQ(sink.pushed.size(), 40u);
    clock.advance_ms(1);
    queue.process_queue();
    ASSERT_EQ(sink.pushed.size(), 41u);
    ASSERT_EQ(queue.pending(), 1u);
    ASSERT_FALSE(queue.is_abandoned("a"));
}

TEST_CASE(test_sync_force_all_ignores_backoff) {
    test::ManualClock clock;
    events::Scheduler scheduler(clock);
    test::MemoryProgressGateway gateway;
    ScriptedSink sink;
    sink.accept = false;
    gateway.save_local("a", 10.0, 100.0, false);
    gateway.save_local("b", 20.0, 100.0, false);

    SyncQueue queue(gateway, sink, scheduler, fast_settings());
    queue.process_queue();
    ASSERT_EQ(queue.pending(), 2u);

    sink.accept = true;
    ASSERT_EQ(queue.force_sync_all(), 2u);
    ASSERT_EQ(queue.pending(), 0u);
    ASSERT_TRUE(gateway.get_unsynced().empty());
}

TEST_CASE(test_sync_stop_cancels_ticker) {
    test::ManualClock clock;
    events::Scheduler scheduler(clock);
    test::MemoryProgressGateway gateway;
    ScriptedSink sink;
    gateway.save_local("a", 10.0, 100.0, false);

    SyncQueue queue(gateway, sink, scheduler, fast_settings());
    queue.start();
    queue.stop();
    clock.advance_ms(5000);
    scheduler.process();
    ASSERT_TRUE(sink.pushed.empty());
    ASSERT_EQ(scheduler.active_count(), 0u);
}

int main() {
    return folio::test::TestRunner::instance().run_all();
}
