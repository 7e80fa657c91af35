#include "../framework/ManualClock.hpp"
#include "../framework/SimpleTest.hpp"
#include "core/SleepTimer.hpp"

using namespace folio;
using namespace folio::core;
using folio::model::SleepTimerKind;

namespace {

struct Fixture {
    test::ManualClock clock;
    events::Scheduler scheduler{clock};
    int expirations = 0;
    int changes = 0;
    SleepTimer timer{scheduler, [this]() { ++expirations; }};

    Fixture() {
        timer.set_on_change([this]() { ++changes; });
    }

    void advance_seconds(double seconds) {
        clock.advance_seconds(seconds);
        scheduler.process();
    }
};

}  // namespace

TEST_CASE(test_countdown_reports_remaining) {
    Fixture f;
    ASSERT_TRUE(f.timer.set(1.0));
    ASSERT_EQ(f.timer.state().kind, SleepTimerKind::Countdown);
    ASSERT_EQ(f.timer.state().remaining_seconds, 60);

    f.advance_seconds(1.0);
    ASSERT_EQ(f.timer.state().remaining_seconds, 59);
    f.advance_seconds(10.5);
    ASSERT_EQ(f.timer.state().remaining_seconds, 49);
    ASSERT_EQ(f.expirations, 0);
}

TEST_CASE(test_clock_jump_expires_exactly_once) {
    Fixture f;
    f.timer.set(1.0);

    f.advance_seconds(61.0);
    ASSERT_EQ(f.timer.state().remaining_seconds, 0);
    ASSERT_EQ(f.timer.state().kind, SleepTimerKind::Off);
    ASSERT_EQ(f.expirations, 1);

    f.advance_seconds(5.0);
    ASSERT_EQ(f.expirations, 1);
    ASSERT_EQ(f.scheduler.active_count(), 0u);
}

TEST_CASE(test_rejects_invalid_durations) {
    Fixture f;
    ASSERT_FALSE(f.timer.set(0.0));
    ASSERT_FALSE(f.timer.set(-3.0));
    ASSERT_FALSE(f.timer.set(std::nan("")));
    ASSERT_FALSE(f.timer.active());
}

TEST_CASE(test_set_replaces_running_timer) {
    Fixture f;
    f.timer.set(10.0);
    f.timer.set(1.0);
    ASSERT_EQ(f.timer.state().remaining_seconds, 60);
    ASSERT_EQ(f.scheduler.active_count(), 1u);
}

TEST_CASE(test_extend_pushes_deadline) {
    Fixture f;
    f.timer.set(1.0);
    f.advance_seconds(30.0);
    ASSERT_TRUE(f.timer.extend(1.0));
    ASSERT_EQ(f.timer.state().remaining_seconds, 90);

    f.advance_seconds(60.0);
    ASSERT_EQ(f.expirations, 0);
    f.advance_seconds(30.0);
    ASSERT_EQ(f.expirations, 1);
}

TEST_CASE(test_extend_when_off_starts_countdown) {
    Fixture f;
    ASSERT_TRUE(f.timer.extend(15.0));
    ASSERT_EQ(f.timer.state().kind, SleepTimerKind::Countdown);
    ASSERT_EQ(f.timer.state().remaining_seconds, 900);
}

TEST_CASE(test_clear_does_not_expire) {
    Fixture f;
    f.timer.set(1.0);
    f.timer.clear();
    ASSERT_FALSE(f.timer.active());

    f.advance_seconds(120.0);
    ASSERT_EQ(f.expirations, 0);
    ASSERT_EQ(f.scheduler.active_count(), 0u);

    int changes = f.changes;
    f.timer.clear();
    ASSERT_EQ(f.changes, changes);
}

TEST_CASE(test_end_of_chapter_waits_for_position) {
    Fixture f;
    ASSERT_TRUE(f.timer.set_end_of_chapter(1800.0));
    ASSERT_EQ(f.timer.state().kind, SleepTimerKind::EndOfChapter);
    ASSERT_NEAR(f.timer.state().chapter_end, 1800.0, 1e-9);
    ASSERT_EQ(f.scheduler.active_count(), 0u);

    f.advance_seconds(7200.0);
    ASSERT_EQ(f.expirations, 0);

    f.timer.chapter_end_reached();
    ASSERT_EQ(f.expirations, 1);
    ASSERT_FALSE(f.timer.active());

    f.timer.chapter_end_reached();
    ASSERT_EQ(f.expirations, 1);
}

TEST_CASE(test_end_of_chapter_retarget_and_extend) {
    Fixture f;
    f.timer.set_end_of_chapter(1800.0);
    f.timer.retarget_chapter_end(3600.0);
    ASSERT_NEAR(f.timer.state().chapter_end, 3600.0, 1e-9);
    ASSERT_FALSE(f.timer.extend(5.0));
    ASSERT_EQ(f.timer.state().kind, SleepTimerKind::EndOfChapter);
}

TEST_CASE(test_countdown_ignores_chapter_end) {
    Fixture f;
    f.timer.set(5.0);
    f.timer.chapter_end_reached();
    f.timer.retarget_chapter_end(100.0);
    ASSERT_EQ(f.expirations, 0);
    ASSERT_EQ(f.timer.state().kind, SleepTimerKind::Countdown);
    ASSERT_NEAR(f.timer.state().chapter_end, 0.0, 1e-9);
}

int main() {
    return folio::test::TestRunner::instance().run_all();
}
