#include "SelfTestUtils.hpp"
#include "../src/utils/Stopwatch.hpp"
#include "../src/utils/SWTimer.hpp"
#include "../src/utils/PeriodicSchedule.hpp"

/* TEST COMPONENTS:
- Stopwatch_C: non-negative, non-decreasing, paired reads, reset
- SW_Timer_C: expiry, cancel, shared origin
- PeriodicSchedule_C: accumulating next-fire time (no drift from late polls)
*/

static int test_elapsed_monotonic() {
    Stopwatch_C sw;
    double last = sw.elapsed_s();
    CHECK(last >= 0.0);
    for (int i = 0; i < 200; ++i) {
        double now = sw.elapsed_s();
        CHECK(now >= last);
        last = now;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    CHECK(sw.elapsed_s() >= 0.019);
    CHECK(sw.elapsed_ms() >= 19);
    return 0;
}

static int test_timestamp_pair() {
    Stopwatch_C sw;
    std::this_thread::sleep_for(std::chrono::milliseconds{15});
    const auto wallBefore = wall_clock_T::now();
    TimestampPair_S p = sw.timestamp_pair();
    const auto wallAfter = wall_clock_T::now();
    CHECK(p.wall >= wallBefore);
    CHECK(p.wall <= wallAfter);
    CHECK(p.rel_s >= 0.014);

    // wall - start_wall tracks rel_s (same instant, two clocks)
    const double wallDelta = std::chrono::duration_cast<seconds_d_T>(p.wall - sw.start_wall()).count();
    CHECK_NEAR(wallDelta, p.rel_s, 0.05);
    return 0;
}

static int test_reset_moves_anchor() {
    Stopwatch_C sw;
    std::this_thread::sleep_for(std::chrono::milliseconds{30});
    const auto firstAnchor = sw.start_mono();
    CHECK(sw.elapsed_s() >= 0.029);
    sw.reset();
    CHECK(sw.start_mono() > firstAnchor);
    CHECK(sw.elapsed_s() < 0.029);
    return 0;
}

static int test_format_wall_time() {
    const std::string s = format_wall_time(wall_clock_T::now());
    // YYYY-mm-dd HH:MM:SS.mmm
    CHECK(s.size() == 23);
    CHECK(s[4] == '-');
    CHECK(s[10] == ' ');
    CHECK(s[19] == '.');
    return 0;
}

static int test_sw_timer() {
    SW_Timer_C t;
    CHECK(!t.is_started());
    CHECK(!t.check_timer_expired());
    t.start_timer(std::chrono::milliseconds{20});
    CHECK(t.is_started());
    CHECK(!t.check_timer_expired());
    CHECK(wait_until([&] { return t.check_timer_expired(); }, std::chrono::milliseconds{500}));
    t.cancel();
    t.cancel();
    CHECK(!t.check_timer_expired());

    // negative duration clamps to "already expired"
    t.start_timer(std::chrono::milliseconds{-5});
    CHECK(t.check_timer_expired());

    // two timers armed from one origin keep their relative offset
    SW_Timer_C a, b;
    const auto origin = SW_Timer_C::clock_t::now();
    a.start_timer_at(origin, std::chrono::milliseconds{10});
    b.start_timer_at(origin, std::chrono::milliseconds{30});
    CHECK(b.deadline() - a.deadline() == std::chrono::milliseconds{20});
    return 0;
}

static int test_periodic_schedule_no_drift() {
    const auto t0 = clock_T::now();
    const auto period = std::chrono::milliseconds{100};
    PeriodicSchedule_C sched(t0, period);

    CHECK(sched.is_due(t0));
    // a late poll (35ms late) fires once but does not shift the next slot
    sched.advance();
    CHECK(sched.next_fire_time() == t0 + period);
    CHECK(!sched.is_due(t0 + std::chrono::milliseconds{99}));
    CHECK(sched.is_due(t0 + std::chrono::milliseconds{135}));
    sched.advance();
    CHECK(sched.next_fire_time() == t0 + 2 * period);

    // caught up after a long stall: the slots stay on the grid
    int fired = 0;
    const auto late = t0 + std::chrono::milliseconds{530};
    while (sched.is_due(late)) {
        sched.advance();
        ++fired;
    }
    CHECK(fired == 4);
    CHECK(sched.next_fire_time() == t0 + 6 * period);
    CHECK(sched.fired() == 6);

    PeriodicSchedule_C ui(t0, period);
    ui.skip_to_after(late);
    CHECK(ui.next_fire_time() == t0 + 6 * period);

    CHECK(period_from_hz(2.0) == std::chrono::duration_cast<clock_T::duration>(std::chrono::milliseconds{500}));
    return 0;
}

int main() {
    logger::init();
    logger::tlabel = "StopwatchSelfTest";
    RUN_TEST(test_elapsed_monotonic);
    RUN_TEST(test_timestamp_pair);
    RUN_TEST(test_reset_moves_anchor);
    RUN_TEST(test_format_wall_time);
    RUN_TEST(test_sw_timer);
    RUN_TEST(test_periodic_schedule_no_drift);
    LOG_ALWAYS("all stopwatch/timer tests passed");
    return 0;
}
