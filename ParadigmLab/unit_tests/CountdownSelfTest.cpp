#include "SelfTestUtils.hpp"
#include "../src/utils/Countdown.hpp"

/* TEST COMPONENTS:
- cooperative Countdown_C driven by a poll loop (like the controllers do)
- run_blocking_countdown sleep-poll variant
- both: first tick = ceil(D*1000), last tick 0 then on_finished, abort = no on_finished
*/

struct TickLog_S {
    std::vector<long long> ticks;
    int finished = 0;
};

static CountdownCallbacks_S recorder(TickLog_S& log, std::function<bool()> abort = nullptr) {
    CountdownCallbacks_S cb;
    cb.on_tick = [&log](long long ms) { log.ticks.push_back(ms); };
    cb.on_finished = [&log]() { ++log.finished; };
    cb.should_abort = std::move(abort);
    return cb;
}

static bool non_increasing(const std::vector<long long>& v) {
    for (std::size_t i = 1; i < v.size(); ++i) {
        if (v[i] > v[i - 1]) return false;
    }
    return true;
}

static int test_zero_duration() {
    TickLog_S coop;
    Countdown_C cd;
    cd.start(0.0, recorder(coop));
    CHECK(!cd.is_running());
    CHECK(coop.ticks.size() == 1);
    CHECK(coop.ticks[0] == 0);
    CHECK(coop.finished == 1);
    CHECK(!cd.poll());

    TickLog_S blocking;
    CHECK(run_blocking_countdown(0.0, recorder(blocking)));
    CHECK(blocking.ticks.size() == 1);
    CHECK(blocking.ticks[0] == 0);
    CHECK(blocking.finished == 1);
    return 0;
}

static int test_negative_duration_clamps() {
    TickLog_S coop;
    Countdown_C cd;
    cd.start(-3.0, recorder(coop));
    CHECK(coop.ticks.size() == 1);
    CHECK(coop.ticks[0] == 0);
    CHECK(coop.finished == 1);

    TickLog_S blocking;
    CHECK(run_blocking_countdown(-1.0, recorder(blocking)));
    CHECK(blocking.ticks.size() == 1);
    CHECK(blocking.finished == 1);
    return 0;
}

static int test_cooperative_ticks() {
    TickLog_S log;
    Countdown_C cd;
    cd.start(0.3, recorder(log));
    CHECK(log.ticks.size() == 1);
    CHECK(log.ticks[0] == 300);
    CHECK(cd.is_running());

    const auto start = std::chrono::steady_clock::now();
    while (cd.poll()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    CHECK(log.finished == 1);
    CHECK(log.ticks.back() == 0);
    CHECK(non_increasing(log.ticks));
    // ~50ms interval over 300ms: roughly 6 ticks + first + closing 0
    CHECK(log.ticks.size() >= 4);
    CHECK(log.ticks.size() <= 10);
    CHECK(took >= 0.29);
    CHECK(took < 1.0);
    return 0;
}

static int test_cooperative_abort_and_cancel() {
    TickLog_S log;
    std::atomic<bool> abort{false};
    Countdown_C cd;
    cd.start(5.0, recorder(log, [&abort] { return abort.load(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds{60});
    CHECK(cd.poll());
    abort.store(true);
    CHECK(!cd.poll());
    CHECK(!cd.is_running());
    CHECK(log.finished == 0);

    // cancel is idempotent and drops callbacks
    TickLog_S log2;
    Countdown_C cd2;
    cd2.start(5.0, recorder(log2));
    cd2.cancel();
    cd2.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds{60});
    CHECK(!cd2.poll());
    CHECK(log2.ticks.size() == 1);
    CHECK(log2.finished == 0);
    return 0;
}

static int test_blocking_two_and_a_half_seconds() {
    TickLog_S log;
    const auto start = std::chrono::steady_clock::now();
    CHECK(run_blocking_countdown(2.5, recorder(log)));
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    CHECK(!log.ticks.empty());
    CHECK(log.ticks.front() == 2500);
    CHECK(log.ticks.back() == 0);
    CHECK(log.finished == 1);
    CHECK(non_increasing(log.ticks));
    // redundant ticks suppressed
    for (std::size_t i = 1; i < log.ticks.size(); ++i) {
        CHECK(log.ticks[i] != log.ticks[i - 1]);
    }
    CHECK(took >= 2.49);
    CHECK(took < 3.5);
    return 0;
}

static int test_blocking_abort() {
    TickLog_S log;
    const auto start = std::chrono::steady_clock::now();
    auto abortAfter = [start] {
        return std::chrono::steady_clock::now() - start > std::chrono::milliseconds{100};
    };
    CHECK(!run_blocking_countdown(10.0, recorder(log, abortAfter)));
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    CHECK(log.finished == 0);
    CHECK(took < 0.5);
    CHECK(!log.ticks.empty());
    CHECK(log.ticks.back() > 0);
    return 0;
}

static int test_format_text() {
    CHECK(format_countdown_text("Rest", 5250) == "Rest\n05.250s");
    CHECK(format_countdown_text("Block 1 finished.", 40000) == "Block 1 finished.\n40.000s");
    CHECK(countdown_remaining_ms(2.5, 0.0) == 2500);
    CHECK(countdown_remaining_ms(2.5, 2.4991) == 1);
    CHECK(countdown_remaining_ms(2.5, 3.0) == 0);
    return 0;
}

int main() {
    logger::init();
    logger::tlabel = "CountdownSelfTest";
    RUN_TEST(test_zero_duration);
    RUN_TEST(test_negative_duration_clamps);
    RUN_TEST(test_cooperative_ticks);
    RUN_TEST(test_cooperative_abort_and_cancel);
    RUN_TEST(test_blocking_two_and_a_half_seconds);
    RUN_TEST(test_blocking_abort);
    RUN_TEST(test_format_text);
    LOG_ALWAYS("all countdown tests passed");
    return 0;
}
