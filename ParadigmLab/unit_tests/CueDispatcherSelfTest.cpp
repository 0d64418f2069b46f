#include "SelfTestUtils.hpp"
#include <stdexcept>
#include "../src/stimulus/CueDispatcher.hpp"

/* TEST COMPONENTS:
- jobs reach the target sink in FIFO order on the worker thread
- bounded queue: overflow is dropped and counted, hide_visual_cue never is
- full queue: only cue pulses drop, digits and screen clears still get through
- a throwing sink doesn't stop the worker
- stop() drains then rejects further posts; idempotent
*/

static int test_fifo_forwarding() {
    RecordingSink_C sink;
    CueDispatcher_C dispatcher(sink);
    dispatcher.set_instruction_text("Rest");
    dispatcher.play_tone(440.0, 100);
    dispatcher.show_visual_cue("#FF0000", 50, 100);
    dispatcher.hide_visual_cue();
    dispatcher.show_countdown("Block 1 finished.", 1500);
    dispatcher.flush();

    const auto calls = sink.calls();
    CHECK(calls.size() == 5);
    CHECK(calls[0].what == "text" && calls[0].text == "Rest");
    CHECK(calls[1].what == "tone");
    CHECK_NEAR(calls[1].value, 440.0, 1e-12);
    CHECK(calls[2].what == "visual_on" && calls[2].text == "#FF0000");
    CHECK(calls[3].what == "visual_off");
    CHECK(calls[4].what == "countdown");
    CHECK_NEAR(calls[4].value, 1500.0, 1e-12);
    CHECK(dispatcher.dropped_count() == 0);
    return 0;
}

static int test_overflow_drops() {
    RecordingSink_C sink;
    std::atomic<bool> release{ false };
    sink.on_digit = [&release](int) {
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds{ 1 });
    };
    CueDispatcher_C dispatcher(sink, 2);

    // worker parks inside the first job
    dispatcher.show_digit(1);
    const bool parked = wait_until([&] { return sink.count("digit") == 1; }, std::chrono::milliseconds{ 1000 });

    const bool second = dispatcher.post([](IStimulusSink_S& s) { s.show_digit(2); });
    const bool third = dispatcher.post([](IStimulusSink_S& s) { s.show_digit(3); });
    const bool fourth = dispatcher.post([](IStimulusSink_S& s) { s.show_digit(4); });
    dispatcher.hide_visual_cue();   // queue full, still accepted
    release.store(true);
    dispatcher.flush();

    CHECK(parked);
    CHECK(second);
    CHECK(third);
    CHECK(!fourth);
    CHECK(dispatcher.dropped_count() == 1);
    CHECK(sink.count("digit") == 3);
    CHECK(sink.count("visual_off") == 1);
    CHECK(sink.calls().back().what == "visual_off");
    return 0;
}

static int test_full_queue_keeps_stimuli() {
    RecordingSink_C sink;
    std::atomic<bool> release{ false };
    sink.on_digit = [&release](int digit) {
        if (digit != 1) return;
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds{ 1 });
    };
    CueDispatcher_C dispatcher(sink, 1);

    dispatcher.show_digit(1);
    const bool parked = wait_until([&] { return sink.count("digit") == 1; }, std::chrono::milliseconds{ 1000 });

    dispatcher.play_tone(880.0, 100);             // fills the queue
    dispatcher.play_tone(880.0, 100);             // dropped
    dispatcher.show_visual_cue("#00FF00", 40, 100); // dropped
    dispatcher.show_digit(7);
    dispatcher.clear_screen();
    release.store(true);
    dispatcher.flush();

    CHECK(parked);
    CHECK(dispatcher.dropped_count() == 2);
    CHECK(sink.count("tone") == 1);
    CHECK(sink.count("visual_on") == 0);
    CHECK(sink.count("digit") == 2);
    CHECK(sink.count("clear") == 1);
    const auto calls = sink.calls();
    CHECK(calls.size() == 4);
    CHECK(calls[2].what == "digit");
    CHECK(calls.back().what == "clear");
    return 0;
}

static int test_throwing_sink() {
    RecordingSink_C sink;
    sink.on_digit = [](int digit) {
        if (digit == 9) throw std::runtime_error("display gone");
    };
    CueDispatcher_C dispatcher(sink);
    dispatcher.show_digit(9);
    dispatcher.show_digit(1);
    dispatcher.clear_screen();
    dispatcher.flush();
    CHECK(sink.count("digit") == 2);
    CHECK(sink.count("clear") == 1);
    return 0;
}

static int test_stop() {
    RecordingSink_C sink;
    CueDispatcher_C dispatcher(sink);
    for (int i = 0; i < 10; ++i) {
        dispatcher.play_notification(Notification_HighBeep);
    }
    dispatcher.stop();
    CHECK(sink.count("notification", "high_beep") == 10);
    CHECK(!dispatcher.post([](IStimulusSink_S& s) { s.clear_screen(); }));
    dispatcher.hide_visual_cue();
    CHECK(sink.count("visual_off") == 0);
    dispatcher.stop();
    dispatcher.flush();
    return 0;
}

int main() {
    logger::init();
    logger::tlabel = "CueDispatcherSelfTest";
    RUN_TEST(test_fifo_forwarding);
    RUN_TEST(test_overflow_drops);
    RUN_TEST(test_full_queue_keeps_stimuli);
    RUN_TEST(test_throwing_sink);
    RUN_TEST(test_stop);
    LOG_ALWAYS("all cue dispatcher tests passed");
    return 0;
}
