#include "SelfTestUtils.hpp"
#include <stdexcept>
#include "../src/paradigm/GoNoGoController.hpp"
#include "../src/stimulus/CueDispatcher.hpp"
#include "../src/shared/StateStore.hpp"

/* TEST COMPONENTS:
- full run on a fixed plan with a scripted participant (responds through the cue dispatcher)
- outcome scoring, metrics, notification order, inter-block interval records
- abort mid-run: absorbing, reason recorded, experiment_end after every recorded event
- one run per process (RunGuard_C) and one run per controller
*/

using paradigmlab::trials::TrialPlan_S;

// short everything except the fixed 1s start screen
static GoNoGoConfig_S fast_config() {
    auto cfg = GoNoGoConfig_S::defaults();
    cfg.test_mode = true;
    cfg.go_digits = { 1, 2, 3 };
    cfg.nogo_digits = { 9 };
    cfg.n_blocks = 2;
    cfg.n_trials_per_block = 4;
    cfg.rest_duration_s = 0.05;
    cfg.post_block_rest_duration_s = 0.05;
    cfg.inter_block_interval_s = 0.05;
    cfg.stimulus_duration_s = 0.05;
    cfg.inter_trial_interval_s = 0.05;
    cfg.max_response_window_s = 0.25;
    return cfg;
}

static TrialPlan_S fixed_plan() {
    TrialPlan_S plan;
    plan.go_ratio = 0.75;
    plan.blocks.push_back({ { 1, true }, { 9, false }, { 2, true }, { 3, true } });
    plan.blocks.push_back({ { 9, false }, { 3, true }, { 1, true }, { 2, true } });
    return plan;
}

static bool is_go_digit(int d) {
    return d >= 1 && d <= 3;
}

static int test_ideal_participant() {
    RecordingSink_C sink;
    CueDispatcher_C dispatcher(sink);
    StateStore_s store;
    GoNoGoController_C controller(fast_config(), dispatcher, &store, fixed_plan());
    sink.on_digit = [&controller](int digit) {
        if (is_go_digit(digit)) controller.submit_response();
    };

    const ExperimentLog_S log = controller.run();
    dispatcher.flush();

    CHECK(controller.getState() == GoNoGoState_Terminal);
    CHECK(log.status.completed());
    CHECK(log.status.reason() == "normal_end");
    CHECK(store.g_completed.load());
    CHECK(!store.g_aborted.load());

    CHECK(log.gonogo_blocks.size() == 2);
    CHECK(log.trial_count() == 8);
    for (const auto& block : log.gonogo_blocks) {
        CHECK(block.rest_start.has_value());
        CHECK(block.task_start.has_value());
        CHECK(block.task_start->rel_s >= block.rest_start->rel_s + 0.045);
        CHECK(block.trials.size() == 4);
        for (const auto& t : block.trials) {
            CHECK(t.is_resolved());
            if (t.is_go) {
                CHECK(t.outcome == TrialOutcome_Hit);
                CHECK(t.reaction_time_s >= 0.0);
                CHECK(t.reaction_time_s <= 0.25);
            } else {
                CHECK(t.outcome == TrialOutcome_CorrectWithholding);
                CHECK(!t.response);
            }
        }
        // onsets strictly increase within a block
        for (std::size_t i = 1; i < block.trials.size(); ++i) {
            CHECK(block.trials[i].onset.rel_s > block.trials[i - 1].onset.rel_s);
        }
    }
    CHECK(log.gonogo_blocks[0].post_rest_start.has_value());
    CHECK(!log.gonogo_blocks[1].post_rest_start.has_value());
    CHECK(log.inter_block_intervals.size() == 1);
    CHECK(log.inter_block_intervals[0].after_block == 1);
    CHECK_NEAR(log.inter_block_intervals[0].planned_duration_s, 0.1, 1e-12);

    CHECK(log.metrics.has_value());
    CHECK_NEAR(*log.metrics->go_hit_percent, 100.0, 1e-9);
    CHECK_NEAR(*log.metrics->nogo_commission_percent, 0.0, 1e-9);
    CHECK(log.metrics->mean_rt_go_hit.has_value());
    CHECK(!log.metrics->mean_rt_nogo_commission);

    CHECK(sink.count("notification", "high_beep") == 8);
    CHECK(sink.count("digit") == 8);
    CHECK(sink.count("text", "Start") == 1);
    CHECK(sink.count("text", "Completed") == 1);
    CHECK(sink.count("countdown") >= 2);

    std::vector<std::string> notifications;
    for (const auto& c : sink.calls()) {
        if (c.what == "notification") notifications.push_back(c.text);
    }
    CHECK(notifications.front() == "start_sequence");
    CHECK(notifications.back() == "end_sequence");
    CHECK(sink.count("notification", "end_sequence") == 1);

    // config snapshot carries the plan that ran
    CHECK(log.config_json.find("\"trial_schedule\":[[{\"digit\":1,\"is_go\":true}") != std::string::npos);
    CHECK(log.experiment_end->rel_s >= log.latest_recorded_rel_s());
    return 0;
}

static int test_responds_to_everything() {
    RecordingSink_C sink;
    CueDispatcher_C dispatcher(sink);
    GoNoGoController_C controller(fast_config(), dispatcher, nullptr, fixed_plan());
    sink.on_digit = [&controller](int) { controller.submit_response(); };

    const ExperimentLog_S log = controller.run();
    dispatcher.flush();

    CHECK(log.status.completed());
    CHECK_NEAR(*log.metrics->go_hit_percent, 100.0, 1e-9);
    CHECK_NEAR(*log.metrics->nogo_commission_percent, 100.0, 1e-9);
    CHECK(log.metrics->mean_rt_nogo_commission.has_value());
    for (const auto& block : log.gonogo_blocks) {
        for (const auto& t : block.trials) {
            if (!t.is_go) {
                CHECK(t.outcome == TrialOutcome_CommissionError);
                CHECK(t.response_key && *t.response_key == "space");
            }
        }
    }
    return 0;
}

static int test_no_responses() {
    RecordingSink_C sink;
    CueDispatcher_C dispatcher(sink);
    auto cfg = fast_config();
    cfg.n_blocks = 1;
    TrialPlan_S plan = fixed_plan();
    plan.blocks.pop_back();
    GoNoGoController_C controller(cfg, dispatcher, nullptr, plan);

    const ExperimentLog_S log = controller.run();
    dispatcher.flush();

    CHECK(log.status.completed());
    CHECK(log.inter_block_intervals.empty());
    CHECK_NEAR(*log.metrics->go_hit_percent, 0.0, 1e-9);
    CHECK_NEAR(*log.metrics->nogo_commission_percent, 0.0, 1e-9);
    CHECK(!log.metrics->mean_rt_go_hit);
    for (const auto& t : log.gonogo_blocks[0].trials) {
        CHECK(t.outcome == (t.is_go ? TrialOutcome_Miss : TrialOutcome_CorrectWithholding));
        CHECK(std::isnan(t.reaction_time_s));
    }
    // window (0.25s) + ITI (0.05s) between onsets
    const auto& trials = log.gonogo_blocks[0].trials;
    for (std::size_t i = 1; i < trials.size(); ++i) {
        CHECK(trials[i].onset.rel_s - trials[i - 1].onset.rel_s >= 0.29);
    }
    return 0;
}

static int test_abort_mid_run() {
    RecordingSink_C sink;
    CueDispatcher_C dispatcher(sink);
    StateStore_s store;
    auto cfg = fast_config();
    cfg.max_response_window_s = 5.0;   // abort lands inside an open window
    GoNoGoController_C controller(cfg, dispatcher, &store, fixed_plan());

    ExperimentLog_S log;
    std::thread runner([&] { log = controller.run(); });

    const bool inWindow = wait_until([&] { return controller.getState() == GoNoGoState_TrialStimulus; },
                                     std::chrono::milliseconds{ 3000 });
    controller.request_abort(AbortReason_None);
    controller.request_abort(AbortReason_UserAbort);   // first reason sticks
    runner.join();
    dispatcher.flush();
    CHECK(inWindow);

    CHECK(controller.getState() == GoNoGoState_Terminal);
    CHECK(log.status.aborted());
    CHECK(log.status.reason() == "client_abort");
    CHECK(log.status.abort_time.has_value());
    CHECK(log.experiment_end.has_value());
    CHECK(log.experiment_end->rel_s >= log.latest_recorded_rel_s());
    CHECK(store.g_aborted.load());
    CHECK(!store.g_completed.load());

    // the trial whose window was open stays pending: counted as a Go trial, not as a hit
    CHECK(log.trial_count() == 1);
    CHECK(!log.gonogo_blocks[0].trials[0].is_resolved());
    CHECK(log.metrics.has_value());
    CHECK(log.metrics->go_hit_percent.has_value());
    CHECK_NEAR(*log.metrics->go_hit_percent, 0.0, 1e-12);
    CHECK(!log.metrics->nogo_commission_percent);
    CHECK(!log.metrics->mean_rt_go_hit);

    CHECK(sink.count("text", "Aborted") == 1);
    CHECK(sink.count("notification", "end_sequence") == 1);

    // input after the run is ignored
    controller.submit_response();
    controller.request_abort(AbortReason_SignalInterrupt);
    CHECK(controller.getState() == GoNoGoState_Terminal);
    return 0;
}

static int test_single_run() {
    RecordingSink_C sink;
    CueDispatcher_C dispatcher(sink);
    GoNoGoController_C first(fast_config(), dispatcher, nullptr, fixed_plan());
    GoNoGoController_C second(fast_config(), dispatcher, nullptr, fixed_plan());

    ExperimentLog_S log;
    std::thread runner([&] { log = first.run(); });
    const bool started = wait_until([&] { return first.getState() != GoNoGoState_Idle; },
                                    std::chrono::milliseconds{ 2000 });

    bool rejected = false;
    try {
        (void)second.run();
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    first.request_abort(AbortReason_UserAbort);
    runner.join();
    CHECK(started);
    CHECK(rejected);
    CHECK(log.status.reason() == "user_abort");
    CHECK(!RunGuard_C::any_active());

    // a controller is single-use
    bool reused = false;
    try {
        (void)first.run();
    } catch (const std::runtime_error&) {
        reused = true;
    }
    CHECK(reused);
    return 0;
}

static int test_rejects_bad_input() {
    RecordingSink_C sink;
    auto cfg = fast_config();
    cfg.nogo_digits = { 1 };
    GoNoGoController_C overlap(cfg, sink);
    bool threw = false;
    try {
        (void)overlap.run();
    } catch (const InvalidConfig_C&) {
        threw = true;
    }
    CHECK(threw);
    CHECK(overlap.getState() == GoNoGoState_Idle);
    CHECK(sink.calls().empty());

    TrialPlan_S empty;
    GoNoGoController_C noBlocks(fast_config(), sink, nullptr, empty);
    threw = false;
    try {
        (void)noBlocks.run();
    } catch (const InvalidConfig_C&) {
        threw = true;
    }
    CHECK(threw);
    return 0;
}

int main() {
    logger::init();
    logger::tlabel = "GoNoGoSelfTest";
    RUN_TEST(test_ideal_participant);
    RUN_TEST(test_responds_to_everything);
    RUN_TEST(test_no_responses);
    RUN_TEST(test_abort_mid_run);
    RUN_TEST(test_single_run);
    RUN_TEST(test_rejects_bad_input);
    LOG_ALWAYS("all go/no-go tests passed");
    return 0;
}
