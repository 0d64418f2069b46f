#include "SelfTestUtils.hpp"
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include "../src/log/ExperimentLog.hpp"
#include "../src/log/LogWriter.hpp"
#include "../src/analysis/Metrics.hpp"
#include "../src/utils/JsonUtils.hpp"

/* TEST COMPONENTS:
- TrialLogEntry_S::resolve: first call wins, outcome table, reaction time
- ExperimentLog_S: experiment_end written exactly once, abort reason defaults
- compute_go_nogo_metrics: percentages and means, null on empty denominators
- pending trials count in the Go / No-Go denominators, never as hits or commissions
- LogWriter: timing_absolute / timing_relative carry identical key sequences
- persist_log: <folder>/<prefix>_<YYYYmmdd_HHMMSS>.json
*/

using namespace paradigmlab;

static TimestampPair_S at(const Stopwatch_C& sw, double rel) {
    TimestampPair_S ts;
    ts.rel_s = rel;
    ts.wall = sw.start_wall() + std::chrono::duration_cast<wall_clock_T::duration>(seconds_d_T{ rel });
    return ts;
}

static TrialLogEntry_S make_trial(const Stopwatch_C& sw, int idx, int digit, bool isGo, double onset) {
    TrialLogEntry_S t;
    t.trial_index = idx;
    t.digit = digit;
    t.is_go = isGo;
    t.onset = at(sw, onset);
    return t;
}

static std::vector<std::string> keys_of(const std::string& json) {
    static const std::regex keyRe("\"([a-z_]+)\":");
    std::vector<std::string> keys;
    for (auto it = std::sregex_iterator(json.begin(), json.end(), keyRe); it != std::sregex_iterator(); ++it) {
        keys.push_back((*it)[1].str());
    }
    return keys;
}

// small Go/No-Go log: block 1 = hit, miss, commission, withholding; block 2 = one pending trial
static ExperimentLog_S sample_gonogo_log(const Stopwatch_C& sw) {
    ExperimentLog_S log;
    log.paradigm = Paradigm_GoNoGo;
    log.meta.paradigm_name = "GoNoGo";
    log.meta.created_at = sw.start_wall();
    log.meta.notes = "\n  patient 7 \n\nC3-C4 bipolar\nextra";
    log.mark_running(at(sw, 0.0));

    GoNoGoBlockRecord_S b1;
    b1.block_index = 1;
    b1.block_start = at(sw, 1.0);
    b1.rest_start = at(sw, 1.0);
    b1.task_start = at(sw, 2.0);
    auto hit = make_trial(sw, 1, 3, true, 2.0);
    hit.resolve(at(sw, 2.4));
    auto miss = make_trial(sw, 2, 4, true, 3.0);
    miss.resolve(std::nullopt);
    auto commission = make_trial(sw, 3, 9, false, 4.0);
    commission.resolve(at(sw, 4.2));
    auto withheld = make_trial(sw, 4, 9, false, 5.0);
    withheld.resolve(std::nullopt);
    b1.trials = { hit, miss, commission, withheld };
    b1.post_rest_start = at(sw, 6.0);
    log.gonogo_blocks.push_back(b1);

    InterBlockInterval_S ibi;
    ibi.after_block = 1;
    ibi.start = at(sw, 6.0);
    ibi.planned_duration_s = 40.0;
    log.inter_block_intervals.push_back(ibi);

    GoNoGoBlockRecord_S b2;
    b2.block_index = 2;
    b2.block_start = at(sw, 46.0);
    b2.rest_start = at(sw, 46.0);
    b2.task_start = at(sw, 56.0);
    b2.trials.push_back(make_trial(sw, 1, 1, true, 56.0));
    log.gonogo_blocks.push_back(b2);
    return log;
}

static int test_resolve_first_wins() {
    Stopwatch_C sw;
    auto t = make_trial(sw, 1, 5, true, 1.0);
    CHECK(!t.is_resolved());
    CHECK(std::isnan(t.reaction_time_s));
    CHECK(t.resolve(at(sw, 1.35)));
    CHECK(t.outcome == TrialOutcome_Hit);
    CHECK_NEAR(t.reaction_time_s, 0.35, 1e-9);
    CHECK(t.response_key && *t.response_key == "space");

    // late second call changes nothing
    CHECK(!t.resolve(std::nullopt));
    CHECK(!t.resolve(at(sw, 1.9)));
    CHECK(t.outcome == TrialOutcome_Hit);
    CHECK_NEAR(t.response->rel_s, 1.35, 1e-9);
    return 0;
}

static int test_outcome_table() {
    CHECK(classify_outcome(true, true) == TrialOutcome_Hit);
    CHECK(classify_outcome(true, false) == TrialOutcome_Miss);
    CHECK(classify_outcome(false, true) == TrialOutcome_CommissionError);
    CHECK(classify_outcome(false, false) == TrialOutcome_CorrectWithholding);

    Stopwatch_C sw;
    auto withheld = make_trial(sw, 1, 9, false, 2.0);
    CHECK(withheld.resolve(std::nullopt));
    CHECK(withheld.outcome == TrialOutcome_CorrectWithholding);
    CHECK(!withheld.response);
    CHECK(!withheld.response_key);
    CHECK(std::isnan(withheld.reaction_time_s));
    return 0;
}

static int test_end_written_once() {
    Stopwatch_C sw;
    ExperimentLog_S log;
    CHECK(!log.accepts_timing());
    CHECK(log.status.reason() == "not_started");
    log.mark_running(at(sw, 0.0));
    CHECK(log.accepts_timing());
    CHECK(log.status.reason() == "running");

    CHECK(log.mark_completed(at(sw, 10.0)));
    CHECK(log.status.completed());
    CHECK(log.status.reason() == "normal_end");
    CHECK(!log.accepts_timing());

    CHECK(!log.mark_aborted(AbortReason_UserAbort, at(sw, 11.0)));
    CHECK(!log.mark_completed(at(sw, 12.0)));
    CHECK(log.status.completed());
    CHECK_NEAR(log.experiment_end->rel_s, 10.0, 1e-12);
    CHECK(!log.status.abort_time);
    return 0;
}

static int test_abort_reason() {
    Stopwatch_C sw;
    ExperimentLog_S log;
    log.mark_running(at(sw, 0.0));
    CHECK(log.mark_aborted(AbortReason_None, at(sw, 3.0)));
    CHECK(log.status.aborted());
    CHECK(log.status.abort_reason == AbortReason_ClientAbort);
    CHECK(log.status.reason() == "client_abort");
    CHECK_NEAR(log.status.abort_time->rel_s, 3.0, 1e-12);
    CHECK_NEAR(log.experiment_end->rel_s, 3.0, 1e-12);
    CHECK(!log.mark_aborted(AbortReason_UserAbort, at(sw, 4.0)));
    CHECK(log.status.abort_reason == AbortReason_ClientAbort);

    ExperimentLog_S sig;
    sig.mark_running(at(sw, 0.0));
    CHECK(sig.mark_aborted(AbortReason_SignalInterrupt, at(sw, 1.0)));
    CHECK(sig.status.reason() == "signal_interrupt");
    return 0;
}

static int test_metrics() {
    Stopwatch_C sw;
    const auto log = sample_gonogo_log(sw);
    CHECK(log.trial_count() == 5);
    CHECK_NEAR(log.latest_recorded_rel_s(), 56.0, 1e-12);

    const auto m = analysis::compute_go_nogo_metrics(log);
    // pending Go trial in block 2 counts toward the Go trials: 1 hit of 3
    CHECK(m.go_hit_percent.has_value());
    CHECK_NEAR(*m.go_hit_percent, 100.0 / 3.0, 1e-9);
    CHECK_NEAR(*m.nogo_commission_percent, 50.0, 1e-9);
    CHECK_NEAR(*m.mean_rt_go_hit, 0.4, 1e-9);
    CHECK_NEAR(*m.mean_rt_nogo_commission, 0.2, 1e-9);
    return 0;
}

static int test_metrics_pending_trials() {
    Stopwatch_C sw;
    ExperimentLog_S log;
    log.paradigm = Paradigm_GoNoGo;
    log.mark_running(at(sw, 0.0));
    GoNoGoBlockRecord_S b;
    b.block_index = 1;
    auto hit = make_trial(sw, 1, 2, true, 1.0);
    hit.resolve(at(sw, 1.3));
    b.trials.push_back(hit);
    b.trials.push_back(make_trial(sw, 2, 3, true, 2.0));     // cut off by abort
    b.trials.push_back(make_trial(sw, 3, 9, false, 3.0));    // cut off by abort
    log.gonogo_blocks.push_back(b);
    CHECK(log.mark_aborted(AbortReason_UserAbort, at(sw, 3.1)));

    const auto m = analysis::compute_go_nogo_metrics(log);
    CHECK(m.go_hit_percent.has_value());
    CHECK_NEAR(*m.go_hit_percent, 50.0, 1e-9);
    CHECK(m.nogo_commission_percent.has_value());
    CHECK_NEAR(*m.nogo_commission_percent, 0.0, 1e-12);
    CHECK_NEAR(*m.mean_rt_go_hit, 0.3, 1e-9);
    CHECK(!m.mean_rt_nogo_commission);
    return 0;
}

static int test_metrics_empty_denominators() {
    Stopwatch_C sw;
    ExperimentLog_S log;
    log.paradigm = Paradigm_GoNoGo;
    log.mark_running(at(sw, 0.0));
    GoNoGoBlockRecord_S b;
    b.block_index = 1;
    auto miss = make_trial(sw, 1, 2, true, 1.0);
    miss.resolve(std::nullopt);
    b.trials.push_back(miss);
    log.gonogo_blocks.push_back(b);

    const auto m = analysis::compute_go_nogo_metrics(log);
    CHECK(m.go_hit_percent.has_value());
    CHECK_NEAR(*m.go_hit_percent, 0.0, 1e-12);
    CHECK(!m.nogo_commission_percent);
    CHECK(!m.mean_rt_go_hit);
    CHECK(!m.mean_rt_nogo_commission);

    CHECK(logio::serialize_metrics(std::nullopt) == "null");
    const auto json = logio::serialize_metrics(m);
    CHECK(json.find("\"nogo_commission_percent\":null") != std::string::npos);
    CHECK(json.find("\"mean_rt_go_hit\":null") != std::string::npos);
    return 0;
}

static int test_timelines_share_keys() {
    Stopwatch_C sw;
    auto log = sample_gonogo_log(sw);
    log.mark_aborted(AbortReason_UserAbort, at(sw, 56.3));

    const auto absolute = logio::serialize_timeline(log, logio::Timeline_Absolute);
    const auto relative = logio::serialize_timeline(log, logio::Timeline_Relative);
    const auto absKeys = keys_of(absolute);
    CHECK(!absKeys.empty());
    CHECK(absKeys == keys_of(relative));
    CHECK(absKeys.front() == "experiment_start");

    // pending trial: no response, NaN reaction time -> null
    CHECK(relative.find("\"outcome\":\"pending\",\"reaction_time_s\":null") != std::string::npos);
    CHECK(relative.find("\"experiment_end\":56.300000") != std::string::npos);
    CHECK(relative.find("\"reaction_time_s\":0.400000") != std::string::npos);
    CHECK(absolute.find("\"experiment_start\":\"") != std::string::npos);

    // rhythm layout too
    ExperimentLog_S rhythm;
    rhythm.paradigm = Paradigm_Rhythm;
    rhythm.mark_running(at(sw, 0.0));
    RhythmBlockRecord_S rb;
    rb.block_index = 0;
    rb.block_start = at(sw, 0.8);
    for (std::size_t p = 0; p < NUM_RHYTHM_PHASES; ++p) {
        rb.phases[p].phase = static_cast<RhythmPhase_E>(p);
        rb.phases[p].planned_duration_s = 1.0;
    }
    rb.phases[RhythmPhase_CuedMovement].start = at(sw, 1.8);
    rb.phases[RhythmPhase_CuedMovement].cue_events = { at(sw, 1.8), at(sw, 2.8) };
    InterBlockInterval_S ibi;
    ibi.after_block = 0;
    ibi.start = at(sw, 5.8);
    ibi.planned_duration_s = 30.0;
    rb.interval_after_block = ibi;
    rhythm.rhythm_blocks.push_back(rb);
    rhythm.mark_completed(at(sw, 40.0));

    const auto rAbs = logio::serialize_timeline(rhythm, logio::Timeline_Absolute);
    const auto rRel = logio::serialize_timeline(rhythm, logio::Timeline_Relative);
    CHECK(keys_of(rAbs) == keys_of(rRel));
    CHECK(rRel.find("\"cue_events\":[1.800000,2.800000]") != std::string::npos);
    CHECK(rRel.find("\"internal_movement\":{\"planned_duration_s\":1.000000,\"start\":null") != std::string::npos);
    return 0;
}

static int test_full_log_document() {
    Stopwatch_C sw;
    auto log = sample_gonogo_log(sw);
    log.config_json = "{\"n_blocks\":2}";
    log.mark_completed(at(sw, 60.0));
    log.metrics = analysis::compute_go_nogo_metrics(log);

    const auto doc = logio::serialize_log(log);
    for (const char* key : { "meta", "config", "status", "timing_absolute", "timing_relative", "metrics" }) {
        CHECK(JSON::has_json_key(doc, key));
    }
    std::string patient;
    CHECK(JSON::extract_json_string(doc, "patient_info", patient));
    CHECK(patient == "patient 7");
    std::string electrode;
    CHECK(JSON::extract_json_string(doc, "electrode_info", electrode));
    CHECK(electrode == "C3-C4 bipolar");
    std::string reason;
    CHECK(JSON::extract_json_string(doc, "reason", reason));
    CHECK(reason == "normal_end");
    bool completed = false;
    CHECK(JSON::extract_json_bool(doc, "completed", completed));
    CHECK(completed);
    CHECK(doc.find("\"abort_reason\":null") != std::string::npos);
    return 0;
}

static int test_persist() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "paradigmlab_eventlog_selftest";
    std::error_code ec;
    fs::remove_all(dir, ec);

    Stopwatch_C sw;
    auto log = sample_gonogo_log(sw);
    log.mark_completed(at(sw, 60.0));

    const auto written = logio::persist_log(log, (dir / "nested").string(), "Go NoGo/v1");
    CHECK(written.has_value());
    const fs::path path(*written);
    CHECK(fs::exists(path));
    CHECK(path.parent_path().filename() == "nested");
    static const std::regex nameRe("Go_NoGo_v1_[0-9]{8}_[0-9]{6}\\.json");
    CHECK(std::regex_match(path.filename().string(), nameRe));

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    CHECK(content.str() == logio::serialize_log(log));

    fs::remove_all(dir, ec);
    return 0;
}

int main() {
    logger::init();
    logger::tlabel = "EventLogSelfTest";
    RUN_TEST(test_resolve_first_wins);
    RUN_TEST(test_outcome_table);
    RUN_TEST(test_end_written_once);
    RUN_TEST(test_abort_reason);
    RUN_TEST(test_metrics);
    RUN_TEST(test_metrics_pending_trials);
    RUN_TEST(test_metrics_empty_denominators);
    RUN_TEST(test_timelines_share_keys);
    RUN_TEST(test_full_log_document);
    RUN_TEST(test_persist);
    LOG_ALWAYS("all event log tests passed");
    return 0;
}
