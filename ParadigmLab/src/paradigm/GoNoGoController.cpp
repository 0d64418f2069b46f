#include "GoNoGoController.hpp"
#include <sstream>
#include <stdexcept>
#include <thread>
#include "../analysis/Metrics.hpp"
#include "../utils/Logger.hpp"

struct gonogo_transition {
    GoNoGoState_E from;
    GoNoGoEvent_E event;
    GoNoGoState_E to;
};

// Abort is not listed: it is accepted from every state before Results (see processEvent)
static const gonogo_transition gonogo_transition_table[] = {
    // from                          event                            to
    {GoNoGoState_Idle,           GoNoGoEvent_Start,           GoNoGoState_StartScreen},
    {GoNoGoState_StartScreen,    GoNoGoEvent_Timeout,         GoNoGoState_BlockRest},

    // first trial of a block goes straight to the stimulus (no ITI)
    {GoNoGoState_BlockRest,      GoNoGoEvent_Timeout,         GoNoGoState_TrialStimulus},
    {GoNoGoState_TrialITI,       GoNoGoEvent_Timeout,         GoNoGoState_TrialStimulus},
    {GoNoGoState_TrialStimulus,  GoNoGoEvent_TrialResolved,   GoNoGoState_TrialITI},
    {GoNoGoState_TrialStimulus,  GoNoGoEvent_BlockComplete,   GoNoGoState_BlockFinished},

    {GoNoGoState_BlockFinished,  GoNoGoEvent_NextBlock,       GoNoGoState_InterBlockRest},
    {GoNoGoState_BlockFinished,  GoNoGoEvent_LastBlock,       GoNoGoState_Results},
    {GoNoGoState_InterBlockRest, GoNoGoEvent_Timeout,         GoNoGoState_BlockRest},

    {GoNoGoState_Aborted,        GoNoGoEvent_Finalize,        GoNoGoState_Results},
    {GoNoGoState_Results,        GoNoGoEvent_Finalize,        GoNoGoState_Terminal},
};

static bool is_abortable(GoNoGoState_E s) {
    return s != GoNoGoState_Aborted && s != GoNoGoState_Results && s != GoNoGoState_Terminal;
}

static SW_Timer_C::dur_t to_timer_dur(double seconds) {
    return std::chrono::duration_cast<SW_Timer_C::dur_t>(seconds_d_T{ seconds });
}

GoNoGoController_C::GoNoGoController_C(GoNoGoConfig_S cfg, IStimulusSink_S& sink, StateStore_s* stateStoreRef,
                                       std::optional<paradigmlab::trials::TrialPlan_S> plan)
    : cfg_(std::move(cfg)), sink_(sink), stateStoreRef_(stateStoreRef), fixedPlan_(std::move(plan)), rng_(std::random_device{}()) {
}

void GoNoGoController_C::submit_response() {
    if (!acceptingInput_.load(std::memory_order_acquire)) {
        return;
    }
    // stamp now; whether it counts is decided on the controller thread
    TimestampPair_S ts = stopwatch_.timestamp_pair();
    std::lock_guard<std::mutex> lock(responseMtx_);
    pendingResponses_.push_back(ts);
}

void GoNoGoController_C::request_abort(AbortReason_E reason) {
    if (reason == AbortReason_None) {
        reason = AbortReason_ClientAbort;
    }
    AbortReason_E expected = AbortReason_None;
    abortReason_.compare_exchange_strong(expected, reason, std::memory_order_acq_rel);
    abortRequested_.store(true, std::memory_order_release);
}

std::vector<TimestampPair_S> GoNoGoController_C::drainResponses() {
    std::lock_guard<std::mutex> lock(responseMtx_);
    std::vector<TimestampPair_S> out;
    out.swap(pendingResponses_);
    return out;
}

void GoNoGoController_C::cancelAllTimers() {
    stateTimer_.cancel();
    stimulusTimer_.cancel();
    windowTimer_.cancel();
    interBlockCountdown_.cancel();
}

void GoNoGoController_C::publishState() {
    if (stateStoreRef_ == nullptr) return;
    stateStoreRef_->g_state.store(static_cast<int>(state_.load(std::memory_order_acquire)), std::memory_order_release);
    stateStoreRef_->g_block.store(blockIdx_ + 1, std::memory_order_release);
    stateStoreRef_->g_trial.store(trialIdx_ + 1, std::memory_order_release);
    stateStoreRef_->bump_seq();
}

void GoNoGoController_C::initLog() {
    log_ = ExperimentLog_S{};
    log_.paradigm = Paradigm_GoNoGo;
    log_.meta.paradigm_name = cfg_.paradigm_name;
    log_.meta.language = cfg_.language;
    log_.meta.test_mode = cfg_.test_mode;
    log_.meta.notes = cfg_.notes;
    log_.meta.created_at = stopwatch_.start_wall();

    // config snapshot + the plan actually run
    std::string cfgJson = paradigmlab::config::to_json(cfg_);
    std::ostringstream oss;
    oss << cfgJson.substr(0, cfgJson.size() - 1) << ",\"trial_schedule\":[";
    for (std::size_t b = 0; b < plan_.blocks.size(); ++b) {
        oss << "[";
        const auto& block = plan_.blocks[b];
        for (std::size_t i = 0; i < block.size(); ++i) {
            oss << "{\"digit\":" << block[i].digit << ",\"is_go\":" << (block[i].isGo ? "true" : "false") << "}";
            if (i + 1 < block.size()) oss << ",";
        }
        oss << "]";
        if (b + 1 < plan_.blocks.size()) oss << ",";
    }
    oss << "]}";
    log_.config_json = oss.str();
}

void GoNoGoController_C::resolveCurrentTrial(const std::optional<TimestampPair_S>& response) {
    TrialLogEntry_S& trial = currentBlock().trials.back();
    if (!log_.accepts_timing()) {
        LOG_DBG("GNG: run finished, trial " << trial.trial_index << " left as is");
        return;
    }
    if (!trial.resolve(response)) {
        // first-wins: a second resolution attempt is dropped, never recorded
        LOG_DBG("GNG: trial " << trial.trial_index << " already resolved");
        return;
    }
    LOG_DBG("GNG: block " << currentBlock().block_index << " trial " << trial.trial_index
            << " digit=" << trial.digit << " outcome=" << TrialOutcomeToString(trial.outcome)
            << " rt=" << trial.reaction_time_s);
}

std::optional<GoNoGoEvent_E> GoNoGoController_C::pollResponseWindow() {
    // digit hides on its own timer; the window may stay open past it
    if (stimulusVisible_ && stimulusTimer_.check_timer_expired()) {
        stimulusTimer_.stop_timer();
        stimulusVisible_ = false;
        sink_.clear_screen();
    }

    const double onsetRel = currentBlock().trials.back().onset.rel_s;
    bool resolved = false;
    for (const auto& r : drainResponses()) {
        if (r.rel_s < onsetRel) {
            continue; // pressed before this stimulus
        }
        if (r.rel_s > windowDeadlineRel_) {
            LOG_DBG("GNG: late response ignored (" << (r.rel_s - onsetRel) << "s after onset)");
            continue;
        }
        resolveCurrentTrial(r);
        resolved = true;
        break;
    }
    if (!resolved) {
        if (!windowTimer_.check_timer_expired()) {
            return std::nullopt;
        }
        resolveCurrentTrial(std::nullopt);
    }

    ++trialIdx_;
    const int nTrials = static_cast<int>(plan_.blocks[blockIdx_].size());
    return (trialIdx_ >= nTrials) ? GoNoGoEvent_BlockComplete : GoNoGoEvent_TrialResolved;
}

std::optional<GoNoGoEvent_E> GoNoGoController_C::detectEvent() {
    const GoNoGoState_E state = state_.load(std::memory_order_acquire);

    // (1) abort beats everything
    if (abortRequested_.load(std::memory_order_acquire) && is_abortable(state)) {
        return GoNoGoEvent_Abort;
    }

    switch (state) {
        case GoNoGoState_StartScreen:
        case GoNoGoState_BlockRest:
        case GoNoGoState_TrialITI:
            // nothing to score outside a response window
            (void)drainResponses();
            if (stateTimer_.check_timer_expired()) {
                return GoNoGoEvent_Timeout;
            }
            break;

        case GoNoGoState_TrialStimulus:
            return pollResponseWindow();

        case GoNoGoState_BlockFinished:
            return (blockIdx_ + 1 >= static_cast<int>(plan_.blocks.size())) ? GoNoGoEvent_LastBlock : GoNoGoEvent_NextBlock;

        case GoNoGoState_InterBlockRest:
            (void)drainResponses();
            interBlockCountdown_.poll();
            if (interBlockDone_) {
                return GoNoGoEvent_Timeout;
            }
            break;

        case GoNoGoState_Aborted:
        case GoNoGoState_Results:
            return GoNoGoEvent_Finalize;

        default:
            break;
    }
    return std::nullopt;
}

void GoNoGoController_C::processEvent(GoNoGoEvent_E ev) {
    const GoNoGoState_E state = state_.load(std::memory_order_acquire);
    if (ev == GoNoGoEvent_Abort) {
        if (is_abortable(state)) {
            onStateExit(state, ev);
            prevState_ = state;
            state_.store(GoNoGoState_Aborted, std::memory_order_release);
            onStateEnter(prevState_, GoNoGoState_Aborted);
        }
        return;
    }

    for (const auto& t : gonogo_transition_table) {
        if (state == t.from && ev == t.event) {
            // match found
            onStateExit(state, ev);
            prevState_ = state;
            state_.store(t.to, std::memory_order_release);
            onStateEnter(prevState_, t.to);
            return;
        }
    }
    LOG_DBG("GNG: no transition for event " << static_cast<int>(ev) << " in " << GoNoGoStateToString(state));
}

void GoNoGoController_C::onStateExit(GoNoGoState_E state, GoNoGoEvent_E ev) {
    (void)ev;
    switch (state) {
        case GoNoGoState_StartScreen:
        case GoNoGoState_BlockRest:
        case GoNoGoState_TrialITI:
            stateTimer_.cancel();
            break;

        case GoNoGoState_TrialStimulus:
            // whichever path resolved the trial, both timers die here
            stimulusTimer_.cancel();
            windowTimer_.cancel();
            if (stimulusVisible_) {
                stimulusVisible_ = false;
                sink_.clear_screen();
            }
            break;

        case GoNoGoState_InterBlockRest:
            interBlockCountdown_.cancel();
            sink_.show_countdown("", -1);
            break;

        default:
            break;
    }
}

void GoNoGoController_C::onStateEnter(GoNoGoState_E prevState, GoNoGoState_E newState) {
    switch (newState) {
        case GoNoGoState_StartScreen: {
            sink_.set_instruction_text("Start");
            stateTimer_.start_timer(GONOGO_START_SCREEN_DUR);
            break;
        }

        case GoNoGoState_BlockRest: {
            GoNoGoBlockRecord_S rec;
            rec.block_index = blockIdx_ + 1;
            rec.block_start = stopwatch_.timestamp_pair();
            sink_.clear_screen();
            rec.rest_start = stopwatch_.timestamp_pair();
            log_.gonogo_blocks.push_back(std::move(rec));
            trialIdx_ = 0;
            stateTimer_.start_timer(to_timer_dur(cfg_.rest_duration_s));
            LOG_ALWAYS("GNG: block " << (blockIdx_ + 1) << "/" << plan_.blocks.size() << " rest started");
            break;
        }

        case GoNoGoState_TrialITI: {
            sink_.clear_screen();
            stateTimer_.start_timer(to_timer_dur(cfg_.inter_trial_interval_s));
            break;
        }

        case GoNoGoState_TrialStimulus: {
            if (prevState == GoNoGoState_BlockRest) {
                currentBlock().task_start = stopwatch_.timestamp_pair();
            }
            const TrialSpec_S& spec = plan_.blocks[blockIdx_][trialIdx_];
            TrialLogEntry_S entry;
            entry.trial_index = trialIdx_ + 1;
            entry.digit = spec.digit;
            entry.is_go = spec.isGo;
            entry.onset = stopwatch_.timestamp_pair();
            windowDeadlineRel_ = entry.onset.rel_s + cfg_.max_response_window_s;

            // both timers share the onset instant
            const auto origin = stopwatch_.start_mono() +
                std::chrono::duration_cast<clock_T::duration>(seconds_d_T{ entry.onset.rel_s });
            currentBlock().trials.push_back(entry);
            stimulusTimer_.start_timer_at(origin, to_timer_dur(cfg_.stimulus_duration_s));
            windowTimer_.start_timer_at(origin, to_timer_dur(cfg_.max_response_window_s));
            stimulusVisible_ = true;
            // onset is stamped first so a response can never precede it
            sink_.show_digit(spec.digit);
            sink_.play_notification(Notification_HighBeep);
            break;
        }

        case GoNoGoState_BlockFinished: {
            LOG_ALWAYS("GNG: block " << currentBlock().block_index << " finished ("
                       << currentBlock().trials.size() << " trials)");
            break;
        }

        case GoNoGoState_InterBlockRest: {
            const int blockNum = blockIdx_ + 1;
            const double total = cfg_.post_block_rest_duration_s + cfg_.inter_block_interval_s;
            currentBlock().post_rest_start = stopwatch_.timestamp_pair();

            InterBlockInterval_S ibi;
            ibi.after_block = blockNum;
            ibi.start = stopwatch_.timestamp_pair();
            ibi.planned_duration_s = total;
            log_.inter_block_intervals.push_back(ibi);

            ++blockIdx_;
            interBlockDone_ = false;
            std::ostringstream msg;
            msg << "Block " << blockNum << " finished.\nPlease rest.";
            const std::string restMsg = msg.str();

            CountdownCallbacks_S cb;
            cb.on_tick = [this, restMsg](long long ms) { sink_.show_countdown(restMsg, ms); };
            cb.on_finished = [this]() { interBlockDone_ = true; };
            cb.should_abort = [this]() { return abortRequested_.load(std::memory_order_acquire); };
            interBlockCountdown_.start(total, std::move(cb));
            break;
        }

        case GoNoGoState_Aborted: {
            cancelAllTimers();
            acceptingInput_.store(false, std::memory_order_release);
            const TimestampPair_S ts = stopwatch_.timestamp_pair();
            log_.mark_aborted(abortReason_.load(std::memory_order_acquire), ts);
            sink_.clear_screen();
            sink_.play_notification(Notification_EndSequence);
            if (stateStoreRef_) {
                stateStoreRef_->g_aborted.store(true, std::memory_order_release);
            }
            LOG_ALWAYS("GNG: aborted (" << log_.status.reason() << ") at " << ts.rel_s << "s");
            break;
        }

        case GoNoGoState_Results: {
            acceptingInput_.store(false, std::memory_order_release);
            if (!log_.status.aborted()) {
                log_.mark_completed(stopwatch_.timestamp_pair());
                sink_.play_notification(Notification_EndSequence);
                if (stateStoreRef_) {
                    stateStoreRef_->g_completed.store(true, std::memory_order_release);
                }
            }
            // computed on the aborted path too, over whatever trials exist
            log_.metrics = paradigmlab::analysis::compute_go_nogo_metrics(log_);
            sink_.set_instruction_text(log_.status.completed() ? "Completed" : "Aborted");
            LOG_ALWAYS("GNG: results, " << log_.trial_count() << " trials, status=" << log_.status.reason());
            break;
        }

        case GoNoGoState_Terminal:
            LOG_DBG("GNG: terminal");
            break;

        default:
            break;
    }
    publishState();
}

ExperimentLog_S GoNoGoController_C::run() {
    logger::tlabel = "GoNoGo";

    // everything that can fail does so before the run starts
    paradigmlab::config::validate(cfg_);
    if (fixedPlan_) {
        plan_ = *fixedPlan_;
        if (plan_.blocks.empty()) {
            throw InvalidConfig_C("trial plan has no blocks");
        }
        for (const auto& block : plan_.blocks) {
            if (block.empty()) {
                throw InvalidConfig_C("trial plan has an empty block");
            }
        }
    } else {
        plan_ = paradigmlab::trials::build_trial_plan(cfg_, rng_);
    }
    if (state_.load(std::memory_order_acquire) != GoNoGoState_Idle) {
        throw std::runtime_error("GoNoGo: controller already used; create a new one per run");
    }
    if (!runGuard_.try_acquire()) {
        throw std::runtime_error("GoNoGo: another paradigm run is already active");
    }

    try {
        stopwatch_.start();
        initLog();
        log_.mark_running(stopwatch_.timestamp_pair());
        if (stateStoreRef_) {
            stateStoreRef_->reset_for_run(Paradigm_GoNoGo);
        }
        acceptingInput_.store(true, std::memory_order_release);
        sink_.play_notification(Notification_StartSequence);
        LOG_ALWAYS("GNG: run started, " << plan_.blocks.size() << " blocks, go ratio=" << plan_.go_ratio);

        processEvent(GoNoGoEvent_Start);
        while (state_.load(std::memory_order_acquire) != GoNoGoState_Terminal) {
            std::optional<GoNoGoEvent_E> ev = detectEvent();
            if (ev.has_value()) {
                processEvent(ev.value());
                continue; // chained transitions (abort -> results -> terminal) don't wait a poll
            }
            std::this_thread::sleep_for(CONTROLLER_POLL_INTERVAL);
        }
    } catch (const std::exception& e) {
        LOG_ERR("GNG: run failed: " << e.what());
        acceptingInput_.store(false, std::memory_order_release);
        runGuard_.release();
        throw;
    }

    acceptingInput_.store(false, std::memory_order_release);
    runGuard_.release();
    return log_;
}
