/*
GO/NO-GO CONTROLLER : writer
- owns one discrete-trial run: builds the trial plan, drives the STATE MACHINE
  (start screen -> per block: rest, trials (ITI -> stimulus/response window), post-block countdown -> results)
- polls every ~1ms: detectEvent() turns timers/input/abort into events, processEvent() walks the transition table
- the only writer of the ExperimentLog_S; hands it back by value from run()
- other threads may call submit_response() / request_abort() at any time
*/

#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <random>
#include <vector>
#include "../utils/Types.h"
#include "../utils/SWTimer.hpp"
#include "../utils/Stopwatch.hpp"
#include "../utils/Countdown.hpp"
#include "../config/ParadigmConfig.hpp"
#include "../trial/TrialScheduler.hpp"
#include "../log/ExperimentLog.hpp"
#include "../stimulus/StimulusSink.hpp"
#include "../shared/StateStore.hpp"
#include "RunGuard.hpp"

enum GoNoGoEvent_E {
	GoNoGoEvent_Start,
	GoNoGoEvent_Timeout,          // start screen / rest / ITI / inter-block countdown done
	GoNoGoEvent_TrialResolved,    // response accepted or window expired, trials remain
	GoNoGoEvent_BlockComplete,    // ... and that was the block's last trial
	GoNoGoEvent_NextBlock,
	GoNoGoEvent_LastBlock,
	GoNoGoEvent_Abort,
	GoNoGoEvent_Finalize,
};

class GoNoGoController_C {
public:
	// plan: fixed trial plan (tests); generated from cfg when omitted
	GoNoGoController_C(GoNoGoConfig_S cfg, IStimulusSink_S& sink, StateStore_s* stateStoreRef = nullptr,
	                   std::optional<paradigmlab::trials::TrialPlan_S> plan = std::nullopt);
	GoNoGoController_C(const GoNoGoController_C&) = delete;
	GoNoGoController_C& operator=(const GoNoGoController_C&) = delete;

	// Runs on the calling thread until Terminal. Throws InvalidConfig_C (bad config)
	// or std::runtime_error (another run active) before anything starts.
	ExperimentLog_S run();

	// Thread-safe. Timestamped here, scored by the controller thread.
	void submit_response();
	// Thread-safe, monotonic: the first reason sticks.
	void request_abort(AbortReason_E reason = AbortReason_UserAbort);

	GoNoGoState_E getState() const { return state_.load(std::memory_order_acquire); }
	bool is_abort_requested() const { return abortRequested_.load(std::memory_order_acquire); }

private:
	GoNoGoConfig_S cfg_;
	IStimulusSink_S& sink_;
	StateStore_s* stateStoreRef_;
	std::optional<paradigmlab::trials::TrialPlan_S> fixedPlan_;
	paradigmlab::trials::TrialPlan_S plan_;
	std::mt19937 rng_;
	RunGuard_C runGuard_;

	std::atomic<GoNoGoState_E> state_{ GoNoGoState_Idle };
	GoNoGoState_E prevState_ = GoNoGoState_Idle;

	Stopwatch_C stopwatch_;
	ExperimentLog_S log_;

	// timers (polled, never fire on their own)
	SW_Timer_C stateTimer_;      // start screen, block rest, ITI
	SW_Timer_C stimulusTimer_;   // digit visible
	SW_Timer_C windowTimer_;     // response window; the only one that decides an outcome
	Countdown_C interBlockCountdown_;
	bool interBlockDone_ = false;

	int blockIdx_ = 0;           // 0-based into plan_.blocks
	int trialIdx_ = 0;           // 0-based within the block
	double windowDeadlineRel_ = 0.0;
	bool stimulusVisible_ = false;

	// input from other threads
	std::atomic<bool> acceptingInput_{ false };
	std::atomic<bool> abortRequested_{ false };
	std::atomic<AbortReason_E> abortReason_{ AbortReason_None };
	std::mutex responseMtx_;
	std::vector<TimestampPair_S> pendingResponses_;

	std::optional<GoNoGoEvent_E> detectEvent();
	std::optional<GoNoGoEvent_E> pollResponseWindow();
	void processEvent(GoNoGoEvent_E ev);
	void onStateEnter(GoNoGoState_E prevState, GoNoGoState_E newState);
	void onStateExit(GoNoGoState_E state, GoNoGoEvent_E ev);

	GoNoGoBlockRecord_S& currentBlock() { return log_.gonogo_blocks.back(); }
	void resolveCurrentTrial(const std::optional<TimestampPair_S>& response);
	std::vector<TimestampPair_S> drainResponses();
	void cancelAllTimers();
	void publishState();
	void initLog();
};
