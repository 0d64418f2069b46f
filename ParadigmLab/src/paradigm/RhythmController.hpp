/*
RHYTHM CONTROLLER : writer
- owns one periodic-cue run: start screen -> blocks of five fixed phases -> inter-block countdown -> end screen
- runs as plain sleep-poll loops on the calling thread (1ms while a cue train is live, 10ms otherwise)
  and checks the abort flag at every poll
- cue trains are scheduled on an accumulating next-cue time (PeriodicSchedule_C), never elapsed/period
- side effects go to the sink (CueDispatcher_C in the app) and never block the loop
*/

#pragma once
#include <atomic>
#include <string>
#include "../utils/Types.h"
#include "../utils/Stopwatch.hpp"
#include "../config/ParadigmConfig.hpp"
#include "../log/ExperimentLog.hpp"
#include "../stimulus/StimulusSink.hpp"
#include "../shared/StateStore.hpp"
#include "RunGuard.hpp"

class RhythmController_C {
public:
	RhythmController_C(RhythmConfig_S cfg, IStimulusSink_S& sink, StateStore_s* stateStoreRef = nullptr);
	RhythmController_C(const RhythmController_C&) = delete;
	RhythmController_C& operator=(const RhythmController_C&) = delete;

	// Runs to Terminal on the calling thread. Throws InvalidConfig_C or
	// std::runtime_error (another run active) before anything starts.
	ExperimentLog_S run();

	// Thread-safe, monotonic: the first reason sticks.
	void request_abort(AbortReason_E reason = AbortReason_UserAbort);

	RhythmState_E getState() const { return state_.load(std::memory_order_acquire); }
	RhythmPhase_E getPhase() const { return phase_.load(std::memory_order_acquire); }
	bool is_abort_requested() const { return abortRequested_.load(std::memory_order_acquire); }

	// instruction shown during each phase
	static const char* phase_instruction(RhythmPhase_E phase);

private:
	RhythmConfig_S cfg_;
	IStimulusSink_S& sink_;
	StateStore_s* stateStoreRef_;
	RunGuard_C runGuard_;

	std::atomic<RhythmState_E> state_{ RhythmState_Idle };
	std::atomic<RhythmPhase_E> phase_{ RhythmPhase_RestPre };
	std::atomic<bool> abortRequested_{ false };
	std::atomic<AbortReason_E> abortReason_{ AbortReason_None };

	Stopwatch_C stopwatch_;
	ExperimentLog_S log_;

	bool runBlock(int blockIdx);
	bool runPhase(RhythmBlockRecord_S& block, RhythmPhase_E phase);
	bool runCueTrain(PhaseRecord_S& phase, double duration_s);
	bool waitWithAbort(double duration_s);
	bool waitWithCountdown(double duration_s, const std::string& message);
	void triggerCue(PhaseRecord_S& phase);

	void setState(RhythmState_E state, int blockIdx = -1);
	void finalizeAbort();
	void initLog();
};
