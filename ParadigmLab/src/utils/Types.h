/*
==============================================================================
	File: Types.h
	Desc: Common type definitions between modules.
	This header is used by:
  - Paradigm controllers (Go/No-Go, Rhythm): state enums, timing constants.
  - Event log + writer: outcome/status enums and their string forms.
  - HTTP server: state/event enums published to the presentation client.

==============================================================================
*/

#pragma once
#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <chrono>

// _T for type
// Use steady clock for time measurements (monotonic, not affected by system clock changes)
using clock_T = std::chrono::steady_clock;
using wall_clock_T = std::chrono::system_clock;
using ms_T = std::chrono::milliseconds;
using time_point_T = std::chrono::time_point<clock_T>;
using wall_time_point_T = std::chrono::time_point<wall_clock_T>;
using seconds_d_T = std::chrono::duration<double>;

/* START CONFIGS */

inline constexpr const char* SOFTWARE_VERSION = "v1.0.0";
inline constexpr const char* SOFTWARE_AUTHOR = "mojack";

// digits 0..9 are the only stimuli
inline constexpr std::size_t NUM_DIGITS = 10;

// countdown tick intervals
inline constexpr ms_T COOP_COUNTDOWN_INTERVAL{ 50 };   // host-loop driven
inline constexpr ms_T BLOCKING_COUNTDOWN_STEP{ 10 };   // sleep-poll variant

// poll granularity of the paradigm loops (must stay <= 10ms so abort is responsive)
inline constexpr ms_T CONTROLLER_POLL_INTERVAL{ 1 };
inline constexpr ms_T CUE_TRAIN_POLL_INTERVAL{ 1 };
inline constexpr ms_T PLAIN_WAIT_POLL_INTERVAL{ 10 };

// fixed screens
inline constexpr ms_T GONOGO_START_SCREEN_DUR{ 1000 };
inline constexpr ms_T RHYTHM_START_SCREEN_DUR{ 800 };
inline constexpr ms_T RHYTHM_END_SCREEN_DUR{ 800 };

// cue side-effect queue depth before we start dropping
inline constexpr std::size_t CUE_QUEUE_CAPACITY = 64;

/* END CONFIGS */

/* START ENUMS */

enum Paradigm_E {
	Paradigm_None,
	Paradigm_GoNoGo,
	Paradigm_Rhythm,
};

enum GoNoGoState_E {
	GoNoGoState_Idle,
	GoNoGoState_StartScreen,
	GoNoGoState_BlockRest,
	GoNoGoState_TrialITI,        // blank screen between trials
	GoNoGoState_TrialStimulus,   // response window open (digit may already be hidden)
	GoNoGoState_BlockFinished,
	GoNoGoState_InterBlockRest,  // post-block rest + inter-block interval countdown
	GoNoGoState_Results,
	GoNoGoState_Terminal,
	GoNoGoState_Aborted,
};

enum RhythmState_E {
	RhythmState_Idle,
	RhythmState_StartScreen,
	RhythmState_Block,
	RhythmState_InterBlockRest,
	RhythmState_EndScreen,
	RhythmState_Terminal,
	RhythmState_Aborted,
};

enum RhythmPhase_E {
	RhythmPhase_RestPre,
	RhythmPhase_CuedMovement,
	RhythmPhase_RestInstruction,
	RhythmPhase_InternalMovement,
	RhythmPhase_RestPost,
	RhythmPhase_Count,
};

inline constexpr std::size_t NUM_RHYTHM_PHASES = static_cast<std::size_t>(RhythmPhase_Count);

enum TrialOutcome_E {
	TrialOutcome_Pending,
	TrialOutcome_Hit,
	TrialOutcome_Miss,
	TrialOutcome_CommissionError,
	TrialOutcome_CorrectWithholding,
};

enum RunStatus_E {
	RunStatus_NotStarted,
	RunStatus_Running,
	RunStatus_Completed,
	RunStatus_Aborted,
};

enum AbortReason_E {
	AbortReason_None,
	AbortReason_UserAbort,        // operator pressed abort on the presentation client
	AbortReason_SignalInterrupt,  // ctrl+c on the host
	AbortReason_ClientAbort,      // programmatic abort (tests, shutdown)
};

enum CueType_E {
	CueType_Audio,
	CueType_Visual,
};

enum Notification_E {
	Notification_StartSequence,
	Notification_EndSequence,
	Notification_HighBeep,
	Notification_LowBeep,
};

// events the presentation client can POST
enum UIEvent_E {
	UIEvent_None,
	UIEvent_Respond,
	UIEvent_Abort,
};

/* END ENUMS */

/* START HELPERS */

inline TrialOutcome_E classify_outcome(bool isGo, bool responded) {
	if (isGo) {
		return responded ? TrialOutcome_Hit : TrialOutcome_Miss;
	}
	return responded ? TrialOutcome_CommissionError : TrialOutcome_CorrectWithholding;
}

inline const char* TrialOutcomeToString(TrialOutcome_E outcome) {
	switch (outcome) {
		case TrialOutcome_Hit:
			return "hit";
		case TrialOutcome_Miss:
			return "miss";
		case TrialOutcome_CommissionError:
			return "commission_error";
		case TrialOutcome_CorrectWithholding:
			return "correct_withholding";
		case TrialOutcome_Pending:
		default:
			return "pending";
	}
}

inline const char* RunStatusToString(RunStatus_E status) {
	switch (status) {
		case RunStatus_Running:
			return "running";
		case RunStatus_Completed:
			return "completed";
		case RunStatus_Aborted:
			return "aborted";
		case RunStatus_NotStarted:
		default:
			return "not_started";
	}
}

inline const char* AbortReasonToString(AbortReason_E reason) {
	switch (reason) {
		case AbortReason_UserAbort:
			return "user_abort";
		case AbortReason_SignalInterrupt:
			return "signal_interrupt";
		case AbortReason_ClientAbort:
			return "client_abort";
		case AbortReason_None:
		default:
			return "none";
	}
}

// keys used in config files and in the timeline log
inline const char* RhythmPhaseToKey(RhythmPhase_E phase) {
	switch (phase) {
		case RhythmPhase_RestPre:
			return "rest_pre";
		case RhythmPhase_CuedMovement:
			return "cued_movement";
		case RhythmPhase_RestInstruction:
			return "rest_instruction";
		case RhythmPhase_InternalMovement:
			return "internal_movement";
		case RhythmPhase_RestPost:
			return "rest_post";
		default:
			return "unknown";
	}
}

inline const char* NotificationToString(Notification_E kind) {
	switch (kind) {
		case Notification_StartSequence:
			return "start_sequence";
		case Notification_EndSequence:
			return "end_sequence";
		case Notification_HighBeep:
			return "high_beep";
		case Notification_LowBeep:
		default:
			return "low_beep";
	}
}

inline const char* GoNoGoStateToString(GoNoGoState_E state) {
	switch (state) {
		case GoNoGoState_Idle: return "idle";
		case GoNoGoState_StartScreen: return "start_screen";
		case GoNoGoState_BlockRest: return "block_rest";
		case GoNoGoState_TrialITI: return "trial_iti";
		case GoNoGoState_TrialStimulus: return "trial_stimulus";
		case GoNoGoState_BlockFinished: return "block_finished";
		case GoNoGoState_InterBlockRest: return "inter_block_rest";
		case GoNoGoState_Results: return "results";
		case GoNoGoState_Terminal: return "terminal";
		case GoNoGoState_Aborted: return "aborted";
		default: return "unknown";
	}
}

inline const char* RhythmStateToString(RhythmState_E state) {
	switch (state) {
		case RhythmState_Idle: return "idle";
		case RhythmState_StartScreen: return "start_screen";
		case RhythmState_Block: return "block";
		case RhythmState_InterBlockRest: return "inter_block_rest";
		case RhythmState_EndScreen: return "end_screen";
		case RhythmState_Terminal: return "terminal";
		case RhythmState_Aborted: return "aborted";
		default: return "unknown";
	}
}

/* END HELPERS */

/* START STRUCTS */

// one planned trial; immutable once generated
struct TrialSpec_S {
	int digit = 0;       // 0..9
	bool isGo = false;
};

/* END STRUCTS */
