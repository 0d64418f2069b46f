/*
==============================================================================
	File: ExperimentLog.hpp
	Desc: Dual-clock event log owned by a paradigm controller during a run.
	* every timestamp is a TimestampPair_S taken from the run's Stopwatch_C
	* LogWriter projects it into timing_absolute / timing_relative (same keys)
	* once completed or aborted, only the single experiment_end write happens
	* handed off by value when the run ends
==============================================================================
*/
#pragma once
#include <array>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "../utils/Types.h"
#include "../utils/Stopwatch.hpp"

// One Go/No-Go trial. Created at stimulus onset, resolved exactly once.
struct TrialLogEntry_S {
	int trial_index = 0;   // 1-based within its block
	int digit = 0;
	bool is_go = false;
	TimestampPair_S onset{};
	std::optional<TimestampPair_S> response;
	std::optional<std::string> response_key;  // "space" when pressed
	TrialOutcome_E outcome = TrialOutcome_Pending;
	double reaction_time_s = std::numeric_limits<double>::quiet_NaN();

	bool is_resolved() const { return outcome != TrialOutcome_Pending; }

	// First call wins; later calls are ignored and return false.
	// response == nullopt is the window-expired branch.
	bool resolve(const std::optional<TimestampPair_S>& responseTs, const char* key = "space");
};

struct InterBlockInterval_S {
	int after_block = 0;        // block index the interval follows
	TimestampPair_S start{};
	double planned_duration_s = 0.0;
};

struct GoNoGoBlockRecord_S {
	int block_index = 0;        // 1-based
	TimestampPair_S block_start{};
	std::optional<TimestampPair_S> rest_start;
	std::optional<TimestampPair_S> task_start;
	std::optional<TimestampPair_S> post_rest_start;
	std::vector<TrialLogEntry_S> trials;
};

struct PhaseRecord_S {
	RhythmPhase_E phase = RhythmPhase_RestPre;
	double planned_duration_s = 0.0;
	std::optional<TimestampPair_S> start;
	std::vector<TimestampPair_S> cue_events; // only the cued phase fills this
};

struct RhythmBlockRecord_S {
	int block_index = 0;        // 0-based
	TimestampPair_S block_start{};
	std::array<PhaseRecord_S, NUM_RHYTHM_PHASES> phases{};
	std::optional<InterBlockInterval_S> interval_after_block;
};

struct ExperimentStatus_S {
	RunStatus_E state = RunStatus_NotStarted;
	AbortReason_E abort_reason = AbortReason_None;
	std::optional<TimestampPair_S> abort_time;

	bool completed() const { return state == RunStatus_Completed; }
	bool aborted() const { return state == RunStatus_Aborted; }
	bool finished() const { return completed() || aborted(); }

	// not_started | running | normal_end | user_abort | signal_interrupt | client_abort
	std::string reason() const;
};

struct GoNoGoMetrics_S {
	std::optional<double> go_hit_percent;
	std::optional<double> nogo_commission_percent;
	std::optional<double> mean_rt_go_hit;
	std::optional<double> mean_rt_nogo_commission;
};

struct ExperimentMeta_S {
	std::string paradigm_name;
	std::string software_version = SOFTWARE_VERSION;
	std::string author = SOFTWARE_AUTHOR;
	std::string language = "en";
	bool test_mode = false;
	wall_time_point_T created_at{};
	std::string notes;

	// first / second non-empty line of notes
	std::string patient_info() const;
	std::string electrode_info() const;
};

struct ExperimentLog_S {
	Paradigm_E paradigm = Paradigm_None;
	ExperimentMeta_S meta;
	std::string config_json = "{}";   // snapshot, already serialized

	std::optional<TimestampPair_S> experiment_start;
	std::optional<TimestampPair_S> experiment_end;

	// Go/No-Go
	std::vector<GoNoGoBlockRecord_S> gonogo_blocks;
	std::vector<InterBlockInterval_S> inter_block_intervals;
	// Rhythm
	std::vector<RhythmBlockRecord_S> rhythm_blocks;

	ExperimentStatus_S status;
	std::optional<GoNoGoMetrics_S> metrics;

	// timing_* may only be mutated while running
	bool accepts_timing() const { return status.state == RunStatus_Running; }

	void mark_running(const TimestampPair_S& start);
	// Both return false (and change nothing) if the run already finished.
	// Each writes experiment_end, so it is written exactly once.
	bool mark_completed(const TimestampPair_S& end);
	bool mark_aborted(AbortReason_E reason, const TimestampPair_S& when);

	// Latest rel_s recorded anywhere except experiment_end.
	double latest_recorded_rel_s() const;

	std::size_t trial_count() const;
};
