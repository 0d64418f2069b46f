#include "ExperimentLog.hpp"
#include <algorithm>
#include <sstream>

bool TrialLogEntry_S::resolve(const std::optional<TimestampPair_S>& responseTs, const char* key) {
	if (is_resolved()) {
		return false;
	}
	const bool responded = responseTs.has_value();
	if (responded) {
		response = responseTs;
		response_key = std::string(key);
		reaction_time_s = responseTs->rel_s - onset.rel_s;
	}
	outcome = classify_outcome(is_go, responded);
	return true;
}

std::string ExperimentStatus_S::reason() const {
	switch (state) {
		case RunStatus_Running:
			return "running";
		case RunStatus_Completed:
			return "normal_end";
		case RunStatus_Aborted:
			return AbortReasonToString(abort_reason);
		case RunStatus_NotStarted:
		default:
			return "not_started";
	}
}

static std::vector<std::string> non_empty_lines(const std::string& text) {
	std::vector<std::string> lines;
	std::istringstream iss(text);
	std::string line;
	while (std::getline(iss, line)) {
		// trim
		auto first = line.find_first_not_of(" \t\r");
		if (first == std::string::npos) continue;
		auto last = line.find_last_not_of(" \t\r");
		lines.push_back(line.substr(first, last - first + 1));
	}
	return lines;
}

std::string ExperimentMeta_S::patient_info() const {
	auto lines = non_empty_lines(notes);
	return lines.empty() ? "" : lines[0];
}

std::string ExperimentMeta_S::electrode_info() const {
	auto lines = non_empty_lines(notes);
	return lines.size() < 2 ? "" : lines[1];
}

void ExperimentLog_S::mark_running(const TimestampPair_S& start) {
	experiment_start = start;
	status.state = RunStatus_Running;
}

bool ExperimentLog_S::mark_completed(const TimestampPair_S& end) {
	if (status.finished() || experiment_end.has_value()) {
		return false;
	}
	status.state = RunStatus_Completed;
	experiment_end = end;
	return true;
}

bool ExperimentLog_S::mark_aborted(AbortReason_E reason, const TimestampPair_S& when) {
	if (status.finished() || experiment_end.has_value()) {
		return false;
	}
	status.state = RunStatus_Aborted;
	status.abort_reason = (reason == AbortReason_None) ? AbortReason_ClientAbort : reason;
	status.abort_time = when;
	experiment_end = when;
	return true;
}

double ExperimentLog_S::latest_recorded_rel_s() const {
	double latest = experiment_start ? experiment_start->rel_s : 0.0;
	auto bump = [&latest](const std::optional<TimestampPair_S>& ts) {
		if (ts) latest = std::max(latest, ts->rel_s);
	};

	for (const auto& block : gonogo_blocks) {
		latest = std::max(latest, block.block_start.rel_s);
		bump(block.rest_start);
		bump(block.task_start);
		bump(block.post_rest_start);
		for (const auto& trial : block.trials) {
			latest = std::max(latest, trial.onset.rel_s);
			bump(trial.response);
		}
	}
	for (const auto& ibi : inter_block_intervals) {
		latest = std::max(latest, ibi.start.rel_s);
	}
	for (const auto& block : rhythm_blocks) {
		latest = std::max(latest, block.block_start.rel_s);
		for (const auto& phase : block.phases) {
			bump(phase.start);
			for (const auto& cue : phase.cue_events) {
				latest = std::max(latest, cue.rel_s);
			}
		}
		if (block.interval_after_block) {
			latest = std::max(latest, block.interval_after_block->start.rel_s);
		}
	}
	bump(status.abort_time);
	return latest;
}

std::size_t ExperimentLog_S::trial_count() const {
	std::size_t n = 0;
	for (const auto& block : gonogo_blocks) {
		n += block.trials.size();
	}
	return n;
}
