#include "LogWriter.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include "../utils/JsonUtils.hpp"
#include "../utils/Logger.hpp"
#include "../utils/SessionPaths.hpp"

namespace paradigmlab {
namespace logio {

namespace {

void write_number(std::ostringstream& oss, double v) {
	if (!std::isfinite(v)) {
		oss << "null";
		return;
	}
	oss << std::fixed << std::setprecision(6) << v;
	oss.unsetf(std::ios_base::floatfield);
}

void write_ts(std::ostringstream& oss, const TimestampPair_S& ts, Timeline_E timeline) {
	if (timeline == Timeline_Absolute) {
		oss << JSON::json_quote(format_wall_time(ts.wall));
	} else {
		write_number(oss, ts.rel_s);
	}
}

void write_opt_ts(std::ostringstream& oss, const std::optional<TimestampPair_S>& ts, Timeline_E timeline) {
	if (ts) {
		write_ts(oss, *ts, timeline);
	} else {
		oss << "null";
	}
}

void write_opt_number(std::ostringstream& oss, const std::optional<double>& v) {
	if (v) {
		write_number(oss, *v);
	} else {
		oss << "null";
	}
}

void write_trial(std::ostringstream& oss, const TrialLogEntry_S& t, Timeline_E timeline) {
	oss << "{"
	    << "\"trial_index\":" << t.trial_index << ","
	    << "\"digit\":" << t.digit << ","
	    << "\"is_go_trial\":" << (t.is_go ? "true" : "false") << ","
	    << "\"onset\":";
	write_ts(oss, t.onset, timeline);
	oss << ",\"response\":";
	write_opt_ts(oss, t.response, timeline);
	oss << ",\"response_key\":";
	if (t.response_key) {
		oss << JSON::json_quote(*t.response_key);
	} else {
		oss << "null";
	}
	oss << ",\"outcome\":\"" << TrialOutcomeToString(t.outcome) << "\""
	    << ",\"reaction_time_s\":";
	write_number(oss, t.reaction_time_s);
	oss << "}";
}

void write_interval(std::ostringstream& oss, const InterBlockInterval_S& ibi, Timeline_E timeline) {
	oss << "{\"after_block\":" << ibi.after_block << ",\"interval_start\":";
	write_ts(oss, ibi.start, timeline);
	oss << ",\"planned_duration_s\":";
	write_number(oss, ibi.planned_duration_s);
	oss << "}";
}

void write_gonogo_blocks(std::ostringstream& oss, const ExperimentLog_S& log, Timeline_E timeline) {
	oss << "\"blocks\":[";
	for (std::size_t b = 0; b < log.gonogo_blocks.size(); ++b) {
		const auto& block = log.gonogo_blocks[b];
		oss << "{\"block_index\":" << block.block_index << ",\"block_start\":";
		write_ts(oss, block.block_start, timeline);
		oss << ",\"rest_start\":";
		write_opt_ts(oss, block.rest_start, timeline);
		oss << ",\"task_start\":";
		write_opt_ts(oss, block.task_start, timeline);
		oss << ",\"post_rest_start\":";
		write_opt_ts(oss, block.post_rest_start, timeline);
		oss << ",\"trials\":[";
		for (std::size_t i = 0; i < block.trials.size(); ++i) {
			write_trial(oss, block.trials[i], timeline);
			if (i + 1 < block.trials.size()) oss << ",";
		}
		oss << "]}";
		if (b + 1 < log.gonogo_blocks.size()) oss << ",";
	}
	oss << "],\"inter_block_intervals\":[";
	for (std::size_t i = 0; i < log.inter_block_intervals.size(); ++i) {
		write_interval(oss, log.inter_block_intervals[i], timeline);
		if (i + 1 < log.inter_block_intervals.size()) oss << ",";
	}
	oss << "]";
}

void write_rhythm_blocks(std::ostringstream& oss, const ExperimentLog_S& log, Timeline_E timeline) {
	oss << "\"blocks\":[";
	for (std::size_t b = 0; b < log.rhythm_blocks.size(); ++b) {
		const auto& block = log.rhythm_blocks[b];
		oss << "{\"block_index\":" << block.block_index << ",\"block_start\":";
		write_ts(oss, block.block_start, timeline);
		oss << ",\"phases\":{";
		for (std::size_t p = 0; p < block.phases.size(); ++p) {
			const auto& phase = block.phases[p];
			oss << "\"" << RhythmPhaseToKey(phase.phase) << "\":{\"planned_duration_s\":";
			write_number(oss, phase.planned_duration_s);
			oss << ",\"start\":";
			write_opt_ts(oss, phase.start, timeline);
			oss << ",\"cue_events\":[";
			for (std::size_t c = 0; c < phase.cue_events.size(); ++c) {
				write_ts(oss, phase.cue_events[c], timeline);
				if (c + 1 < phase.cue_events.size()) oss << ",";
			}
			oss << "]}";
			if (p + 1 < block.phases.size()) oss << ",";
		}
		oss << "},\"interval_after_block\":";
		if (block.interval_after_block) {
			write_interval(oss, *block.interval_after_block, timeline);
		} else {
			oss << "null";
		}
		oss << "}";
		if (b + 1 < log.rhythm_blocks.size()) oss << ",";
	}
	oss << "]";
}

std::string serialize_meta(const ExperimentMeta_S& meta) {
	std::ostringstream oss;
	oss << "{"
	    << "\"paradigm_name\":" << JSON::json_quote(meta.paradigm_name) << ","
	    << "\"software_version\":" << JSON::json_quote(meta.software_version) << ","
	    << "\"author\":" << JSON::json_quote(meta.author) << ","
	    << "\"language\":" << JSON::json_quote(meta.language) << ","
	    << "\"test_mode\":" << (meta.test_mode ? "true" : "false") << ","
	    << "\"created_at\":" << JSON::json_quote(format_wall_time(meta.created_at)) << ","
	    << "\"patient_info\":" << JSON::json_quote(meta.patient_info()) << ","
	    << "\"electrode_info\":" << JSON::json_quote(meta.electrode_info()) << ","
	    << "\"notes\":" << JSON::json_quote(meta.notes)
	    << "}";
	return oss.str();
}

} // namespace

std::string serialize_timeline(const ExperimentLog_S& log, Timeline_E timeline) {
	std::ostringstream oss;
	oss << "{\"experiment_start\":";
	write_opt_ts(oss, log.experiment_start, timeline);
	oss << ",\"experiment_end\":";
	write_opt_ts(oss, log.experiment_end, timeline);
	oss << ",";
	if (log.paradigm == Paradigm_Rhythm) {
		write_rhythm_blocks(oss, log, timeline);
	} else {
		write_gonogo_blocks(oss, log, timeline);
	}
	oss << "}";
	return oss.str();
}

std::string serialize_status(const ExperimentStatus_S& status) {
	std::ostringstream oss;
	oss << "{"
	    << "\"state\":\"" << RunStatusToString(status.state) << "\","
	    << "\"completed\":" << (status.completed() ? "true" : "false") << ","
	    << "\"aborted\":" << (status.aborted() ? "true" : "false") << ","
	    << "\"reason\":" << JSON::json_quote(status.reason()) << ","
	    << "\"abort_reason\":";
	if (status.aborted()) {
		oss << "\"" << AbortReasonToString(status.abort_reason) << "\"";
	} else {
		oss << "null";
	}
	oss << ",\"abort_time_absolute\":";
	write_opt_ts(oss, status.abort_time, Timeline_Absolute);
	oss << ",\"abort_time_relative\":";
	write_opt_ts(oss, status.abort_time, Timeline_Relative);
	oss << "}";
	return oss.str();
}

std::string serialize_metrics(const std::optional<GoNoGoMetrics_S>& metrics) {
	if (!metrics) {
		return "null";
	}
	std::ostringstream oss;
	oss << "{\"go_hit_percent\":";
	write_opt_number(oss, metrics->go_hit_percent);
	oss << ",\"nogo_commission_percent\":";
	write_opt_number(oss, metrics->nogo_commission_percent);
	oss << ",\"mean_rt_go_hit\":";
	write_opt_number(oss, metrics->mean_rt_go_hit);
	oss << ",\"mean_rt_nogo_commission\":";
	write_opt_number(oss, metrics->mean_rt_nogo_commission);
	oss << "}";
	return oss.str();
}

std::string serialize_log(const ExperimentLog_S& log) {
	std::ostringstream oss;
	oss << "{"
	    << "\"meta\":" << serialize_meta(log.meta) << ","
	    << "\"config\":" << (log.config_json.empty() ? "{}" : log.config_json) << ","
	    << "\"status\":" << serialize_status(log.status) << ","
	    << "\"timing_absolute\":" << serialize_timeline(log, Timeline_Absolute) << ","
	    << "\"timing_relative\":" << serialize_timeline(log, Timeline_Relative) << ","
	    << "\"metrics\":" << serialize_metrics(log.metrics)
	    << "}";
	return oss.str();
}

std::optional<std::string> persist_log(const ExperimentLog_S& log,
                                       const std::string& folder,
                                       const std::string& prefix) {
	const auto startWall = log.experiment_start ? log.experiment_start->wall : log.meta.created_at;
	const auto cleanPrefix = sesspaths::sanitize_prefix(prefix, log.meta.paradigm_name.empty() ? "Experiment" : log.meta.paradigm_name);
	const auto path = sesspaths::build_timestamped_path(folder, cleanPrefix, startWall, "json");
	if (!sesspaths::write_text_file(path, serialize_log(log))) {
		LOG_ERR("LogWriter: failed to persist log to " << path.string());
		return std::nullopt;
	}
	LOG_ALWAYS("LogWriter: saved log to " << path.string());
	return path.string();
}

} // namespace logio
} // namespace paradigmlab
