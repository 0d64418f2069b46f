#include "ParadigmConfig.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "../utils/Errors.hpp"
#include "../utils/JsonUtils.hpp"
#include "../utils/Logger.hpp"
#include "../trial/TrialScheduler.hpp"

GoNoGoConfig_S GoNoGoConfig_S::defaults() {
	GoNoGoConfig_S cfg;
	// 0..8 respond, 9 withhold
	cfg.go_digits = { 0, 1, 2, 3, 4, 5, 6, 7, 8 };
	cfg.nogo_digits = { 9 };
	cfg.digit_weights.fill(1.0);
	return cfg;
}

RhythmConfig_S RhythmConfig_S::defaults() {
	RhythmConfig_S cfg;
	cfg.phase_durations_s[RhythmPhase_RestPre] = 10.0;
	cfg.phase_durations_s[RhythmPhase_CuedMovement] = 30.0;
	cfg.phase_durations_s[RhythmPhase_RestInstruction] = 5.0;
	cfg.phase_durations_s[RhythmPhase_InternalMovement] = 30.0;
	cfg.phase_durations_s[RhythmPhase_RestPost] = 10.0;
	return cfg;
}

namespace paradigmlab {
namespace config {

namespace {

// Key present but unparsable is an error; absent keeps the default.
template <typename T, typename Extract>
void override_field(const std::string& body, const char* key, T& field, Extract extract) {
	if (!JSON::has_json_key(body, key)) return;
	T value{};
	if (!extract(body, key, value)) {
		JSON::json_extract_fail("config", key);
		throw InvalidConfig_C(std::string("malformed value for '") + key + "'");
	}
	field = value;
}

void override_string(const std::string& body, const char* key, std::string& field) {
	override_field(body, key, field, JSON::extract_json_string);
}
void override_double(const std::string& body, const char* key, double& field) {
	override_field(body, key, field, JSON::extract_json_double);
}
void override_int(const std::string& body, const char* key, int& field) {
	override_field(body, key, field, JSON::extract_json_int);
}
void override_bool(const std::string& body, const char* key, bool& field) {
	override_field(body, key, field, JSON::extract_json_bool);
}

void require_non_negative(double v, const char* name) {
	if (!std::isfinite(v) || v < 0.0) {
		throw InvalidConfig_C(std::string(name) + " must be >= 0");
	}
}

bool is_hex_color(const std::string& s) {
	if (s.size() != 7 || s[0] != '#') return false;
	for (std::size_t i = 1; i < s.size(); ++i) {
		if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
	}
	return true;
}

std::string digits_json(const std::vector<int>& digits) {
	std::ostringstream oss;
	oss << "[";
	for (std::size_t i = 0; i < digits.size(); ++i) {
		oss << digits[i] << (i + 1 < digits.size() ? "," : "");
	}
	oss << "]";
	return oss.str();
}

Notification_E notification_from_string(const std::string& s) {
	if (s == "start_sequence") return Notification_StartSequence;
	if (s == "end_sequence") return Notification_EndSequence;
	if (s == "high_beep") return Notification_HighBeep;
	if (s == "low_beep") return Notification_LowBeep;
	throw InvalidConfig_C("unknown notification sound '" + s + "'");
}

} // namespace

bool read_file(const std::string& path, std::string& out) {
	std::ifstream in(path);
	if (!in.is_open()) {
		LOG_ERR("config: cannot open " << path);
		return false;
	}
	std::ostringstream oss;
	oss << in.rdbuf();
	out = oss.str();
	return true;
}

GoNoGoConfig_S load_gonogo_json(const std::string& body, GoNoGoConfig_S cfg) {
	override_string(body, "paradigm_name", cfg.paradigm_name);
	override_string(body, "language", cfg.language);
	override_string(body, "output_folder", cfg.output_folder);
	override_string(body, "notes", cfg.notes);
	override_bool(body, "test_mode", cfg.test_mode);

	override_field(body, "go_digits", cfg.go_digits, JSON::extract_json_int_array);
	override_field(body, "nogo_digits", cfg.nogo_digits, JSON::extract_json_int_array);
	if (JSON::has_json_key(body, "digit_weights")) {
		std::vector<double> w;
		if (!JSON::extract_json_double_array(body, "digit_weights", w) || w.size() != NUM_DIGITS) {
			JSON::json_extract_fail("config", "digit_weights");
			throw InvalidConfig_C("digit_weights must be an array of 10 numbers");
		}
		for (std::size_t i = 0; i < NUM_DIGITS; ++i) {
			cfg.digit_weights[i] = w[i];
		}
	}

	override_int(body, "n_blocks", cfg.n_blocks);
	override_int(body, "n_trials_per_block", cfg.n_trials_per_block);
	override_double(body, "rest_duration_s", cfg.rest_duration_s);
	override_double(body, "post_block_rest_duration_s", cfg.post_block_rest_duration_s);
	override_double(body, "inter_block_interval_s", cfg.inter_block_interval_s);
	override_double(body, "stimulus_duration_s", cfg.stimulus_duration_s);
	override_double(body, "inter_trial_interval_s", cfg.inter_trial_interval_s);
	override_double(body, "max_response_window_s", cfg.max_response_window_s);
	return cfg;
}

RhythmConfig_S load_rhythm_json(const std::string& body, RhythmConfig_S cfg) {
	override_string(body, "paradigm_name", cfg.paradigm_name);
	override_string(body, "language", cfg.language);
	override_string(body, "output_folder", cfg.output_folder);
	override_string(body, "file_prefix", cfg.file_prefix);
	override_string(body, "notes", cfg.notes);
	override_bool(body, "test_mode", cfg.test_mode);

	if (JSON::has_json_key(body, "cue_type")) {
		std::string cueType;
		override_string(body, "cue_type", cueType);
		if (cueType == "audio") {
			cfg.cue_type = CueType_Audio;
		} else if (cueType == "visual") {
			cfg.cue_type = CueType_Visual;
		} else {
			throw InvalidConfig_C("cue_type must be \"audio\" or \"visual\"");
		}
	}
	override_double(body, "cue_frequency_hz", cfg.cue_frequency_hz);
	override_double(body, "cue_tone_hz", cfg.cue_tone_hz);
	override_int(body, "cue_on_time_ms", cfg.cue_on_time_ms);
	if (JSON::has_json_key(body, "start_sound_type")) {
		std::string s;
		override_string(body, "start_sound_type", s);
		cfg.start_sound = notification_from_string(s);
	}
	if (JSON::has_json_key(body, "end_sound_type")) {
		std::string s;
		override_string(body, "end_sound_type", s);
		cfg.end_sound = notification_from_string(s);
	}
	override_string(body, "visual_color_hex", cfg.visual_color_hex);
	override_int(body, "visual_radius_px", cfg.visual_radius_px);
	override_int(body, "num_blocks", cfg.num_blocks);
	override_double(body, "inter_block_interval_s", cfg.inter_block_interval_s);
	for (std::size_t i = 0; i < NUM_RHYTHM_PHASES; ++i) {
		override_double(body, RhythmPhaseToKey(static_cast<RhythmPhase_E>(i)), cfg.phase_durations_s[i]);
	}
	return cfg;
}

void validate(const GoNoGoConfig_S& cfg) {
	if (cfg.output_folder.empty()) {
		throw InvalidConfig_C("output folder is required");
	}
	if (cfg.n_blocks <= 0 || cfg.n_trials_per_block <= 0) {
		throw InvalidConfig_C("blocks and trials must be positive");
	}
	require_non_negative(cfg.rest_duration_s, "rest_duration_s");
	require_non_negative(cfg.post_block_rest_duration_s, "post_block_rest_duration_s");
	require_non_negative(cfg.inter_block_interval_s, "inter_block_interval_s");
	require_non_negative(cfg.stimulus_duration_s, "stimulus_duration_s");
	require_non_negative(cfg.inter_trial_interval_s, "inter_trial_interval_s");
	require_non_negative(cfg.max_response_window_s, "max_response_window_s");
	for (double w : cfg.digit_weights) {
		if (!std::isfinite(w) || w < 0.0) {
			throw InvalidConfig_C("digit weights must be finite and >= 0");
		}
	}
	// digit sets + weights (throws with the precise reason)
	(void)trials::compute_go_ratio(cfg.go_digits, cfg.nogo_digits, cfg.digit_weights);
}

void validate(const RhythmConfig_S& cfg) {
	if (!std::isfinite(cfg.cue_frequency_hz) || cfg.cue_frequency_hz <= 0.0) {
		throw InvalidConfig_C("cue frequency must be > 0");
	}
	if (!is_hex_color(cfg.visual_color_hex)) {
		throw InvalidConfig_C("visual color must be in #RRGGBB format");
	}
	for (std::size_t i = 0; i < NUM_RHYTHM_PHASES; ++i) {
		require_non_negative(cfg.phase_durations_s[i], RhythmPhaseToKey(static_cast<RhythmPhase_E>(i)));
	}
	if (cfg.num_blocks <= 0) {
		throw InvalidConfig_C("number of blocks must be > 0");
	}
	require_non_negative(cfg.inter_block_interval_s, "inter_block_interval_s");
	if (cfg.cue_on_time_ms < 0 || cfg.visual_radius_px < 0) {
		throw InvalidConfig_C("cue on-time and visual radius must be >= 0");
	}
}

std::string to_json(const GoNoGoConfig_S& cfg) {
	std::ostringstream oss;
	oss << std::setprecision(10);
	oss << "{"
	    << "\"paradigm_name\":" << JSON::json_quote(cfg.paradigm_name) << ","
	    << "\"language\":" << JSON::json_quote(cfg.language) << ","
	    << "\"output_folder\":" << JSON::json_quote(cfg.output_folder) << ","
	    << "\"test_mode\":" << (cfg.test_mode ? "true" : "false") << ","
	    << "\"go_digits\":" << digits_json(cfg.go_digits) << ","
	    << "\"nogo_digits\":" << digits_json(cfg.nogo_digits) << ","
	    << "\"digit_weights\":[";
	for (std::size_t i = 0; i < NUM_DIGITS; ++i) {
		oss << cfg.digit_weights[i] << (i + 1 < NUM_DIGITS ? "," : "");
	}
	oss << "],"
	    << "\"n_blocks\":" << cfg.n_blocks << ","
	    << "\"n_trials_per_block\":" << cfg.n_trials_per_block << ","
	    << "\"rest_duration_s\":" << cfg.rest_duration_s << ","
	    << "\"post_block_rest_duration_s\":" << cfg.post_block_rest_duration_s << ","
	    << "\"inter_block_interval_s\":" << cfg.inter_block_interval_s << ","
	    << "\"stimulus_duration_s\":" << cfg.stimulus_duration_s << ","
	    << "\"inter_trial_interval_s\":" << cfg.inter_trial_interval_s << ","
	    << "\"max_response_window_s\":" << cfg.max_response_window_s
	    << "}";
	return oss.str();
}

std::string to_json(const RhythmConfig_S& cfg) {
	std::ostringstream oss;
	oss << std::setprecision(10);
	oss << "{"
	    << "\"paradigm_name\":" << JSON::json_quote(cfg.paradigm_name) << ","
	    << "\"language\":" << JSON::json_quote(cfg.language) << ","
	    << "\"test_mode\":" << (cfg.test_mode ? "true" : "false") << ","
	    << "\"cue_type\":\"" << (cfg.cue_type == CueType_Audio ? "audio" : "visual") << "\","
	    << "\"cue_frequency_hz\":" << cfg.cue_frequency_hz << ","
	    << "\"cue_tone_hz\":" << cfg.cue_tone_hz << ","
	    << "\"cue_on_time_ms\":" << cfg.cue_on_time_ms << ","
	    << "\"start_sound_type\":\"" << NotificationToString(cfg.start_sound) << "\","
	    << "\"end_sound_type\":\"" << NotificationToString(cfg.end_sound) << "\","
	    << "\"visual_color_hex\":" << JSON::json_quote(cfg.visual_color_hex) << ","
	    << "\"visual_radius_px\":" << cfg.visual_radius_px << ","
	    << "\"num_blocks\":" << cfg.num_blocks << ","
	    << "\"inter_block_interval_s\":" << cfg.inter_block_interval_s << ","
	    << "\"part_durations_s\":{";
	for (std::size_t i = 0; i < NUM_RHYTHM_PHASES; ++i) {
		oss << "\"" << RhythmPhaseToKey(static_cast<RhythmPhase_E>(i)) << "\":" << cfg.phase_durations_s[i]
		    << (i + 1 < NUM_RHYTHM_PHASES ? "," : "");
	}
	oss << "},"
	    << "\"output_folder\":" << JSON::json_quote(cfg.output_folder) << ","
	    << "\"file_prefix\":" << JSON::json_quote(cfg.file_prefix)
	    << "}";
	return oss.str();
}

} // namespace config
} // namespace paradigmlab
