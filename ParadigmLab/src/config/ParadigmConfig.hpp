/*
==============================================================================
	File: ParadigmConfig.hpp
	Desc: Run parameters for both paradigms.
	* defaults() mirror the values the operator UI starts with
	* load_*_json() overrides defaults from a flat JSON document
	* validate() throws InvalidConfig_C; controllers assume a validated config
==============================================================================
*/
#pragma once
#include <array>
#include <string>
#include <vector>
#include "../utils/Types.h"

struct GoNoGoConfig_S {
	std::string paradigm_name = "GoNoGo";
	std::string language = "en";
	std::string output_folder = ".";
	std::string notes;
	bool test_mode = false;

	std::vector<int> go_digits;
	std::vector<int> nogo_digits;
	std::array<double, NUM_DIGITS> digit_weights{};

	int n_blocks = 4;
	int n_trials_per_block = 75;

	// seconds
	double rest_duration_s = 10.0;            // pre-task rest at the start of each block
	double post_block_rest_duration_s = 10.0;
	double inter_block_interval_s = 30.0;
	double stimulus_duration_s = 0.3;         // digit visible
	double inter_trial_interval_s = 1.0;
	double max_response_window_s = 0.8;

	static GoNoGoConfig_S defaults();
};

struct RhythmConfig_S {
	std::string paradigm_name = "Rhythm";
	std::string language = "en";
	std::string output_folder = ".";
	std::string file_prefix = "Rhythm";
	std::string notes;
	bool test_mode = false;

	CueType_E cue_type = CueType_Audio;
	double cue_frequency_hz = 1.0;
	double cue_tone_hz = 880.0;
	int cue_on_time_ms = 300;
	Notification_E start_sound = Notification_StartSequence;
	Notification_E end_sound = Notification_EndSequence;
	std::string visual_color_hex = "#FF0000";
	int visual_radius_px = 160;

	int num_blocks = 4;
	double inter_block_interval_s = 30.0;
	// indexed by RhythmPhase_E
	std::array<double, NUM_RHYTHM_PHASES> phase_durations_s{};

	static RhythmConfig_S defaults();
};

namespace paradigmlab {
namespace config {

GoNoGoConfig_S load_gonogo_json(const std::string& body, GoNoGoConfig_S base = GoNoGoConfig_S::defaults());
RhythmConfig_S load_rhythm_json(const std::string& body, RhythmConfig_S base = RhythmConfig_S::defaults());

// reads a whole file; false if it can't be opened
bool read_file(const std::string& path, std::string& out);

void validate(const GoNoGoConfig_S& cfg);
void validate(const RhythmConfig_S& cfg);

// flat JSON snapshot stored in the log's config section
std::string to_json(const GoNoGoConfig_S& cfg);
std::string to_json(const RhythmConfig_S& cfg);

} // namespace config
} // namespace paradigmlab
