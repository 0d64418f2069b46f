/*
==============================================================================
	File: StimulusSink.hpp
	Desc: Abstract side-effect interface between the paradigm controllers and
	whatever presents stimuli (the presentation client via StateStore, a test
	recorder, ...). Every call is fire-and-forget: controllers never consume a
	return value and never wait on a sink.
	Note: controllers reach the sink through CueDispatcher_C, never directly.
==============================================================================
*/

#pragma once
#include <string>
#include "../utils/Types.h"

struct IStimulusSink_S {
	virtual ~IStimulusSink_S() = default; // virtual destructor for proper cleanup of derived classes

	virtual void play_tone(double frequencyHz, int durationMs) = 0;
	virtual void play_notification(Notification_E kind) = 0;
	virtual void show_visual_cue(const std::string& colorHex, int radiusPx, int durationMs) = 0;
	virtual void hide_visual_cue() = 0;
	virtual void set_instruction_text(const std::string& text) = 0;
	virtual void show_digit(int digit) = 0;
	virtual void clear_screen() = 0;
	// remaining < 0 clears the countdown
	virtual void show_countdown(const std::string& message, long long remainingMs) = 0;
}; // IStimulusSink_S
