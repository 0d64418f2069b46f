/*
==============================================================================
	File: StateStoreSink.hpp
	Desc: IStimulusSink_S that publishes side effects into the shared
	StateStore_s, where the presentation client picks them up via GET /state.
	Runs on the CueDispatcher_C worker thread.
==============================================================================
*/

#pragma once
#include "StimulusSink.hpp"
#include "../shared/StateStore.hpp"

class StateStoreSink_C : public IStimulusSink_S {
public:
	explicit StateStoreSink_C(StateStore_s& stateStoreRef) : stateStoreRef_(stateStoreRef) {}

	void play_tone(double frequencyHz, int durationMs) override;
	void play_notification(Notification_E kind) override;
	void show_visual_cue(const std::string& colorHex, int radiusPx, int durationMs) override;
	void hide_visual_cue() override;
	void set_instruction_text(const std::string& text) override;
	void show_digit(int digit) override;
	void clear_screen() override;
	void show_countdown(const std::string& message, long long remainingMs) override;

	// steady-clock ms used for g_visual_cue_until_ms
	static long long steady_now_ms();

private:
	StateStore_s& stateStoreRef_;
};
