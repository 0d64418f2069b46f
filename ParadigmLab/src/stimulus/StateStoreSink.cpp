#include "StateStoreSink.hpp"
#include "../utils/Countdown.hpp"
#include "../utils/Logger.hpp"

long long StateStoreSink_C::steady_now_ms() {
	return std::chrono::duration_cast<ms_T>(clock_T::now().time_since_epoch()).count();
}

void StateStoreSink_C::play_tone(double frequencyHz, int durationMs) {
	// actual synthesis happens client side
	stateStoreRef_.g_last_tone_hz.store(frequencyHz, std::memory_order_release);
	stateStoreRef_.g_tone_count.fetch_add(1, std::memory_order_acq_rel);
	stateStoreRef_.bump_seq();
	LOG_DBG("Sink: tone " << frequencyHz << "Hz for " << durationMs << "ms");
}

void StateStoreSink_C::play_notification(Notification_E kind) {
	{
		std::lock_guard<std::mutex> lock(stateStoreRef_.text_mtx);
		stateStoreRef_.last_notification = kind;
	}
	stateStoreRef_.g_notification_count.fetch_add(1, std::memory_order_acq_rel);
	stateStoreRef_.bump_seq();
	LOG_DBG("Sink: notification " << NotificationToString(kind));
}

void StateStoreSink_C::show_visual_cue(const std::string& colorHex, int radiusPx, int durationMs) {
	{
		std::lock_guard<std::mutex> lock(stateStoreRef_.text_mtx);
		stateStoreRef_.visual_color = colorHex;
	}
	stateStoreRef_.g_visual_radius.store(radiusPx, std::memory_order_release);
	stateStoreRef_.g_visual_cue_until_ms.store(steady_now_ms() + durationMs, std::memory_order_release);
	stateStoreRef_.bump_seq();
}

void StateStoreSink_C::hide_visual_cue() {
	stateStoreRef_.g_visual_cue_until_ms.store(0, std::memory_order_release);
	stateStoreRef_.bump_seq();
}

void StateStoreSink_C::set_instruction_text(const std::string& text) {
	stateStoreRef_.publish_text(text);
}

void StateStoreSink_C::show_digit(int digit) {
	stateStoreRef_.g_digit.store(digit, std::memory_order_release);
	stateStoreRef_.bump_seq();
}

void StateStoreSink_C::clear_screen() {
	stateStoreRef_.g_digit.store(-1, std::memory_order_release);
	stateStoreRef_.g_countdown_ms.store(-1, std::memory_order_release);
	stateStoreRef_.publish_text("");
}

void StateStoreSink_C::show_countdown(const std::string& message, long long remainingMs) {
	stateStoreRef_.g_countdown_ms.store(remainingMs, std::memory_order_release);
	if (remainingMs < 0) {
		stateStoreRef_.publish_text(message);
	} else {
		stateStoreRef_.publish_text(format_countdown_text(message, remainingMs));
	}
}
