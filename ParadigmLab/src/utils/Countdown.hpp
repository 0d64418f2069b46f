/*
==============================================================================
	File: Countdown.hpp
	Desc: Countdown primitives with one external contract, two drivers.
	* Countdown_C: cooperative, advanced by poll() from the owner's loop (50ms ticks)
	* run_blocking_countdown(): sleep-poll loop (10ms step), returns when done/aborted
	Both recompute remaining time from steady_clock on every tick, never from tick counts.
==============================================================================
*/
#pragma once
#include "Types.h"
#include "PeriodicSchedule.hpp"
#include <functional>
#include <optional>
#include <string>

struct CountdownCallbacks_S {
	std::function<void(long long)> on_tick;    // remaining ms, rounded up
	std::function<void()> on_finished;         // natural completion only
	std::function<bool()> should_abort;        // polled at every tick
};

// ceil((duration - elapsed) * 1000), never below 0
long long countdown_remaining_ms(double duration_s, double elapsed_s);

class Countdown_C {
public:
	Countdown_C() = default;
	// Disallow copying (callbacks usually capture the owner)
	Countdown_C(const Countdown_C&) = delete;
	Countdown_C& operator=(const Countdown_C&) = delete;

	// emits the first tick right away; D <= 0 finishes inside start()
	void start(double duration_s, CountdownCallbacks_S callbacks, ms_T interval = COOP_COUNTDOWN_INTERVAL);

	// drive from the host loop; returns true while still running
	bool poll();

	// idempotent, drops the callbacks
	void cancel();

	bool is_running() const { return running_; }
	long long last_remaining_ms() const { return lastRemainingMs_; }

private:
	bool running_ = false;
	double durationS_ = 0.0;
	time_point_T startTime_{};
	long long lastRemainingMs_ = -1;
	CountdownCallbacks_S callbacks_;
	PeriodicSchedule_C tickSchedule_;

	void emit_tick(long long remainingMs);
	void finish();
};

// Blocking variant. Suppresses ticks whose value didn't change since the last one.
// Returns true on natural completion (on_finished called), false on abort.
bool run_blocking_countdown(double duration_s, const CountdownCallbacks_S& callbacks,
                            ms_T step = BLOCKING_COUNTDOWN_STEP);

// "<message>\n05.250s"
std::string format_countdown_text(const std::string& message, long long remainingMs);
