#pragma once
#include <cstddef> // for size_t
#include <chrono>

// One-shot software timer polled by its owner's loop.
// Nothing fires on its own: the owner asks check_timer_expired() at each
// suspension point, so cancelling is just clearing the armed flag.
class SW_Timer_C {

public:
	using clock_t = std::chrono::steady_clock;
	using dur_t = clock_t::duration;
	using timepoint_t = clock_t::time_point;

	// default duration if caller omits argument
	static constexpr auto DEFAULT = std::chrono::milliseconds{ 15 };

	void start_timer(dur_t timer_dur = DEFAULT) {
		start_timer_at(clock_t::now(), timer_dur);
	}

	// arm relative to an instant already captured by the caller (keeps two timers on the same origin)
	void start_timer_at(timepoint_t origin, dur_t timer_dur) {
		if (timer_dur < dur_t::zero()) {
			timer_dur = dur_t::zero();
		}
		timer_start_time = origin;
		until = origin + timer_dur;
		timer_started = true;
	}

	// stop & return elapsed time in ms
	std::chrono::milliseconds stop_timer() {
		auto ended_at = get_timer_value_ms();
		timer_started = false;
		return ended_at;
	}

	// idempotent
	void cancel() { timer_started = false; }

	// elapsed ms since start (0ms if not started)
	std::chrono::milliseconds get_timer_value_ms() const {
		if (timer_started == false) {
			return std::chrono::milliseconds{ 0 };
		}
		return std::chrono::duration_cast<std::chrono::milliseconds>(clock_t::now() - timer_start_time);
	}

	// time left before expiry (0 once expired or when not armed)
	dur_t remaining() const {
		if (timer_started == false) {
			return dur_t::zero();
		}
		auto left = until - clock_t::now();
		return left > dur_t::zero() ? left : dur_t::zero();
	}

	bool check_timer_expired() const {
		return timer_started && clock_t::now() >= until;
	}

	bool is_started() const { return timer_started; }
	timepoint_t deadline() const { return until; }

private:
	bool timer_started = false;
	// default-construct timepoint to represent timeout time
	timepoint_t until{};
	timepoint_t timer_start_time{};
};
