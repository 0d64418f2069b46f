#pragma once
#include "Types.h"
#include <cstddef>

// Accumulating "next fire time" schedule.
// next_ only ever moves by whole periods from the first fire time, so a late
// poll never shifts the rest of the train; the owner catches up by firing on
// each poll while is_due() stays true.
class PeriodicSchedule_C {
public:
	using dur_t = clock_T::duration;

	PeriodicSchedule_C() = default;
	PeriodicSchedule_C(time_point_T firstFire, dur_t period) : next_(firstFire), period_(period) {}

	bool is_due(time_point_T now) const { return period_ > dur_t::zero() && now >= next_; }

	// consume one due slot
	void advance() {
		next_ += period_;
		++fired_;
	}

	// drop every slot already in the past (UI ticks don't need to replay missed slots)
	void skip_to_after(time_point_T now) {
		while (is_due(now)) {
			advance();
		}
	}

	time_point_T next_fire_time() const { return next_; }
	dur_t period() const { return period_; }
	std::size_t fired() const { return fired_; }

private:
	time_point_T next_{};
	dur_t period_{};
	std::size_t fired_ = 0;
};

// period for a frequency in Hz, kept at full steady_clock resolution
inline clock_T::duration period_from_hz(double hz) {
	return std::chrono::duration_cast<clock_T::duration>(seconds_d_T{ 1.0 / hz });
}
