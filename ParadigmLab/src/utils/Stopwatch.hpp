/*
==============================================================================
	File: Stopwatch.hpp
	Desc: Dual-clock anchor for a run.
	* start_wall_ / start_mono_ are captured together at start()/reset()
	* every event in the log is a TimestampPair_S read from here
	* read-only after start, so any thread may call timestamp_pair()
==============================================================================
*/
#pragma once
#include "Types.h"
#include <string>

// Wall time + seconds since stopwatch start, read back to back.
struct TimestampPair_S {
	wall_time_point_T wall{};
	double rel_s = 0.0;
};

class Stopwatch_C {
public:
	Stopwatch_C();

	void start();
	void reset() { start(); }

	double elapsed_s() const;
	long long elapsed_ms() const;
	TimestampPair_S timestamp_pair() const;

	wall_time_point_T start_wall() const { return start_wall_; }
	time_point_T start_mono() const { return start_mono_; }

private:
	wall_time_point_T start_wall_;
	time_point_T start_mono_;
};

// "YYYY-mm-dd HH:MM:SS.mmm" in local time
std::string format_wall_time(const wall_time_point_T& tp);
