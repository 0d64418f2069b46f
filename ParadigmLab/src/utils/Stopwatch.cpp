#include "Stopwatch.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

Stopwatch_C::Stopwatch_C() {
	start();
}

void Stopwatch_C::start() {
	start_wall_ = wall_clock_T::now();
	start_mono_ = clock_T::now();
}

double Stopwatch_C::elapsed_s() const {
	const double dt = std::chrono::duration_cast<seconds_d_T>(clock_T::now() - start_mono_).count();
	return dt > 0.0 ? dt : 0.0;
}

long long Stopwatch_C::elapsed_ms() const {
	return static_cast<long long>(elapsed_s() * 1000.0);
}

TimestampPair_S Stopwatch_C::timestamp_pair() const {
	TimestampPair_S pair;
	pair.wall = wall_clock_T::now();
	pair.rel_s = elapsed_s();
	return pair;
}

std::string format_wall_time(const wall_time_point_T& tp) {
	const std::time_t t = wall_clock_T::to_time_t(tp);
	const auto ms = std::chrono::duration_cast<ms_T>(tp.time_since_epoch()).count() % 1000;

	std::tm tm{};
#if defined(_WIN32)
	localtime_s(&tm, &t);
#else
	localtime_r(&t, &tm);
#endif

	std::ostringstream oss;
	oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "."
	    << std::setw(3) << std::setfill('0') << (ms < 0 ? ms + 1000 : ms);
	return oss.str();
}
