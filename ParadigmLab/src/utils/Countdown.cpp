#include "Countdown.hpp"
#include <cmath>
#include <cstdio>
#include <thread>
#include <utility>
#include "Logger.hpp"

long long countdown_remaining_ms(double duration_s, double elapsed_s) {
	const double left_ms = std::ceil((duration_s - elapsed_s) * 1000.0);
	return left_ms > 0.0 ? static_cast<long long>(left_ms) : 0;
}

static double seconds_since(time_point_T start) {
	return std::chrono::duration_cast<seconds_d_T>(clock_T::now() - start).count();
}

void Countdown_C::start(double duration_s, CountdownCallbacks_S callbacks, ms_T interval) {
	cancel();
	durationS_ = duration_s > 0.0 ? duration_s : 0.0;
	callbacks_ = std::move(callbacks);
	startTime_ = clock_T::now();
	lastRemainingMs_ = -1;
	running_ = true;
	if (interval <= ms_T::zero()) {
		interval = COOP_COUNTDOWN_INTERVAL;
	}
	tickSchedule_ = PeriodicSchedule_C(startTime_ + interval, interval);

	LOG_DBG("countdown: start D=" << durationS_ << "s interval=" << interval.count() << "ms");

	// first tick: full duration rounded up
	emit_tick(countdown_remaining_ms(durationS_, 0.0));
	if (lastRemainingMs_ <= 0) {
		finish();
	}
}

bool Countdown_C::poll() {
	if (!running_) {
		return false;
	}
	if (callbacks_.should_abort && callbacks_.should_abort()) {
		LOG_DBG("countdown: aborted at remaining=" << lastRemainingMs_ << "ms");
		cancel();
		return false;
	}
	const auto now = clock_T::now();
	if (!tickSchedule_.is_due(now)) {
		return true;
	}
	tickSchedule_.skip_to_after(now);

	const long long remainingMs = countdown_remaining_ms(durationS_, seconds_since(startTime_));
	if (remainingMs <= 0) {
		// closing tick of 0 unless it was already shown
		if (lastRemainingMs_ != 0) {
			emit_tick(0);
		}
		finish();
		return false;
	}
	emit_tick(remainingMs);
	return running_;
}

void Countdown_C::cancel() {
	running_ = false;
	callbacks_ = CountdownCallbacks_S{};
}

void Countdown_C::emit_tick(long long remainingMs) {
	lastRemainingMs_ = remainingMs;
	if (callbacks_.on_tick) {
		callbacks_.on_tick(remainingMs);
	}
}

void Countdown_C::finish() {
	// move out first: on_finished is allowed to start() this same countdown again
	auto onFinished = std::move(callbacks_.on_finished);
	running_ = false;
	callbacks_ = CountdownCallbacks_S{};
	if (onFinished) {
		onFinished();
	}
}

bool run_blocking_countdown(double duration_s, const CountdownCallbacks_S& callbacks, ms_T step) {
	const double d = duration_s > 0.0 ? duration_s : 0.0;
	if (step <= ms_T::zero()) {
		step = BLOCKING_COUNTDOWN_STEP;
	}
	const auto start = clock_T::now();
	const auto endTime = start + std::chrono::duration_cast<clock_T::duration>(seconds_d_T{ d });
	long long lastMs = -1;

	auto aborted = [&]() { return callbacks.should_abort && callbacks.should_abort(); };

	while (true) {
		if (aborted()) {
			LOG_DBG("blocking countdown: aborted at remaining=" << lastMs << "ms");
			return false;
		}
		const auto now = clock_T::now();
		const long long remainingMs = countdown_remaining_ms(d, std::chrono::duration_cast<seconds_d_T>(now - start).count());
		if (remainingMs != lastMs) {
			if (callbacks.on_tick) {
				callbacks.on_tick(remainingMs);
			}
			lastMs = remainingMs;
		}
		if (now >= endTime || remainingMs <= 0) {
			break;
		}
		std::this_thread::sleep_for(step);
	}
	if (aborted()) {
		return false;
	}
	if (callbacks.on_finished) {
		callbacks.on_finished();
	}
	return true;
}

std::string format_countdown_text(const std::string& message, long long remainingMs) {
	char buf[32];
	std::snprintf(buf, sizeof(buf), "%06.3fs", static_cast<double>(remainingMs) / 1000.0);
	return message + "\n" + buf;
}
