/*
==============================================================================
	File: CueDispatcher.hpp
	Desc: Fire-and-forget path for stimulus side effects.
	* implements IStimulusSink_S by queueing each call for a single worker
	  thread that forwards it to the real sink
	* bounded queue: when full the call is dropped (debug log), never waited on
	* no ordering guarantee relative to the timing loop, only FIFO among jobs
	* stop() drains what is already queued, then joins
==============================================================================
*/

#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include "StimulusSink.hpp"

class CueDispatcher_C : public IStimulusSink_S {
public:
	using Job_T = std::function<void(IStimulusSink_S&)>;

	explicit CueDispatcher_C(IStimulusSink_S& target, std::size_t capacity = CUE_QUEUE_CAPACITY);
	~CueDispatcher_C() override;
	// worker thread captures this
	CueDispatcher_C(const CueDispatcher_C&) = delete;
	CueDispatcher_C& operator=(const CueDispatcher_C&) = delete;

	// false if dropped (queue full or stopped)
	bool post(Job_T job);
	// ignores capacity, keeps FIFO order (digits, screen clears and cue hides are never dropped)
	bool post_guaranteed(Job_T job);

	// blocks until every queued job has run (tests + shutdown)
	void flush();

	// idempotent
	void stop();

	std::size_t dropped_count() const { return dropped_.load(std::memory_order_acquire); }

	// IStimulusSink_S (all enqueue)
	void play_tone(double frequencyHz, int durationMs) override;
	void play_notification(Notification_E kind) override;
	void show_visual_cue(const std::string& colorHex, int radiusPx, int durationMs) override;
	void hide_visual_cue() override;
	void set_instruction_text(const std::string& text) override;
	void show_digit(int digit) override;
	void clear_screen() override;
	void show_countdown(const std::string& message, long long remainingMs) override;

private:
	IStimulusSink_S& target_;
	std::size_t capacity_;

	std::mutex mtx_;
	std::condition_variable cv_work_;
	std::condition_variable cv_idle_;
	std::deque<Job_T> queue_;
	bool stopping_ = false;
	bool busy_ = false;

	std::atomic<std::size_t> dropped_{ 0 };
	std::thread worker_;

	void worker_loop();
	bool enqueue(Job_T job, bool guaranteed);
};
