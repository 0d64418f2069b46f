#include "CueDispatcher.hpp"
#include <exception>
#include "../utils/Logger.hpp"

CueDispatcher_C::CueDispatcher_C(IStimulusSink_S& target, std::size_t capacity)
	: target_(target), capacity_(capacity == 0 ? 1 : capacity) {
	worker_ = std::thread([this] { worker_loop(); });
}

CueDispatcher_C::~CueDispatcher_C() {
	stop();
}

bool CueDispatcher_C::post(Job_T job) {
	return enqueue(std::move(job), false);
}

bool CueDispatcher_C::post_guaranteed(Job_T job) {
	return enqueue(std::move(job), true);
}

bool CueDispatcher_C::enqueue(Job_T job, bool guaranteed) {
	{
		std::lock_guard<std::mutex> lock(mtx_);
		if (stopping_ || (!guaranteed && queue_.size() >= capacity_)) {
			dropped_.fetch_add(1, std::memory_order_acq_rel);
			LOG_DBG("CueDispatcher: dropped side effect (queued=" << queue_.size()
			        << (stopping_ ? ", stopping" : "") << ")");
			return false;
		}
		queue_.push_back(std::move(job));
	}
	cv_work_.notify_one();
	return true;
}

void CueDispatcher_C::flush() {
	std::unique_lock<std::mutex> lock(mtx_);
	cv_idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void CueDispatcher_C::stop() {
	{
		std::lock_guard<std::mutex> lock(mtx_);
		if (stopping_ && !worker_.joinable()) return;
		stopping_ = true;
	}
	cv_work_.notify_all();
	if (worker_.joinable()) {
		worker_.join();
	}
}

void CueDispatcher_C::worker_loop() {
	logger::tlabel = "CueDispatcher";
	for (;;) {
		Job_T job;
		{
			std::unique_lock<std::mutex> lock(mtx_);
			cv_work_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
			if (queue_.empty()) {
				// stopping and drained
				break;
			}
			job = std::move(queue_.front());
			queue_.pop_front();
			busy_ = true;
		}
		try {
			job(target_);
		} catch (const std::exception& e) {
			// a failing sink must not take the schedule down with it
			LOG_ERR("CueDispatcher: sink threw: " << e.what());
		}
		{
			std::lock_guard<std::mutex> lock(mtx_);
			busy_ = false;
		}
		cv_idle_.notify_all();
	}
	cv_idle_.notify_all();
}

// ============= IStimulusSink_S ============

void CueDispatcher_C::play_tone(double frequencyHz, int durationMs) {
	post([=](IStimulusSink_S& s) { s.play_tone(frequencyHz, durationMs); });
}

void CueDispatcher_C::play_notification(Notification_E kind) {
	post([=](IStimulusSink_S& s) { s.play_notification(kind); });
}

void CueDispatcher_C::show_visual_cue(const std::string& colorHex, int radiusPx, int durationMs) {
	post([=](IStimulusSink_S& s) { s.show_visual_cue(colorHex, radiusPx, durationMs); });
}

void CueDispatcher_C::hide_visual_cue() {
	post_guaranteed([](IStimulusSink_S& s) { s.hide_visual_cue(); });
}

void CueDispatcher_C::set_instruction_text(const std::string& text) {
	post([=](IStimulusSink_S& s) { s.set_instruction_text(text); });
}

void CueDispatcher_C::show_digit(int digit) {
	post_guaranteed([=](IStimulusSink_S& s) { s.show_digit(digit); });
}

void CueDispatcher_C::clear_screen() {
	post_guaranteed([](IStimulusSink_S& s) { s.clear_screen(); });
}

void CueDispatcher_C::show_countdown(const std::string& message, long long remainingMs) {
	post([=](IStimulusSink_S& s) { s.show_countdown(message, remainingMs); });
}
