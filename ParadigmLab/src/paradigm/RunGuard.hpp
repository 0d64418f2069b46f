#pragma once
#include <atomic>

// Only one paradigm run per process. Controllers hold one of these for the
// whole of run(); a second try_acquire() fails until it is released.
class RunGuard_C {
public:
	RunGuard_C() = default;
	~RunGuard_C() { release(); }
	RunGuard_C(const RunGuard_C&) = delete;
	RunGuard_C& operator=(const RunGuard_C&) = delete;

	bool try_acquire() {
		if (held_) return true;
		bool expected = false;
		held_ = s_active.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
		return held_;
	}

	void release() {
		if (held_) {
			s_active.store(false, std::memory_order_release);
			held_ = false;
		}
	}

	bool held() const { return held_; }
	static bool any_active() { return s_active.load(std::memory_order_acquire); }

private:
	bool held_ = false;
	static inline std::atomic<bool> s_active{ false };
};
