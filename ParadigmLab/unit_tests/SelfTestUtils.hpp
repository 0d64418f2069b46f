#pragma once
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../src/utils/Logger.hpp"
#include "../src/stimulus/StimulusSink.hpp"

/* SELF TEST HELPERS
- CHECK logs the failed expression and makes the enclosing test fn return 1
- each self-test exe runs its test fns in order and exits non-zero on the first failure
*/

#define CHECK(cond) do { \
    if (!(cond)) { \
        LOG_ERR("CHECK FAILED: " #cond " (" __FILE__ ":" << __LINE__ << ")"); \
        return 1; \
    } \
} while(0)

#define CHECK_NEAR(a, b, tol) do { \
    const double check_a_ = (a); \
    const double check_b_ = (b); \
    if (!(std::fabs(check_a_ - check_b_) <= (tol))) { \
        LOG_ERR("CHECK_NEAR FAILED: " #a "=" << check_a_ << " " #b "=" << check_b_ \
                << " tol=" << (tol) << " (" __FILE__ ":" << __LINE__ << ")"); \
        return 1; \
    } \
} while(0)

#define RUN_TEST(fn) do { \
    LOG_ALWAYS("running " #fn); \
    if ((fn)() != 0) { \
        LOG_ERR(#fn " FAILED"); \
        return 1; \
    } \
    LOG_ALWAYS(#fn " passed"); \
} while(0)

// Spins until pred() or timeout; true if pred() became true.
inline bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto end = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < end) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return pred();
}

// Records every side effect (thread-safe). on_digit lets a test script responses.
class RecordingSink_C : public IStimulusSink_S {
public:
    struct Call_S {
        std::string what;      // "tone", "notification", "visual_on", "visual_off", "text", "digit", "clear", "countdown"
        std::string text;
        double value = 0.0;
        std::chrono::steady_clock::time_point at{};
    };

    std::function<void(int)> on_digit;

    void play_tone(double frequencyHz, int durationMs) override {
        (void)durationMs;
        record({"tone", "", frequencyHz});
    }
    void play_notification(Notification_E kind) override {
        record({"notification", NotificationToString(kind), 0.0});
    }
    void show_visual_cue(const std::string& colorHex, int radiusPx, int durationMs) override {
        (void)durationMs;
        record({"visual_on", colorHex, static_cast<double>(radiusPx)});
    }
    void hide_visual_cue() override {
        record({"visual_off", "", 0.0});
    }
    void set_instruction_text(const std::string& text) override {
        record({"text", text, 0.0});
    }
    void show_digit(int digit) override {
        record({"digit", "", static_cast<double>(digit)});
        if (on_digit) on_digit(digit);
    }
    void clear_screen() override {
        record({"clear", "", 0.0});
    }
    void show_countdown(const std::string& message, long long remainingMs) override {
        record({"countdown", message, static_cast<double>(remainingMs)});
    }

    std::vector<Call_S> calls() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_;
    }

    std::size_t count(const std::string& what, const std::string& text = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t n = 0;
        for (const auto& c : calls_) {
            if (c.what == what && (text.empty() || c.text == text)) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mtx_;
    std::vector<Call_S> calls_;

    void record(Call_S call) {
        call.at = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.push_back(std::move(call));
    }
};
