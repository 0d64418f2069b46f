#pragma once
#include "../utils/Types.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
/* STATESTORE
--> A single source of truth shared by the paradigm thread (writer), the
    cue dispatcher (writer, side effects) and the HTTP thread (reader):
    1) which paradigm / state / block / trial is live
    2) what the presentation client should be showing right now
    3) input coming back from the client (respond / abort)
    4) the last finished log, for GET /log
*/

struct StateStore_s{

    std::atomic<int> g_seq{0}; // increment each time something visible changes so the client can detect quickly

    std::atomic<Paradigm_E> g_paradigm{Paradigm_None};
    std::atomic<int> g_state{0};      // GoNoGoState_E or RhythmState_E depending on g_paradigm
    std::atomic<int> g_block{0};
    std::atomic<int> g_trial{0};
    std::atomic<int> g_digit{-1};     // -1 = blank screen

    // remaining ms of the live countdown, -1 when none is running
    std::atomic<long long> g_countdown_ms{-1};

    // visual cue is "on" until this steady-clock ms stamp (0 = hidden)
    std::atomic<long long> g_visual_cue_until_ms{0};
    std::atomic<int> g_visual_radius{0};
    std::atomic<double> g_last_tone_hz{0.0};
    std::atomic<int> g_tone_count{0};
    std::atomic<int> g_notification_count{0};

    std::atomic<bool> g_completed{false};
    std::atomic<bool> g_aborted{false};

    // last event POSTed by the client (display/debug only; routing goes through HttpServer_C's handler)
    std::atomic<UIEvent_E> g_last_ui_event{UIEvent_None};

    // custom types require mutex protection
    mutable std::mutex text_mtx;
    std::string instruction_text;
    std::string visual_color;
    std::optional<Notification_E> last_notification;

    void publish_text(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(text_mtx);
            instruction_text = text;
        }
        bump_seq();
    }

    std::string get_instruction_text() const {
        std::lock_guard<std::mutex> lock(text_mtx);
        return instruction_text;  // return by value (copy)
    }

    std::string get_visual_color() const {
        std::lock_guard<std::mutex> lock(text_mtx);
        return visual_color;
    }

    std::optional<Notification_E> get_last_notification() const {
        std::lock_guard<std::mutex> lock(text_mtx);
        return last_notification;
    }

    void bump_seq() {
        g_seq.fetch_add(1, std::memory_order_acq_rel);
    }

    // finished log (serialized) for GET /log
    mutable std::mutex last_log_mtx;
    std::string last_log_json;

    void set_last_log(const std::string& json) {
        std::lock_guard<std::mutex> lock(last_log_mtx);
        last_log_json = json;
    }

    std::string get_last_log() const {
        std::lock_guard<std::mutex> lock(last_log_mtx);
        return last_log_json;
    }

    // clean slate before a new run
    void reset_for_run(Paradigm_E paradigm) {
        g_paradigm.store(paradigm, std::memory_order_release);
        g_state.store(0, std::memory_order_release);
        g_block.store(0, std::memory_order_release);
        g_trial.store(0, std::memory_order_release);
        g_digit.store(-1, std::memory_order_release);
        g_countdown_ms.store(-1, std::memory_order_release);
        g_visual_cue_until_ms.store(0, std::memory_order_release);
        g_completed.store(false, std::memory_order_release);
        g_aborted.store(false, std::memory_order_release);
        g_last_ui_event.store(UIEvent_None, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lock(text_mtx);
            instruction_text.clear();
            last_notification.reset();
        }
        bump_seq();
    }
};
