/*
HTTP SERVER : READER
- starts httplib::Server (talks to the presentation client) on 127.0.0.1
- spends its life waiting for client requests and answering them by reading the shared state the paradigm thread updates
- blocks inside listen() loop, hence requires its own thread to prevent freezes
- CLIENT calls GET/POST: HTTP server listens & responds...
--> Client calls GET /state on a timer to pull the latest screen (digit, instruction, countdown, cue) from C++
--> Client calls POST /event when the subject presses the response key or the operator aborts
--> Client calls GET /log after a run to fetch the finished log
- POST handling does not touch the controller directly: it forwards to the registered event handler
*/
#pragma once
#include <httplib.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include "../utils/Logger.hpp"
#include "../shared/StateStore.hpp"

/*
Agreed upon JSON schema for GET /state:

{
  "seq": int,                   // monotonic counter, increments whenever something visible changes
  "paradigm": "gonogo"|"rhythm"|"none",
  "state": string,              // GoNoGoStateToString / RhythmStateToString
  "block": int, "trial": int,
  "digit": int,                 // -1 = blank
  "instruction": string,
  "countdown_ms": int,          // -1 = none
  "visual_cue_on": bool, "visual_color": "#RRGGBB", "visual_radius": int,
  "last_tone_hz": number,
  "last_notification": string|null,
  "completed": bool, "aborted": bool
}

POST /event body: {"action":"respond"} or {"action":"abort"}
*/


class HttpServer_C {
public: // API
    using EventHandler_T = std::function<void(UIEvent_E)>;

    explicit HttpServer_C(StateStore_s& stateStoreRef, int port=7777);
    ~HttpServer_C();
    bool http_start_server(); // constructs httplib::server
    bool http_listen_for_poll_requests(); // blocking .listen()
    bool http_close_server(); // calls server's stop hook so .listen() returns
    bool get_is_running() { return is_running_; };
    int get_port() const { return port_; };

    // called from the HTTP thread for every recognised POST /event
    void set_event_handler(EventHandler_T handler);

    // JSON snapshot served by GET /state (public so tests can check it without a socket)
    std::string build_state_json() const;
    static UIEvent_E parse_event_action(const std::string& body);

private:
    StateStore_s& stateStoreRef_; // reference to StateStore
    std::unique_ptr<httplib::Server> liveServer_; // live httplib::server
    int port_;
    std::atomic<bool> is_running_ = false;

    std::mutex handler_mtx_;
    EventHandler_T eventHandler_;

    // Handlers
    void handle_get_state(const httplib::Request& req, httplib::Response& res); // return current statestore snapshot (JSON)
    void handle_post_event(const httplib::Request& req, httplib::Response& res); // accept respond/abort (JSON)
    void handle_get_log(const httplib::Request& req, httplib::Response& res); // last finished log
    void handle_options_and_set(const httplib::Request& req, httplib::Response& res); // CORS preflight
    void write_json(httplib::Response& res, std::string_view json_body) const;
}; // HttpServer_C
