#include "HttpServer.hpp"
#include <atomic>
#include <string>
#include <sstream>
#include <iomanip>
#include "StateStoreSink.hpp"
#include "../utils/JsonUtils.hpp"

// Constructor
HttpServer_C::HttpServer_C(StateStore_s& stateStoreRef, int port) : stateStoreRef_(stateStoreRef), liveServer_(nullptr), port_(port) {
}

// Destructor
HttpServer_C::~HttpServer_C() {
    if (liveServer_ && is_running_.load(std::memory_order_acquire)) {
        liveServer_->stop();
    }
}

void HttpServer_C::set_event_handler(EventHandler_T handler) {
    std::lock_guard<std::mutex> lock(handler_mtx_);
    eventHandler_ = std::move(handler);
}

// ============= Helpers ============
static inline void set_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

static const char* paradigm_to_string(Paradigm_E p) {
    switch (p) {
        case Paradigm_GoNoGo: return "gonogo";
        case Paradigm_Rhythm: return "rhythm";
        case Paradigm_None:
        default: return "none";
    }
}

// Writes JSON string into httplib:response body with correct CORS header
void HttpServer_C::write_json(httplib::Response& res, std::string_view json_body) const {
    set_cors_headers(res);
    res.set_content(std::string(json_body), "application/json");
    res.status = 200;
}

// Allow methods/headers letting the client make POST requests
void HttpServer_C::handle_options_and_set(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    set_cors_headers(res);
    res.status = 200;
}

UIEvent_E HttpServer_C::parse_event_action(const std::string& body) {
    std::string action;
    if (!JSON::extract_json_string(body, "action", action)) {
        return UIEvent_None;
    }
    if (action == "respond") {
        return UIEvent_Respond;
    } else if (action == "abort") {
        return UIEvent_Abort;
    }
    return UIEvent_None;
}

std::string HttpServer_C::build_state_json() const {
    // 1) "snapshot" read of current statestore_s
    int seq = stateStoreRef_.g_seq.load(std::memory_order_acquire);
    Paradigm_E paradigm = stateStoreRef_.g_paradigm.load(std::memory_order_acquire);
    int state = stateStoreRef_.g_state.load(std::memory_order_acquire);
    int block = stateStoreRef_.g_block.load(std::memory_order_acquire);
    int trial = stateStoreRef_.g_trial.load(std::memory_order_acquire);
    int digit = stateStoreRef_.g_digit.load(std::memory_order_acquire);
    long long countdown_ms = stateStoreRef_.g_countdown_ms.load(std::memory_order_acquire);
    long long cue_until = stateStoreRef_.g_visual_cue_until_ms.load(std::memory_order_acquire);
    bool visual_cue_on = cue_until > StateStoreSink_C::steady_now_ms();
    int visual_radius = stateStoreRef_.g_visual_radius.load(std::memory_order_acquire);
    double last_tone_hz = stateStoreRef_.g_last_tone_hz.load(std::memory_order_acquire);
    bool completed = stateStoreRef_.g_completed.load(std::memory_order_acquire);
    bool aborted = stateStoreRef_.g_aborted.load(std::memory_order_acquire);
    std::string instruction = stateStoreRef_.get_instruction_text();
    std::string visual_color = stateStoreRef_.get_visual_color();
    auto last_notification = stateStoreRef_.get_last_notification();

    const char* state_str = "idle";
    if (paradigm == Paradigm_GoNoGo) {
        state_str = GoNoGoStateToString(static_cast<GoNoGoState_E>(state));
    } else if (paradigm == Paradigm_Rhythm) {
        state_str = RhythmStateToString(static_cast<RhythmState_E>(state));
    }

    // 2) build json string manually
    std::ostringstream oss;
    oss << "{"
        << "\"seq\":"               << seq                                          << ","
        << "\"paradigm\":\""        << paradigm_to_string(paradigm)                 << "\","
        << "\"state\":\""           << state_str                                    << "\","
        << "\"block\":"             << block                                        << ","
        << "\"trial\":"             << trial                                        << ","
        << "\"digit\":"             << digit                                        << ","
        << "\"instruction\":"       << JSON::json_quote(instruction)                << ","
        << "\"countdown_ms\":"      << countdown_ms                                 << ","
        << "\"visual_cue_on\":"     << (visual_cue_on ? "true" : "false")           << ","
        << "\"visual_color\":"      << JSON::json_quote(visual_color)               << ","
        << "\"visual_radius\":"     << visual_radius                                << ","
        << "\"last_tone_hz\":"      << last_tone_hz                                 << ","
        << "\"last_notification\":";
    if (last_notification) {
        oss << "\"" << NotificationToString(*last_notification) << "\"";
    } else {
        oss << "null";
    }
    oss << ","
        << "\"completed\":"         << (completed ? "true" : "false")               << ","
        << "\"aborted\":"           << (aborted ? "true" : "false")
        << "}";
    return oss.str();
}

// ============== Handlers ==================

void HttpServer_C::handle_get_state(const httplib::Request& req, httplib::Response& res){
    (void)req; //unused
    write_json(res, build_state_json());
}

// handle respond/abort events written by the client
void HttpServer_C::handle_post_event(const httplib::Request& req, httplib::Response& res){
    // Basic content-type check
    auto it = req.headers.find("Content-Type");
    if (it == req.headers.end() || it->second.find("application/json") == std::string::npos) {
        set_cors_headers(res);
        res.status = 415;
        res.set_content("{\"error\":\"content_type\"}", "application/json");
        return;
    }

    UIEvent_E ev = parse_event_action(req.body);
    if (ev == UIEvent_None) {
        set_cors_headers(res);
        res.status = 400;
        res.set_content("{\"error\":\"unknown_action\"}", "application/json");
        return;
    }
    stateStoreRef_.g_last_ui_event.store(ev, std::memory_order_release);

    {
        // held across the call so set_event_handler(nullptr) waits for an in-flight event
        std::lock_guard<std::mutex> lock(handler_mtx_);
        if (!eventHandler_) {
            // nothing running to receive it
            set_cors_headers(res);
            res.status = 409;
            res.set_content("{\"error\":\"no_active_run\"}", "application/json");
            return;
        }
        eventHandler_(ev);
    }
    write_json(res, "{\"ok\":true}");
}

void HttpServer_C::handle_get_log(const httplib::Request& req, httplib::Response& res){
    (void)req;
    std::string body = stateStoreRef_.get_last_log();
    if (body.empty()) {
        set_cors_headers(res);
        res.status = 404;
        res.set_content("{\"error\":\"no_log\"}", "application/json");
        return;
    }
    write_json(res, body);
}

// ===================== Lifecycle ==========================
bool HttpServer_C::http_start_server(){
    logger::tlabel = "HTTP Server";
    if (is_running_.load() || liveServer_) return false;

    liveServer_ = std::make_unique<httplib::Server>(); // listens for requests from the client

    // Route bindings
    liveServer_->Get("/state",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_state(rq, rs); });

    liveServer_->Get("/log",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_log(rq, rs); });

    liveServer_->Post("/event",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_event(rq, rs); });

    // CORS preflight for POSTs
    liveServer_->Options("/event",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_options_and_set(rq, rs); });

    LOG_ALWAYS("HTTP Server successfully opened");
    return true;
}

bool HttpServer_C::http_listen_for_poll_requests(){
    /* goal:
    - blocking function to call from inside server thread in main (main lifecycle of server)
    */
   // 1) check that server object exists
   logger::tlabel = "HTTP Server";
   if(!liveServer_) {
    LOG_ALWAYS("HTTP server not initialized; cannot start listening");
    return false;
   }
   is_running_.store(true, std::memory_order_release);
   LOG_ALWAYS("HTTP listening on 127.0.0.1: " << port_);

   // 2) start listening to client (blocking)
   bool ok = liveServer_->listen("127.0.0.1", port_);
   // 3) handle listen() returning & log
   is_running_.store(false, std::memory_order_release);

   if(!ok){
    LOG_ERR("HTTP listen failed on port " << port_);
   } else {
    LOG_ALWAYS("HTTP listen stopped successfully");
   }
   return ok;
}

bool HttpServer_C::http_close_server(){
    if (!liveServer_) return false;
    liveServer_->stop(); // breaks .listen()
    LOG_ALWAYS("HTTP Server successfully closed");
    return true;
}
