#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>
#include "utils/Types.h"
#include "utils/Logger.hpp"
#include "utils/Errors.hpp"
#include "config/ParadigmConfig.hpp"
#include "shared/StateStore.hpp"
#include "stimulus/HttpServer.hpp"
#include "stimulus/StateStoreSink.hpp"
#include "stimulus/CueDispatcher.hpp"
#include "paradigm/GoNoGoController.hpp"
#include "paradigm/RhythmController.hpp"
#include "log/LogWriter.hpp"
#include "trial/TrialScheduler.hpp"

// Global "please stop" flag: set once the run is over and ctrl+c has been seen
static std::atomic<bool> g_stop{false};
// Interrupt signal sent when ctrl+c is pressed (forwarded to the controller as an abort)
static std::atomic<bool> g_sigint{false};

void handle_sigint(int) {
    g_sigint.store(true, std::memory_order_relaxed);
}

static int port_from_env() {
    const char* v = std::getenv("PARADIGMLAB_PORT");
    if (v == nullptr || *v == '\0') return 7777;
    char* end = nullptr;
    long port = std::strtol(v, &end, 10);
    if (end == v || port <= 0 || port > 65535) {
        LOG_ERR("ignoring bad PARADIGMLAB_PORT=" << v << ", using 7777");
        return 7777;
    }
    return static_cast<int>(port);
}

static void print_usage() {
    LOG_ALWAYS("usage: ParadigmLab <gonogo|rhythm> [config.json]");
}

static void log_metrics(const ExperimentLog_S& log) {
    if (!log.metrics) return;
    auto fmt = [](const std::optional<double>& v) {
        return v ? std::to_string(*v) : std::string("n/a");
    };
    LOG_ALWAYS("metrics: go_hit%=" << fmt(log.metrics->go_hit_percent)
               << " nogo_commission%=" << fmt(log.metrics->nogo_commission_percent)
               << " mean_rt_go_hit=" << fmt(log.metrics->mean_rt_go_hit)
               << " mean_rt_nogo_commission=" << fmt(log.metrics->mean_rt_nogo_commission));
}

// operator preview: chance of each digit showing on any one trial
static void log_digit_preview(const GoNoGoConfig_S& cfg) {
    const auto probs = paradigmlab::trials::digit_probabilities(cfg.go_digits, cfg.nogo_digits, cfg.digit_weights);
    for (int d : cfg.go_digits) {
        LOG_ALWAYS("preview: go digit " << d << " p=" << probs.go[static_cast<std::size_t>(d)]);
    }
    for (int d : cfg.nogo_digits) {
        LOG_ALWAYS("preview: nogo digit " << d << " p=" << probs.nogo[static_cast<std::size_t>(d)]);
    }
}

void http_thread_fn(HttpServer_C& serverRef){
    logger::tlabel = "HTTP Server";
    try {
        serverRef.http_listen_for_poll_requests();
    }
    catch (const std::exception& e) {
        LOG_ERR("http: FATAL unhandled exception: " << e.what());
        g_stop.store(true, std::memory_order_relaxed);
    }
}

template <typename Controller_T>
void paradigm_thread_fn(Controller_T& controller, std::optional<ExperimentLog_S>& result, std::atomic<bool>& done){
    logger::tlabel = "paradigm";
    try {
        result = controller.run();
    }
    catch (const std::exception& e) {
        LOG_ERR("paradigm: FATAL unhandled exception: " << e.what());
    }
    done.store(true, std::memory_order_release);
}

template <typename Controller_T, typename Config_T>
static int run_paradigm(const Config_T& cfg, const std::string& prefix,
                        StateStore_s& stateStore, HttpServer_C& server, CueDispatcher_C& dispatcher) {
    Controller_T controller(cfg, dispatcher, &stateStore);

    server.set_event_handler([&controller](UIEvent_E ev) {
        if (ev == UIEvent_Abort) {
            controller.request_abort(AbortReason_UserAbort);
            return;
        }
        if constexpr (std::is_same_v<Controller_T, GoNoGoController_C>) {
            if (ev == UIEvent_Respond) {
                controller.submit_response();
            }
        }
    });

    std::optional<ExperimentLog_S> result;
    std::atomic<bool> done{false};
    std::thread paradigm(paradigm_thread_fn<Controller_T>, std::ref(controller), std::ref(result), std::ref(done));

    // Poll the flags; keep sleep tiny so ctrl+c feels instant
    while (!done.load(std::memory_order_acquire)) {
        if (g_sigint.load(std::memory_order_relaxed)) {
            controller.request_abort(AbortReason_SignalInterrupt);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    paradigm.join();
    server.set_event_handler(nullptr);
    dispatcher.flush();

    if (!result) {
        return 1;
    }
    const ExperimentLog_S& log = *result;
    stateStore.set_last_log(paradigmlab::logio::serialize_log(log));
    log_metrics(log);
    if (cfg.test_mode) {
        LOG_ALWAYS("test mode: log not written to disk");
    } else if (!paradigmlab::logio::persist_log(log, cfg.output_folder, prefix)) {
        LOG_ERR("log could not be saved; it is still available at GET /log");
    }
    return log.status.completed() ? 0 : 3;
}

int main(int argc, char** argv) {
    logger::init();
    LOG_ALWAYS("start (VERBOSE=" << logger::verbose() << ", version " << SOFTWARE_VERSION << ")");

    if (argc < 2) {
        print_usage();
        return 2;
    }
    const std::string which = argv[1];
    std::string cfgBody;
    if (argc >= 3 && !paradigmlab::config::read_file(argv[2], cfgBody)) {
        return 2;
    }

    std::optional<GoNoGoConfig_S> gonogoCfg;
    std::optional<RhythmConfig_S> rhythmCfg;
    try {
        if (which == "gonogo") {
            gonogoCfg = paradigmlab::config::load_gonogo_json(cfgBody);
            paradigmlab::config::validate(*gonogoCfg);
            log_digit_preview(*gonogoCfg);
        } else if (which == "rhythm") {
            rhythmCfg = paradigmlab::config::load_rhythm_json(cfgBody);
            paradigmlab::config::validate(*rhythmCfg);
        } else {
            print_usage();
            return 2;
        }
    }
    catch (const InvalidConfig_C& e) {
        LOG_ERR(e.what());
        return 2;
    }

    // Shared objects
    StateStore_s stateStore;
    StateStoreSink_C storeSink(stateStore);
    CueDispatcher_C dispatcher(storeSink);
    HttpServer_C server(stateStore, port_from_env());
    server.http_start_server();

    // interrupt caused by SIGINT -> 'handle_sigint' acts like ISR (callback handle)
    std::signal(SIGINT, handle_sigint);

    std::thread http(http_thread_fn, std::ref(server));

    int rc = 0;
    if (gonogoCfg) {
        rc = run_paradigm<GoNoGoController_C>(*gonogoCfg, gonogoCfg->paradigm_name, stateStore, server, dispatcher);
    } else {
        rc = run_paradigm<RhythmController_C>(*rhythmCfg, rhythmCfg->file_prefix, stateStore, server, dispatcher);
    }

    // keep serving GET /log until ctrl+c (a ctrl+c during the run counts too)
    if (!g_sigint.load(std::memory_order_relaxed)) {
        LOG_ALWAYS("run finished; serving /log until ctrl+c");
    }
    while (!g_sigint.load(std::memory_order_relaxed) && !g_stop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds{30});
    }
    g_stop.store(true, std::memory_order_release);

    // on system shutdown:
    server.http_close_server();
    http.join();
    dispatcher.stop();
    return rc;
}
