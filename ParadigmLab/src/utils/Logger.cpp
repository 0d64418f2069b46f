#include "Logger.hpp"
#include <chrono>
#include <cstdlib>
#include <string_view>
#include <mutex>
#include <spdlog/spdlog.h>

namespace {
  const auto g_t0 = std::chrono::steady_clock::now();
  std::once_flag g_init_once;
}

namespace logger {
  thread_local const char* tlabel = "main";

  uint64_t ms_since_start() {
    return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_t0).count());
  }

  bool verbose() {
    const char* v = std::getenv("VERBOSE");
    return v && *v && std::string_view(v) != "0";
  }

  void init() {
    std::call_once(g_init_once, [] {
      // Log message format ("pattern")
      spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
      // debug lines are already gated by verbose(), so let them through
      spdlog::set_level(verbose() ? spdlog::level::debug : spdlog::level::info);
    });
  }

  // spdlog's default logger is thread safe, no extra mutex needed here
  void write_info(const std::string& line) {
    init();
    spdlog::info("{}", line);
  }

  void write_debug(const std::string& line) {
    init();
    spdlog::debug("{}", line);
  }

  void write_error(const std::string& line) {
    init();
    spdlog::error("{}", line);
  }
}
