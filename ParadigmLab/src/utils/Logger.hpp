#pragma once
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <string>

namespace logger {
  // Returns ms since program start (steady clock).
  uint64_t ms_since_start();

  // True if VERBOSE env var is set and not "0".
  bool verbose();

  // Per-thread label used in log lines (defaults to "main").
  extern thread_local const char* tlabel;

  // Sets the spdlog pattern/level once. Safe to call more than once.
  void init();

  void write_info(const std::string& line);
  void write_debug(const std::string& line);
  void write_error(const std::string& line);
}

// Pretty simple macros. Line is built in a local stringstream so callers can chain <<.
#define LOG_WRITE_(writer, msg) do { \
  std::ostringstream log_oss_; \
  log_oss_ << "[" << std::setw(6) << logger::ms_since_start() << " ms] " \
           << logger::tlabel << ": " << msg; \
  writer(log_oss_.str()); \
} while(0)

#define LOG_ALWAYS(msg) LOG_WRITE_(logger::write_info, msg)

#define LOG_DBG(msg) do { if (logger::verbose()) LOG_WRITE_(logger::write_debug, msg); } while(0)

#define LOG_ERR(msg) LOG_WRITE_(logger::write_error, msg)
