// utils/SessionPaths.hpp
// -----------------------------------------------------------------------------
// Output file infrastructure
//
// Goal:
//   - Finished logs are written as:
//       <output_folder>/<prefix>_<YYYYmmdd_HHMMSS>.<suffix>
//     where the timestamp is the run's start wall time (not "now").
//   - Output folder is created if missing; if that fails we fall back to "."
//     so a finished run is never lost to a bad folder setting.
//   - Prefix comes from the paradigm name; anything outside [A-Za-z0-9_-]
//     becomes '_'.
// -----------------------------------------------------------------------------

#pragma once
#include <filesystem>
#include <string>
#include <system_error>
#include "Types.h"

namespace paradigmlab {
namespace sesspaths {

namespace fs = std::filesystem;

std::string ec_str(const std::error_code& ec);

// Allowed: [A-Za-z0-9_-]. Everything else becomes '_'. Empty -> fallback.
std::string sanitize_prefix(std::string s, const std::string& fallback);

// Local-time stamp like 20251222_143108
std::string timestamp_string(const wall_time_point_T& tp, const char* fmt = "%Y%m%d_%H%M%S");

// Creates folder (and parents). Returns the folder actually usable.
fs::path ensure_directory(const std::string& folder);

// PUBLIC API
fs::path build_timestamped_path(const std::string& folder,
                                const std::string& prefix,
                                const wall_time_point_T& startWall,
                                const std::string& suffix = "json");

// Writes content to path (truncating). false + log line on failure.
bool write_text_file(const fs::path& path, const std::string& content);

} // namespace sesspaths
} // namespace paradigmlab
