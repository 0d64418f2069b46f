#include "SessionPaths.hpp"
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "Logger.hpp"

#define SESS_LOG(msg) LOG_ALWAYS("sesspaths: " << msg)

namespace paradigmlab {
namespace sesspaths {

std::string ec_str(const std::error_code& ec) {
    if (!ec) return "ok";
    std::ostringstream oss;
    oss << ec.value() << " (" << ec.category().name() << "): " << ec.message();
    return oss.str();
}

std::string sanitize_prefix(std::string s, const std::string& fallback) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))  s.pop_back();

    for (char& c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        const bool ok = (std::isalnum(uc) != 0) || (c == '_') || (c == '-');
        if (!ok) c = '_';
    }

    if (s.empty()) s = fallback;
    return s;
}

std::string timestamp_string(const wall_time_point_T& tp, const char* fmt) {
    const std::time_t t = wall_clock_T::to_time_t(tp);

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

fs::path ensure_directory(const std::string& folder) {
    fs::path p = folder.empty() ? fs::path(".") : fs::path(folder);

    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec || !fs::is_directory(p, ec)) {
        SESS_LOG("ensure_directory: cannot use " << p.string() << " -> " << ec_str(ec) << ", falling back to .");
        return fs::path(".");
    }
    return p;
}

fs::path build_timestamped_path(const std::string& folder,
                                const std::string& prefix,
                                const wall_time_point_T& startWall,
                                const std::string& suffix) {
    const fs::path dir = ensure_directory(folder);

    std::string ext = suffix;
    while (!ext.empty() && ext.front() == '.') ext.erase(ext.begin());

    const std::string name = sanitize_prefix(prefix, "session") + "_" + timestamp_string(startWall) + "." + ext;
    SESS_LOG("build_timestamped_path: " << (dir / name).string());
    return dir / name;
}

bool write_text_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERR("sesspaths: failed to open " << path.string() << " for writing");
        return false;
    }
    out << content;
    out.flush();
    if (!out.good()) {
        LOG_ERR("sesspaths: write failed for " << path.string());
        return false;
    }
    return true;
}

} // namespace sesspaths
} // namespace paradigmlab
