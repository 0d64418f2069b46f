#pragma once
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>
#include "Logger.hpp"

// Small tolerant extractors for flat JSON bodies (config files, POST /event).
// They look a key up by its quoted name and parse the value after the colon;
// nested objects are not understood, which is fine for the flat shapes we accept.
namespace JSON {

// position just past "key": (whitespace skipped), npos if not found
inline std::size_t find_value_start(const std::string& body, const char* key) {
    const std::string quoted = std::string("\"") + key + "\"";
    auto p = body.find(quoted);
    if (p == std::string::npos) return std::string::npos;
    p = body.find(':', p + quoted.size());
    if (p == std::string::npos) return std::string::npos;
    ++p;
    while (p < body.size() && std::isspace(static_cast<unsigned char>(body[p]))) ++p;
    return p;
}

inline bool has_json_key(const std::string& body, const char* key) {
    return body.find(std::string("\"") + key + "\"") != std::string::npos;
}

inline bool extract_json_string(const std::string& body, const char* key, std::string& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos || p >= body.size() || body[p] != '"') return false;
    std::string value;
    for (++p; p < body.size(); ++p) {
        char c = body[p];
        if (c == '"') {
            out = value;
            return true;
        }
        if (c == '\\' && p + 1 < body.size()) {
            char esc = body[++p];
            switch (esc) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default:  value += esc;  break; // \" \\ \/
            }
            continue;
        }
        value += c;
    }
    return false; // unterminated
}

inline bool extract_json_double(const std::string& body, const char* key, double& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos || p >= body.size()) return false;
    const char* begin = body.c_str() + p;
    char* end = nullptr;
    double val = std::strtod(begin, &end);
    if (end == begin) return false;
    out = val;
    return true;
}

inline bool extract_json_int(const std::string& body, const char* key, int& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos) return false;

    bool neg = false;
    if (p < body.size() && body[p] == '-') { neg = true; ++p; }
    int val = 0;
    bool any = false;
    while (p < body.size() && std::isdigit((unsigned char)body[p])) {
        val = val * 10 + (body[p] - '0');
        any = true;
        ++p;
    }
    if (!any) return false;
    // reject 2.5 for an integer field
    if (p < body.size() && (body[p] == '.' || body[p] == 'e' || body[p] == 'E')) return false;
    out = neg ? -val : val;
    return true;
}

inline bool extract_json_bool(const std::string& body, const char* key, bool& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos) return false;
    if (body.compare(p, 4, "true") == 0) { out = true; return true; }
    if (body.compare(p, 5, "false") == 0) { out = false; return true; }
    return false;
}

// [1, 2.5, 3] -> {1.0, 2.5, 3.0}
inline bool extract_json_double_array(const std::string& body, const char* key, std::vector<double>& out) {
    auto p = find_value_start(body, key);
    if (p == std::string::npos || p >= body.size() || body[p] != '[') return false;
    auto q = body.find(']', p);
    if (q == std::string::npos) return false;

    std::vector<double> values;
    std::size_t i = p + 1;
    while (i < q) {
        while (i < q && (std::isspace(static_cast<unsigned char>(body[i])) || body[i] == ',')) ++i;
        if (i >= q) break;
        const char* begin = body.c_str() + i;
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if (end == begin) return false;
        values.push_back(v);
        i += static_cast<std::size_t>(end - begin);
    }
    out = values;
    return true;
}

inline bool extract_json_int_array(const std::string& body, const char* key, std::vector<int>& out) {
    std::vector<double> raw;
    if (!extract_json_double_array(body, key, raw)) return false;
    std::vector<int> values;
    values.reserve(raw.size());
    for (double v : raw) {
        if (static_cast<double>(static_cast<int>(v)) != v) return false;
        values.push_back(static_cast<int>(v));
    }
    out = values;
    return true;
}

// quote + escape for writers that build JSON with ostringstream
inline std::string json_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += ' ';
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

inline void json_extract_fail(const char* context, const char* field)
{
    LOG_ERR("[JSON] extract failed | context="
            << context << " field=" << field);
}

}
