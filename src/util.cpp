#include "util.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <mutex>

namespace {

std::mutex g_log_mutex;
std::atomic<uint64_t> g_request_counter{0};

} // namespace

int64_t now_ms_epoch() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string make_request_id() {
    const uint64_t n = ++g_request_counter;
    return "req-" + std::to_string(now_ms_epoch()) + "-" + std::to_string(n);
}

std::optional<int> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return std::nullopt;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(v);
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

bool getenv_int(const char* name, int* out) {
    if (!out) return false;
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    if (auto parsed = parse_int(v)) {
        *out = *parsed;
        return true;
    }
    return false;
}

bool getenv_double(const char* name, double* out) {
    if (!out) return false;
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    if (auto parsed = parse_double(v)) {
        *out = *parsed;
        return true;
    }
    return false;
}

bool getenv_string(const char* name, std::string* out) {
    if (!out) return false;
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    *out = v;
    return true;
}

std::string sanitize_for_log(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string truncate_for_log(const std::string& s, size_t max_len) {
    std::string cleaned = sanitize_for_log(s);
    if (cleaned.size() <= max_len) return cleaned;
    return cleaned.substr(0, max_len) + "...(" + std::to_string(cleaned.size()) + " bytes)";
}

void log_event(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << now_ms_epoch() << "] " << tag << " " << msg << "\n";
}
