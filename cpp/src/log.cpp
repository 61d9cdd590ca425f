#include "recload/log.h"
#include "recload/format.h"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace recload {

namespace {

std::atomic<int> g_level{(int)LogLevel::Info};
std::mutex g_mu;
std::ostream* g_out = nullptr; // guarded by g_mu

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store((int)level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return (LogLevel)g_level.load(std::memory_order_relaxed);
}

void set_log_stream(std::ostream* os) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_out = os;
}

LogLevel parse_log_level(const std::string& s) {
    std::string v = s;
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "debug" || v == "fine" || v == "finest") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error" || v == "severe") return LogLevel::Error;
    throw std::invalid_argument("unknown log level: " + s);
}

bool log_enabled(LogLevel level) {
    return (int)level >= g_level.load(std::memory_order_relaxed);
}

void log(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;
    const std::string ts = utc_now_iso();
    std::lock_guard<std::mutex> lk(g_mu);
    std::ostream& os = g_out ? *g_out : std::cerr;
    os << "[recload] " << ts << " " << level_tag(level) << " " << msg << "\n";
}

} // namespace recload
