#pragma once
#include <ostream>
#include <string>

namespace recload {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Process-wide; lines go to std::cerr unless redirected.
void set_log_level(LogLevel level);
LogLevel log_level();
void set_log_stream(std::ostream* os); // nullptr => std::cerr

// "debug" | "info" | "warn" | "error" (any case). Throws std::invalid_argument.
LogLevel parse_log_level(const std::string& s);

bool log_enabled(LogLevel level);
void log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { log(LogLevel::Error, msg); }

} // namespace recload
