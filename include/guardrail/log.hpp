#pragma once

#include <string>
#include <string_view>

namespace guardrail {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

// Local wall clock with millisecond precision, e.g. "2024-05-01 13:45:07.123".
std::string timestamp_now();

// ISO-8601 UTC, used in audit records.
std::string timestamp_utc();

void log(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) { log(LogLevel::Debug, component, message); }
inline void log_info(std::string_view component, std::string_view message) { log(LogLevel::Info, component, message); }
inline void log_warn(std::string_view component, std::string_view message) { log(LogLevel::Warn, component, message); }
inline void log_error(std::string_view component, std::string_view message) { log(LogLevel::Error, component, message); }

} // namespace guardrail
