#pragma once

#include <string>

namespace hive {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

// Threshold from HIVE_LOG_LEVEL (debug|info|warn|error). Default: INFO.
LogLevel log_threshold();

const char* log_level_name(LogLevel lvl);

// Writes "[LEVEL] [component] message" to stderr if lvl passes the threshold.
// Lines from concurrent threads are never interleaved.
void log_line(LogLevel lvl, const std::string& component, const std::string& msg);

inline void log_debug(const std::string& component, const std::string& msg) { log_line(LogLevel::DEBUG, component, msg); }
inline void log_info(const std::string& component, const std::string& msg) { log_line(LogLevel::INFO, component, msg); }
inline void log_warn(const std::string& component, const std::string& msg) { log_line(LogLevel::WARN, component, msg); }
inline void log_error(const std::string& component, const std::string& msg) { log_line(LogLevel::ERROR, component, msg); }

} // namespace hive
