#include "hive/log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace hive {

static std::mutex g_log_mu;

LogLevel log_threshold() {
    const char* env = std::getenv("HIVE_LOG_LEVEL");
    if (!env) return LogLevel::INFO;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "debug") return LogLevel::DEBUG;
    if (val == "warn" || val == "warning") return LogLevel::WARN;
    if (val == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void log_line(LogLevel lvl, const std::string& component, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(log_threshold())) return;
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[" << log_level_name(lvl) << "] [" << component << "] " << msg << "\n";
}

} // namespace hive
