#pragma once

#include <sstream>
#include <string>

namespace jdata {

// ------------------------------
// Logging
// ------------------------------

enum class LogLevel {
    Error,
    Warn,
    Info,
    Debug,
    Trace,
};

std::string to_string(LogLevel l);
LogLevel log_level_from_string(const std::string& s, LogLevel fallback = LogLevel::Warn);

// The initial level comes from JDATA_LOG_LEVEL (error|warn|info|debug|trace).
LogLevel log_level();
void set_log_level(LogLevel l);
bool log_enabled(LogLevel l);

// Writes "jdata [level] component: message" to stderr.
void log(LogLevel l, const char* component, const std::string& message);

} // namespace jdata

#define JDATA_LOG_AT(level, component, expr)                           \
    do {                                                               \
        if (::jdata::log_enabled(level)) {                             \
            std::ostringstream _jdata_log_oss;                         \
            _jdata_log_oss << expr;                                    \
            ::jdata::log(level, component, _jdata_log_oss.str());      \
        }                                                              \
    } while (0)

#define JDATA_LOG_ERROR(component, expr) JDATA_LOG_AT(::jdata::LogLevel::Error, component, expr)
#define JDATA_LOG_WARN(component, expr) JDATA_LOG_AT(::jdata::LogLevel::Warn, component, expr)
#define JDATA_LOG_INFO(component, expr) JDATA_LOG_AT(::jdata::LogLevel::Info, component, expr)
#define JDATA_LOG_DEBUG(component, expr) JDATA_LOG_AT(::jdata::LogLevel::Debug, component, expr)
