#include "jdata/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace jdata {

namespace {

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

std::atomic<int>& level_slot() {
    static std::atomic<int> slot{[] {
        const char* env = std::getenv("JDATA_LOG_LEVEL");
        LogLevel l = env ? log_level_from_string(env) : LogLevel::Warn;
        return static_cast<int>(l);
    }()};
    return slot;
}

} // namespace

std::string to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "unknown";
}

LogLevel log_level_from_string(const std::string& s, LogLevel fallback) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "error") return LogLevel::Error;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "info") return LogLevel::Info;
    if (v == "debug") return LogLevel::Debug;
    if (v == "trace") return LogLevel::Trace;
    return fallback;
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel l) {
    level_slot().store(static_cast<int>(l), std::memory_order_relaxed);
}

bool log_enabled(LogLevel l) {
    return static_cast<int>(l) <= level_slot().load(std::memory_order_relaxed);
}

void log(LogLevel l, const char* component, const std::string& message) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << "jdata [" << to_string(l) << "] " << (component ? component : "-")
              << ": " << message << '\n';
}

} // namespace jdata
