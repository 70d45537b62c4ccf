#include "../include/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mtx;

void emit(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    switch (level) {
    case LogLevel::Warn:
        std::cerr << "[" << tag << "] WARN: " << msg << std::endl;
        break;
    case LogLevel::Error:
        std::cerr << "[" << tag << "] ERROR: " << msg << std::endl;
        break;
    default:
        std::cout << "[" << tag << "] " << msg << std::endl;
        break;
    }
}
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "off") return LogLevel::Off;
    throw std::invalid_argument("unknown log level: " + s);
}

void log_debug(const std::string& tag, const std::string& msg) { emit(LogLevel::Debug, tag, msg); }
void log_info(const std::string& tag, const std::string& msg) { emit(LogLevel::Info, tag, msg); }
void log_warn(const std::string& tag, const std::string& msg) { emit(LogLevel::Warn, tag, msg); }
void log_error(const std::string& tag, const std::string& msg) { emit(LogLevel::Error, tag, msg); }
