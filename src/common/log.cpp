// src/common/log.cpp
#include "papermake/common/log.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace papermake {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_output_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: break;
    }
    return "";
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel get_log_level() {
    return g_level.load();
}

LogLevel parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off") return LogLevel::OFF;
    throw std::invalid_argument("Unknown log level '" + std::string(name) + "'");
}

void log(LogLevel level, std::string_view message) {
    if (level == LogLevel::OFF || level < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << "[" << level_tag(level) << "] " << message << std::endl;
}

} // namespace papermake
