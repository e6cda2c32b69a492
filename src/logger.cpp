// =============================================================================
// logger.cpp - Logger Implementation
// =============================================================================

#include "peerlend/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace peerlend {

namespace {

struct LoggerState {
    std::mutex mutex;
    std::ofstream file;
    LogLevel min_level = LogLevel::OFF;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

std::string now_to_string() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

// Basename only, __FILE__ may be absolute
const char* short_file(const char* file) {
    const char* slash = nullptr;
    for (const char* p = file; *p; ++p) {
        if (*p == '/') slash = p;
    }
    return slash ? slash + 1 : file;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off") return LogLevel::OFF;
    throw std::invalid_argument("unknown log level: " + name);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "UNKNOWN";
}

void Logger::init(LogLevel min_level, const std::string& path) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.file.is_open()) s.file.close();
    if (!path.empty()) {
        s.file.open(path, std::ios::out | std::ios::app);
        if (!s.file.is_open()) {
            s.min_level = LogLevel::OFF;
            throw std::runtime_error("Failed to open log file: " + path);
        }
    }
    s.min_level = min_level;
}

void Logger::shutdown() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.min_level = LogLevel::OFF;
    if (s.file.is_open()) s.file.close();
}

bool Logger::enabled(LogLevel level) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return level != LogLevel::OFF && level >= s.min_level;
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level == LogLevel::OFF || level < s.min_level) return;

    std::ostream& out = s.file.is_open() ? static_cast<std::ostream&>(s.file) : std::clog;
    out << now_to_string() << " [" << log_level_name(level) << "] "
        << short_file(file) << ':' << line << " - " << message << '\n';
    out.flush();
}

} // namespace peerlend
