#ifndef PEERLEND_LOGGER_HPP
#define PEERLEND_LOGGER_HPP

#include <cstdint>
#include <sstream>
#include <string>

namespace peerlend {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    OFF = 4
};

// "debug", "info", "warning" (or "warn"), "error", "off"; case-insensitive.
// Throws std::invalid_argument on anything else.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// =============================================================================
// Logger - process-wide synchronous log sink
//
// Silent until init() is called. Lines go to the file given to init(), or to
// std::clog when the path is empty:
//   2024-01-31 12:00:00 [INFO] engine.cpp:42 - market created
// =============================================================================

class Logger {
public:
    // Throws std::runtime_error when the log file cannot be opened
    static void init(LogLevel min_level, const std::string& path = "");
    static void shutdown();

    static bool enabled(LogLevel level);
    static void log(LogLevel level, const std::string& message, const char* file, int line);
};

} // namespace peerlend

#define PEERLEND_LOG(level, expr)                                                  \
    do {                                                                           \
        if (::peerlend::Logger::enabled(level)) {                                  \
            std::ostringstream peerlend_log_oss_;                                  \
            peerlend_log_oss_ << expr;                                             \
            ::peerlend::Logger::log(level, peerlend_log_oss_.str(), __FILE__, __LINE__); \
        }                                                                          \
    } while (0)

#define PEERLEND_LOG_DEBUG(expr) PEERLEND_LOG(::peerlend::LogLevel::DEBUG, expr)
#define PEERLEND_LOG_INFO(expr) PEERLEND_LOG(::peerlend::LogLevel::INFO, expr)
#define PEERLEND_LOG_WARNING(expr) PEERLEND_LOG(::peerlend::LogLevel::WARNING, expr)
#define PEERLEND_LOG_ERROR(expr) PEERLEND_LOG(::peerlend::LogLevel::ERROR, expr)

#endif // PEERLEND_LOGGER_HPP
