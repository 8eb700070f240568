/**
 * @file logging.hpp
 * @brief Cellar Logging System
 *
 * Configurable, level-filtered logging for the storage engine.
 * Thread-safe and header-only.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace cellar {

/**
 * Log levels for the Cellar logging system.
 * Ordered from most verbose (DEBUG) to least verbose (OFF).
 */
enum class LogLevel {
    DEBUG = 0,   // Storage traffic, allocator and tree restructuring
    INFO = 1,    // General informational messages
    WARN = 2,    // Warning messages (recoverable issues)
    ERROR = 3,   // Fatal conditions, logged right before throwing
    OFF = 4      // Disable all logging
};

/**
 * Convert LogLevel to string representation.
 */
inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

/**
 * Parse string to LogLevel. Unknown strings map to INFO.
 */
inline LogLevel string_to_log_level(const std::string& str) {
    if (str == "DEBUG" || str == "debug") return LogLevel::DEBUG;
    if (str == "INFO" || str == "info") return LogLevel::INFO;
    if (str == "WARN" || str == "warn" || str == "WARNING" || str == "warning") return LogLevel::WARN;
    if (str == "ERROR" || str == "error") return LogLevel::ERROR;
    if (str == "OFF" || str == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

/**
 * Logger singleton class.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) {
        current_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_level() const {
        return current_level_.load(std::memory_order_relaxed);
    }

    bool is_enabled(LogLevel level) const {
        return level != LogLevel::OFF && level >= current_level_.load(std::memory_order_relaxed);
    }

    void set_show_timestamp(bool show) {
        show_timestamp_.store(show, std::memory_order_relaxed);
    }

    bool show_timestamp() const {
        return show_timestamp_.load(std::memory_order_relaxed);
    }

    void set_show_component(bool show) {
        show_component_.store(show, std::memory_order_relaxed);
    }

    bool show_component() const {
        return show_component_.load(std::memory_order_relaxed);
    }

    /**
     * Log a message at the specified level.
     * All arguments are streamed into one line.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, Args&&... args) {
        if (!is_enabled(level)) {
            return;
        }

        std::ostringstream oss;

        if (show_timestamp_.load(std::memory_order_relaxed)) {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
            oss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S")
                << '.' << std::setfill('0') << std::setw(3) << ms.count() << ' ';
        }

        oss << '[' << log_level_to_string(level) << ']';

        if (show_component_.load(std::memory_order_relaxed) && component && component[0] != '\0') {
            oss << '[' << component << ']';
        }

        oss << ' ';
        ((oss << args), ...);

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << oss.str() << std::endl;
    }

private:
    Logger()
        : current_level_(LogLevel::INFO)
        , show_timestamp_(false)
        , show_component_(true) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> current_level_;
    std::atomic<bool> show_timestamp_;
    std::atomic<bool> show_component_;
    std::mutex mutex_;
};

// ============================================================================
// Convenience functions
// ============================================================================

inline void set_log_level(LogLevel level) {
    Logger::instance().set_level(level);
}

inline void set_log_level(const std::string& level_str) {
    Logger::instance().set_level(string_to_log_level(level_str));
}

inline LogLevel get_log_level() {
    return Logger::instance().get_level();
}

inline bool is_log_enabled(LogLevel level) {
    return Logger::instance().is_enabled(level);
}

inline void set_log_timestamp(bool show) {
    Logger::instance().set_show_timestamp(show);
}

inline void set_log_component(bool show) {
    Logger::instance().set_show_component(show);
}

// ============================================================================
// Logging macros
// ============================================================================

#define CELLAR_LOG_DEBUG(component, ...) \
    do { \
        if (cellar::Logger::instance().is_enabled(cellar::LogLevel::DEBUG)) { \
            cellar::Logger::instance().log(cellar::LogLevel::DEBUG, component, __VA_ARGS__); \
        } \
    } while (0)

#define CELLAR_LOG_INFO(component, ...) \
    do { \
        if (cellar::Logger::instance().is_enabled(cellar::LogLevel::INFO)) { \
            cellar::Logger::instance().log(cellar::LogLevel::INFO, component, __VA_ARGS__); \
        } \
    } while (0)

#define CELLAR_LOG_WARN(component, ...) \
    do { \
        if (cellar::Logger::instance().is_enabled(cellar::LogLevel::WARN)) { \
            cellar::Logger::instance().log(cellar::LogLevel::WARN, component, __VA_ARGS__); \
        } \
    } while (0)

#define CELLAR_LOG_ERROR(component, ...) \
    do { \
        if (cellar::Logger::instance().is_enabled(cellar::LogLevel::ERROR)) { \
            cellar::Logger::instance().log(cellar::LogLevel::ERROR, component, __VA_ARGS__); \
        } \
    } while (0)

// Short-form macros (without component)
#define LOG_DEBUG(...) CELLAR_LOG_DEBUG("", __VA_ARGS__)
#define LOG_INFO(...)  CELLAR_LOG_INFO("", __VA_ARGS__)
#define LOG_WARN(...)  CELLAR_LOG_WARN("", __VA_ARGS__)
#define LOG_ERROR(...) CELLAR_LOG_ERROR("", __VA_ARGS__)

} // namespace cellar
