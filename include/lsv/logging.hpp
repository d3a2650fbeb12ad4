/**
 * LSV Inspector - Logging System
 *
 * Provides structured logging with configurable levels.
 * Thread-safe, supports file, console and callback output.
 */

#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <functional>
#include <optional>

namespace lsv {

/**
 * Log severity levels
 */
enum class LogLevel {
    Debug = 0,   // Detailed decoding information
    Info = 1,    // General operational messages
    Warning = 2, // Non-critical issues
    Error = 3,   // Failures returned to the caller
    None = 4     // Disable all logging
};

/**
 * Convert LogLevel to string representation
 */
constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::None:    return "NONE";
        default:                return "UNKNOWN";
    }
}

/**
 * Parse a level name as written in the settings file ("debug", "info", "warning", "error", "none").
 */
inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return std::nullopt;
}

/**
 * Thread-safe logger with level filtering.
 *
 * Starts with console and file output disabled; the decoders may run inside
 * another program, so sinks are opt-in.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Set minimum log level (messages below this level are ignored)
     */
    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    /**
     * Check if a log level is enabled (for macro optimization)
     */
    bool is_enabled(LogLevel level) const {
        return level != LogLevel::None && level >= min_level_.load(std::memory_order_acquire);
    }

    /**
     * Enable/disable console output
     */
    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    /**
     * Set log file path (opens file for appending)
     */
    bool set_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (file_.is_open()) {
            file_.close();
        }

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        file_.open(path, std::ios::app);
        if (file_.is_open()) {
            file_ << "=== LSV Inspector Log - " << timestamp("%Y-%m-%d %H:%M:%S") << " ===\n";
            file_.flush();
        }
        return file_.is_open();
    }

    /**
     * Close log file
     */
    void close_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

    /**
     * Set callback receiving every formatted line
     */
    void set_callback(std::function<void(LogLevel, const std::string&)> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    /**
     * Write one line to every enabled sink
     */
    void write(LogLevel level, std::string_view tag, std::string_view text) {
        if (!is_enabled(level)) return;

        std::string line = format_line(level, tag, text);

        std::lock_guard<std::mutex> lock(mutex_);

        if (console_enabled_) {
            auto& stream = (level == LogLevel::Error) ? std::cerr : std::cout;
            stream << line << std::endl;
        }

        if (file_.is_open()) {
            file_ << line << std::endl;
        }

        if (callback_) {
            callback_(level, line);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (file_.is_open()) {
            file_ << "=== Log End ===\n";
            file_.close();
        }
    }

    static std::string timestamp(const char* pattern) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, pattern);
        return ss.str();
    }

    // HH:MM:SS.mmm [LEVEL] [Tag] text
    static std::string format_line(LogLevel level, std::string_view tag, std::string_view text) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()) % 1000;

        std::ostringstream ss;
        ss << timestamp("%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms.count() << ' '
           << '[' << log_level_string(level) << "] ";
        if (!tag.empty()) {
            ss << '[' << tag << "] ";
        }
        ss << text;
        return ss.str();
    }

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    bool console_enabled_ = false;
    std::ofstream file_;
    std::function<void(LogLevel, const std::string&)> callback_;
};

} // namespace lsv

// Stream-based logging macros - usage: LSV_LOG_INFO("Tag", "message " << value << " more")
#define LSV_LOG_AT(level, tag, msg) \
    do { \
        if (lsv::Logger::instance().is_enabled(level)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            lsv::Logger::instance().write(level, tag, _log_ss.str()); \
        } \
    } while(0)

#define LSV_LOG_DEBUG(tag, msg) LSV_LOG_AT(lsv::LogLevel::Debug, tag, msg)
#define LSV_LOG_INFO(tag, msg) LSV_LOG_AT(lsv::LogLevel::Info, tag, msg)
#define LSV_LOG_WARNING(tag, msg) LSV_LOG_AT(lsv::LogLevel::Warning, tag, msg)
#define LSV_LOG_ERROR(tag, msg) LSV_LOG_AT(lsv::LogLevel::Error, tag, msg)
