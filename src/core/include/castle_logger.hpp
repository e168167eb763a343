#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace castle {

/**
 * @brief Logging levels for castlegen
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe diagnostic logger
 *
 * Lines go to stderr (stdout carries the CLI's tokens) and optionally
 * to an append-mode file. Nothing the codec logs feeds back into the
 * generated bytes.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    /// Append to path in addition to the console; false if it cannot be opened
    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void log(LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_ || level == LogLevel::NONE) return;

        const std::string line = formatMessage(level, msg);
        if (console_enabled_) {
            std::cerr << line << std::endl;
        }
        if (file_.is_open()) {
            file_ << line << std::endl;
        }
    }

    /// Parse a log.level value; unknown names mean INFO
    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none")  return LogLevel::NONE;
        return LogLevel::INFO;
    }

private:
    Logger() = default;

    // Called with mtx_ held, which also serializes std::localtime
    std::string formatMessage(LogLevel level, const std::string& msg) const {
        const auto now = std::chrono::system_clock::now();
        const auto t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << std::put_time(std::localtime(&t), "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelName(level) << "] " << msg;
        return oss.str();
    }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

    LogLevel level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

#define CASTLE_LOG_DEBUG(msg) castle::Logger::instance().log(castle::LogLevel::DEBUG, msg)
#define CASTLE_LOG_WARN(msg)  castle::Logger::instance().log(castle::LogLevel::WARN, msg)
#define CASTLE_LOG_ERROR(msg) castle::Logger::instance().log(castle::LogLevel::ERROR, msg)

} // namespace castle
