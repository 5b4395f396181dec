#pragma once

#include <string>
#include <sstream>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include "common/errors.hpp"

namespace event_hub {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL,
    OFF
};

inline LogLevel parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off") return LogLevel::OFF;
    throw ConfigurationError("Unknown log level: " + name);
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogFile(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFile_.open(filename, std::ios::app);
        if (!logFile_.is_open()) {
            throw ConfigurationError("Cannot open log file: " + filename);
        }
    }

    void setLogLevel(LogLevel level) {
        logLevel_ = level;
    }

    LogLevel getLogLevel() const {
        return logLevel_;
    }

    // Console output goes to stderr so stdout stays free for program output
    void setConsoleOutput(bool enabled) {
        consoleOutput_ = enabled;
    }

    bool consoleOutput() const {
        return consoleOutput_;
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF && level >= logLevel_.load();
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, Args&&... args) {
        if (!isEnabled(level)) return;

        std::stringstream ss;
        ss << getCurrentTimestamp() << " "
           << std::setw(7) << std::left << levelToString(level) << " "
           << "[" << baseName(file) << ":" << line << "] ";
        (ss << ... << std::forward<Args>(args)) << std::endl;

        std::lock_guard<std::mutex> lock(mutex_);
        if (consoleOutput_) {
            std::cerr << ss.str();
        }
        if (logFile_.is_open()) {
            logFile_ << ss.str();
            logFile_.flush();
        }
    }

private:
    Logger() : logLevel_(LogLevel::WARNING), consoleOutput_(true) {}
    ~Logger() {
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    static std::string getCurrentTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&now_c, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
        return ss.str();
    }

    static const char* baseName(const char* path) {
        const char* name = path;
        for (const char* p = path; *p; ++p) {
            if (*p == '/') name = p + 1;
        }
        return name;
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE:   return "TRACE";
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR:   return "ERROR";
            case LogLevel::FATAL:   return "FATAL";
            default:                return "UNKNOWN";
        }
    }

    std::mutex mutex_;
    std::ofstream logFile_;
    std::atomic<LogLevel> logLevel_;
    std::atomic<bool> consoleOutput_;
};

#define LOG_TRACE(...) \
    ::event_hub::Logger::getInstance().log(::event_hub::LogLevel::TRACE, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_DEBUG(...) \
    ::event_hub::Logger::getInstance().log(::event_hub::LogLevel::DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_INFO(...) \
    ::event_hub::Logger::getInstance().log(::event_hub::LogLevel::INFO, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARNING(...) \
    ::event_hub::Logger::getInstance().log(::event_hub::LogLevel::WARNING, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...) \
    ::event_hub::Logger::getInstance().log(::event_hub::LogLevel::ERROR, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_FATAL(...) \
    ::event_hub::Logger::getInstance().log(::event_hub::LogLevel::FATAL, __FILE__, __LINE__, __VA_ARGS__)

} // namespace event_hub
