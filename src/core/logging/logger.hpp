#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace toolbridge::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // stdout carries the response protocol, so every diagnostic goes to stderr.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_worker_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            worker_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Tests redirect diagnostics away from the real stderr.
        void set_sink(std::ostream* sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = sink == nullptr ? &std::cerr : sink;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            (*sink_) << "[" << level_to_string(level) << "] "
                     << (worker_id_.empty() ? "" : "[" + worker_id_ + "] ")
                     << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string worker_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) toolbridge::core::logging::Logger::get().log(toolbridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  toolbridge::core::logging::Logger::get().log(toolbridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  toolbridge::core::logging::Logger::get().log(toolbridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) toolbridge::core::logging::Logger::get().log(toolbridge::core::logging::LogLevel::ERROR, msg)

} // namespace toolbridge::core::logging
