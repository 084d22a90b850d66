#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace cmdgate::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // stderr, so reports printed on stdout stay machine-readable
            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

        // Accepts "debug", "info", "warn", "error"; anything else maps to INFO.
        static LogLevel parse_level(const std::string& text) {
            if (text == "debug") return LogLevel::DEBUG;
            if (text == "warn") return LogLevel::WARN;
            if (text == "error") return LogLevel::ERROR;
            return LogLevel::INFO;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

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
    #define LOG_DEBUG(msg) cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::ERROR, msg)

} // namespace cmdgate::core::logging
