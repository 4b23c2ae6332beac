#pragma once
#include <iostream>
#include <ostream>
#include <string>
#include <mutex>

namespace gemini_mcp::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // stdout carries the JSON-RPC stream, so diagnostics default to stderr.
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

        // The sink must outlive every later log call.
        void set_sink(std::ostream& sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &sink;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        std::ostream* sink_ = &std::cerr;
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
    #define LOG_DEBUG(msg) gemini_mcp::core::logging::Logger::get().log(gemini_mcp::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  gemini_mcp::core::logging::Logger::get().log(gemini_mcp::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  gemini_mcp::core::logging::Logger::get().log(gemini_mcp::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) gemini_mcp::core::logging::Logger::get().log(gemini_mcp::core::logging::LogLevel::ERROR, msg)

} // namespace gemini_mcp::core::logging
