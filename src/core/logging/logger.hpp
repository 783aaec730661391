#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace gitmcp::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info")  return LogLevel::INFO;
        if (text == "warn")  return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Writes to stderr: stdout is reserved for tool responses.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_call_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            call_id_ = id;
        }

        void clear_call_id() {
            std::lock_guard<std::mutex> lock(mutex_);
            call_id_.clear();
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (call_id_.empty() ? "" : "[" + call_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string call_id_;
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

    // 3. Helper macros
    #define GITMCP_LOG_DEBUG(msg) gitmcp::core::logging::Logger::get().log(gitmcp::core::logging::LogLevel::DEBUG, msg)
    #define GITMCP_LOG_INFO(msg)  gitmcp::core::logging::Logger::get().log(gitmcp::core::logging::LogLevel::INFO, msg)
    #define GITMCP_LOG_WARN(msg)  gitmcp::core::logging::Logger::get().log(gitmcp::core::logging::LogLevel::WARN, msg)
    #define GITMCP_LOG_ERROR(msg) gitmcp::core::logging::Logger::get().log(gitmcp::core::logging::LogLevel::ERROR, msg)

} // namespace gitmcp::core::logging
