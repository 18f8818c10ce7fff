#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace wfproc::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Batch workers log from several threads at once.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_workflow_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            workflow_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The stream must outlive the logger or be replaced before it dies.
        void set_sink(std::ostream& sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &sink;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (workflow_id_.empty() ? "" : "[" + workflow_id_ + "] ")
                   << message << std::endl;
        }

        static std::optional<LogLevel> parse_level(const std::string& text) {
            if (text == "debug") return LogLevel::DEBUG;
            if (text == "info") return LogLevel::INFO;
            if (text == "warn") return LogLevel::WARN;
            if (text == "error") return LogLevel::ERROR;
            return std::nullopt;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string workflow_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::clog;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define WFPROC_LOG_DEBUG(msg) wfproc::core::logging::Logger::get().log(wfproc::core::logging::LogLevel::DEBUG, msg)
    #define WFPROC_LOG_INFO(msg)  wfproc::core::logging::Logger::get().log(wfproc::core::logging::LogLevel::INFO, msg)
    #define WFPROC_LOG_WARN(msg)  wfproc::core::logging::Logger::get().log(wfproc::core::logging::LogLevel::WARN, msg)
    #define WFPROC_LOG_ERROR(msg) wfproc::core::logging::Logger::get().log(wfproc::core::logging::LogLevel::ERROR, msg)

} // namespace wfproc::core::logging
