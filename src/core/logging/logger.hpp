#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace crew::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // One logger for the whole process. Records go to stderr so stdout
    // stays free for CLI output.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

        // Accepts "debug", "info", "warn", "error". Returns false otherwise.
        static bool parse_level(const std::string& text, LogLevel& out) {
            if (text == "debug") { out = LogLevel::DEBUG; return true; }
            if (text == "info")  { out = LogLevel::INFO;  return true; }
            if (text == "warn")  { out = LogLevel::WARN;  return true; }
            if (text == "error") { out = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

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

    #define CREW_LOG_DEBUG(msg) crew::core::logging::Logger::get().log(crew::core::logging::LogLevel::DEBUG, msg)
    #define CREW_LOG_INFO(msg)  crew::core::logging::Logger::get().log(crew::core::logging::LogLevel::INFO, msg)
    #define CREW_LOG_WARN(msg)  crew::core::logging::Logger::get().log(crew::core::logging::LogLevel::WARN, msg)
    #define CREW_LOG_ERROR(msg) crew::core::logging::Logger::get().log(crew::core::logging::LogLevel::ERROR, msg)

} // namespace crew::core::logging
