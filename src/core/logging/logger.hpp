#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace toolhub::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr so stdout stays free for
    // command output.
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

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << timestamp() << " [" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& out) {
            if (text == "debug") { out = LogLevel::DEBUG; return true; }
            if (text == "info")  { out = LogLevel::INFO;  return true; }
            if (text == "warn")  { out = LogLevel::WARN;  return true; }
            if (text == "error") { out = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            std::tm local{};
            localtime_r(&seconds, &local);
            std::ostringstream out;
            out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return out.str();
        }

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

    #define LOG_DEBUG(msg) toolhub::core::logging::Logger::get().log(toolhub::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  toolhub::core::logging::Logger::get().log(toolhub::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  toolhub::core::logging::Logger::get().log(toolhub::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) toolhub::core::logging::Logger::get().log(toolhub::core::logging::LogLevel::ERROR, msg)

} // namespace toolhub::core::logging
