#pragma once
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace toolbridge::core::logging {

    // 1. Log levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Unrecognized names fall back to INFO.
    inline LogLevel parse_log_level(const std::string& name) {
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "warn") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    // 2. Global logger
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_instance_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            instance_id_ = id;
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
            if (level < min_level_) {
                return;
            }

            std::ostream& out =
                (level == LogLevel::WARN || level == LogLevel::ERROR) ? std::cerr : std::cout;
            out << timestamp() << " [" << level_to_string(level) << "] "
                << (instance_id_.empty() ? "" : "[" + instance_id_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string instance_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string timestamp() {
            const std::time_t now =
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            gmtime_r(&now, &utc);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return buffer;
        }

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
