#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace mcptools::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr only: stdout carries the protocol.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_server_name(const std::string& name) {
            std::lock_guard<std::mutex> lock(mutex_);
            server_name_ = name;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            threshold_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(threshold_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (server_name_.empty() ? "" : "[" + server_name_ + "] ")
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        std::string server_name_;
        LogLevel threshold_ = LogLevel::INFO;

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

    #define MCPTOOLS_LOG_DEBUG(msg) mcptools::core::logging::Logger::get().log(mcptools::core::logging::LogLevel::DEBUG, msg)
    #define MCPTOOLS_LOG_INFO(msg)  mcptools::core::logging::Logger::get().log(mcptools::core::logging::LogLevel::INFO, msg)
    #define MCPTOOLS_LOG_WARN(msg)  mcptools::core::logging::Logger::get().log(mcptools::core::logging::LogLevel::WARN, msg)
    #define MCPTOOLS_LOG_ERROR(msg) mcptools::core::logging::Logger::get().log(mcptools::core::logging::LogLevel::ERROR, msg)

} // namespace mcptools::core::logging
