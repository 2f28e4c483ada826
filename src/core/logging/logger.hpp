#pragma once
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace mcpbridge::core::logging {

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
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_tag_ = tag;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // stdout carries CLI results, so the default sink is stderr.
        // Passing nullptr restores the default.
        void set_sink(std::ostream* sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = sink != nullptr ? sink : &std::cerr;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (session_tag_.empty() ? "" : "[" + session_tag_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_tag_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

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

    // 3. Helper macros used everywhere else
    #define LOG_DEBUG(msg) mcpbridge::core::logging::Logger::get().log(mcpbridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  mcpbridge::core::logging::Logger::get().log(mcpbridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  mcpbridge::core::logging::Logger::get().log(mcpbridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) mcpbridge::core::logging::Logger::get().log(mcpbridge::core::logging::LogLevel::ERROR, msg)

} // namespace mcpbridge::core::logging
