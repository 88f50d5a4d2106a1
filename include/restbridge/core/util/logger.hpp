/**
 * @file logger.hpp
 * @brief Logging utilities for RestBridge.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <optional>
#include <iostream>

namespace restbridge {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error };

    /**
     * @class Logger
     * @brief Singleton logger class for RestBridge.
     *
     * Provides thread-safe logging with customizable log sinks and log levels.
     * Request handling runs on transport worker threads, so every sink call is serialized.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level.
         * @param lvl LogLevel to set
         */
        void setLevel(LogLevel lvl) { level_ = lvl; }
        LogLevel level() const { return level_; }

        /**
         * @brief Set a custom log sink function.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = std::move(s);
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            if (lvl < level_) return;
            std::scoped_lock lk(m_);
            if (sink_) sink_(lvl, msg);
        }

        /**
         * @brief Parse a level name ("trace", "debug", "info", "warn", "error").
         * @param name Level name, case-sensitive lower-case
         * @return The LogLevel, or std::nullopt for an unknown name
         */
        static std::optional<LogLevel> parseLevel(std::string_view name) {
            if (name == "trace") return LogLevel::Trace;
            if (name == "debug") return LogLevel::Debug;
            if (name == "info")  return LogLevel::Info;
            if (name == "warn")  return LogLevel::Warn;
            if (name == "error") return LogLevel::Error;
            return std::nullopt;
        }

    private:
        Logger() {
            /* default sink → stdout */
            sink_ = [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
                std::cout << "[" << names[static_cast<int>(l)] << "] " << m << '\n';
            };
        }
        std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

    /**
     * @def LOG_TRACE
     * @brief Log a message at TRACE level.
     */
    /**
     * @def LOG_DEBUG
     * @brief Log a message at DEBUG level.
     */
    /**
     * @def LOG_INFO
     * @brief Log a message at INFO level.
     */
    /**
     * @def LOG_WARN
     * @brief Log a message at WARN level.
     */
    /**
     * @def LOG_ERROR
     * @brief Log a message at ERROR level.
     */
#define LOG_TRACE(msg) ::restbridge::Logger::inst().log(::restbridge::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::restbridge::Logger::inst().log(::restbridge::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::restbridge::Logger::inst().log(::restbridge::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::restbridge::Logger::inst().log(::restbridge::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::restbridge::Logger::inst().log(::restbridge::LogLevel::Error, msg)
}
