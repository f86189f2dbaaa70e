/**
 * @file logger.hpp
 * @brief Logging utilities for siweauth.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 * Authentication outcomes are logged here; the sink can be replaced by the host
 * application (for example to forward into its own logging framework).
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <chrono>
#include <iostream>
#include <optional>

namespace siweauth {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error };

    /**
     * @brief Parse a log level name ("trace", "debug", "info", "warn", "error").
     * @param name Level name, case-sensitive lowercase
     * @return The level, or std::nullopt for an unknown name
     */
    inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info")  return LogLevel::Info;
        if (name == "warn")  return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        return std::nullopt;
    }

    /**
     * @class Logger
     * @brief Singleton logger class for siweauth.
     *
     * Thread-safe logging with a customizable sink and minimum level.
     * Warnings and errors go to stderr with the default sink, everything else to stdout.
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
        void setLevel(LogLevel lvl) {
            std::scoped_lock lk(m_);
            level_ = lvl;
        }

        LogLevel level() const {
            std::scoped_lock lk(m_);
            return level_;
        }

        /**
         * @brief Replace the sink. Passing an empty function restores the default sink.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = s ? std::move(s) : defaultSink();
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl < level_) return;
            sink_(lvl, msg);
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            return [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
                auto& os = (l >= LogLevel::Warn) ? std::cerr : std::cout;
                os << "[siweauth][" << names[static_cast<int>(l)] << "] " << m << '\n';
            };
        }

        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) ::siweauth::Logger::inst().log(::siweauth::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::siweauth::Logger::inst().log(::siweauth::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::siweauth::Logger::inst().log(::siweauth::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::siweauth::Logger::inst().log(::siweauth::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::siweauth::Logger::inst().log(::siweauth::LogLevel::Error, msg)
}
