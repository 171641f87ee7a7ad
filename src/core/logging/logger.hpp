#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <mutex>

namespace mcproxy::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Writes to stderr: in serve mode stdout carries the protocol.
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

        // Tags this process's lines with a fresh id like "px-3fa9c01b".
        std::string start_session(const std::string& prefix = "px-") {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<> dis(0, 15);

            std::stringstream ss;
            ss << prefix;
            for (int i = 0; i < 8; ++i) {
                ss << std::hex << dis(gen);
            }
            set_session_id(ss.str());
            return ss.str();
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

        static std::optional<LogLevel> parse_level(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](const unsigned char c) {
                               return static_cast<char>(std::tolower(c));
                           });
            if (text == "debug" || text == "trace") return LogLevel::DEBUG;
            if (text == "info") return LogLevel::INFO;
            if (text == "warn" || text == "warning") return LogLevel::WARN;
            if (text == "error") return LogLevel::ERROR;
            return std::nullopt;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
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
    #define LOG_DEBUG(msg) mcproxy::core::logging::Logger::get().log(mcproxy::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  mcproxy::core::logging::Logger::get().log(mcproxy::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  mcproxy::core::logging::Logger::get().log(mcproxy::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) mcproxy::core::logging::Logger::get().log(mcproxy::core::logging::LogLevel::ERROR, msg)

} // namespace mcproxy::core::logging
