/*
 * buildq - Bounded Order-Preserving Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace buildq {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Parses "error", "warn"/"warning", "info", "debug", "trace" (any case).
    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

// Destination for per-job lines emitted by a Scheduler.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void info(const std::string& msg) = 0;
    virtual void warn(const std::string& msg) = 0;
    virtual void error(const std::string& msg) = 0;
};

class NullLogSink final : public LogSink {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
};

// Forwards to the process-wide Logger.
class ConsoleLogSink final : public LogSink {
public:
    void info(const std::string& msg) override { Logger::info(msg); }
    void warn(const std::string& msg) override { Logger::warn(msg); }
    void error(const std::string& msg) override { Logger::error(msg); }
};

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::buildq::Logger::error(msg)
#define LOG_WARN(msg)  ::buildq::Logger::warn(msg)  
#define LOG_INFO(msg)  ::buildq::Logger::info(msg)
#define LOG_DEBUG(msg) ::buildq::Logger::debug(msg)
#define LOG_TRACE(msg) ::buildq::Logger::trace(msg)
