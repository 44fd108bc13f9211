/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace m4brew {

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

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Names the calling thread in log lines ("Main", "Job", ...)
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::m4brew::Logger::error(msg)
#define LOG_WARN(msg)  ::m4brew::Logger::warn(msg)  
#define LOG_INFO(msg)  ::m4brew::Logger::info(msg)
#define LOG_DEBUG(msg) ::m4brew::Logger::debug(msg)
#define LOG_TRACE(msg) ::m4brew::Logger::trace(msg)
