/*
 * File: include/glasses/log.hpp
 * Project: Glasses Controller
 * Purpose: Console logging helpers
 * Notes:
 *  - One line per call on std::cerr, "[LEVEL]: message"
 *  - Safe to call from the streaming duties concurrently
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3,
    off = 4
};

inline std::atomic<LogLevel> &log_threshold()
{
    static std::atomic<LogLevel> level{LogLevel::info};
    return level;
}

inline void set_log_level(LogLevel level) { log_threshold().store(level); }

// Accepts "debug", "info", "warn", "error", "off"; anything else keeps the current level.
inline bool set_log_level(const std::string &name)
{
    if (name == "debug")
        set_log_level(LogLevel::debug);
    else if (name == "info")
        set_log_level(LogLevel::info);
    else if (name == "warn" || name == "warning")
        set_log_level(LogLevel::warn);
    else if (name == "error")
        set_log_level(LogLevel::error);
    else if (name == "off")
        set_log_level(LogLevel::off);
    else
        return false;
    return true;
}

inline const char *log_tag(LogLevel level)
{
    switch (level)
    {
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warn:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    default:
        return "";
    }
}

inline std::mutex &log_mutex()
{
    static std::mutex mtx;
    return mtx;
}

template <typename... Args>
void log_line(LogLevel level, const Args &...args)
{
    if (level < log_threshold().load() || level == LogLevel::off)
        return;
    std::ostringstream oss;
    oss << '[' << log_tag(level) << "]: ";
    (oss << ... << args);
    oss << '\n';

    std::scoped_lock lk(log_mutex());
    std::cerr << oss.str();
}

template <typename... Args>
void log_debug(const Args &...args) { log_line(LogLevel::debug, args...); }

template <typename... Args>
void log_info(const Args &...args) { log_line(LogLevel::info, args...); }

template <typename... Args>
void log_warn(const Args &...args) { log_line(LogLevel::warn, args...); }

template <typename... Args>
void log_error(const Args &...args) { log_line(LogLevel::error, args...); }
