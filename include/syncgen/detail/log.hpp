/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for syncgen.
Supports multiple log levels and an optional callback sink.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace syncgen::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Very verbose
    debug = 1,   ///< Per-account compilation steps
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parses a level name as accepted on the command line
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    if (name == "trace") return level::trace;
    if (name == "debug") return level::debug;
    if (name == "info")  return level::info;
    if (name == "warn" || name == "warning") return level::warn;
    if (name == "error") return level::error;
    if (name == "fatal") return level::fatal;
    if (name == "off")   return level::off;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off
            && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        fmt::print(stderr, "[{:02}:{:02}:{:02}.{:03}] [{}] {}\n",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
            level_to_string(e.lvl), e.message);
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::warn)};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define SYNCGEN_LOG(lvl, msg) \
    ::syncgen::log::logger::instance().log(lvl, msg, std::source_location::current())

#define SYNCGEN_TRACE(msg)  SYNCGEN_LOG(::syncgen::log::level::trace, msg)
#define SYNCGEN_DEBUG(msg)  SYNCGEN_LOG(::syncgen::log::level::debug, msg)
#define SYNCGEN_INFO(msg)   SYNCGEN_LOG(::syncgen::log::level::info, msg)
#define SYNCGEN_WARN(msg)   SYNCGEN_LOG(::syncgen::log::level::warn, msg)
#define SYNCGEN_ERROR(msg)  SYNCGEN_LOG(::syncgen::log::level::error, msg)
#define SYNCGEN_FATAL(msg)  SYNCGEN_LOG(::syncgen::log::level::fatal, msg)

} // namespace syncgen::log
