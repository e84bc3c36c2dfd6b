/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for htmlfooter.
Supports multiple log levels, an optional callback and an optional log file.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <boost/algorithm/string/case_conv.hpp>

namespace htmlfooter::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Message dumps (very verbose)
    debug = 1,   ///< Debug information
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

/// Convert level to string
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

/**
Parse a level name as given on the command line.

Accepts the level names above as well as `critical` and `warning`.
**/
[[nodiscard]] inline std::optional<level> parse_level(std::string_view name)
{
    const std::string lower = boost::algorithm::to_lower_copy(std::string(name));
    if (lower == "trace")
        return level::trace;
    if (lower == "debug")
        return level::debug;
    if (lower == "info")
        return level::info;
    if (lower == "warn" || lower == "warning")
        return level::warn;
    if (lower == "error")
        return level::error;
    if (lower == "fatal" || lower == "critical")
        return level::fatal;
    if (lower == "off")
        return level::off;
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

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off &&
            static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /**
    Append default output to the given file instead of stderr.

    @param path Log file, an empty path restores stderr.
    @return     False if the file cannot be opened, stderr stays in use then.
    **/
    bool set_file(const std::string& path)
    {
        std::lock_guard lock(mutex_);
        file_.close();
        file_.clear();
        if (path.empty())
            return true;
        file_.open(path, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    /// Log a message
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
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        const std::string line = std::format("[{:02}:{:02}:{:02}.{:03}] [{}] {}\n",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
            level_to_string(e.lvl), e.message);
        if (file_.is_open())
            file_ << line << std::flush;
        else
            std::cerr << line;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
    std::ofstream file_;
};

// Convenience macros for logging with source location
#define HTMLFOOTER_LOG(lvl, msg) \
    ::htmlfooter::log::logger::instance().log(lvl, msg, std::source_location::current())

#define HTMLFOOTER_TRACE(msg)  HTMLFOOTER_LOG(::htmlfooter::log::level::trace, msg)
#define HTMLFOOTER_DEBUG(msg)  HTMLFOOTER_LOG(::htmlfooter::log::level::debug, msg)
#define HTMLFOOTER_INFO(msg)   HTMLFOOTER_LOG(::htmlfooter::log::level::info, msg)
#define HTMLFOOTER_WARN(msg)   HTMLFOOTER_LOG(::htmlfooter::log::level::warn, msg)
#define HTMLFOOTER_ERROR(msg)  HTMLFOOTER_LOG(::htmlfooter::log::level::error, msg)
#define HTMLFOOTER_FATAL(msg)  HTMLFOOTER_LOG(::htmlfooter::log::level::fatal, msg)

} // namespace htmlfooter::log
