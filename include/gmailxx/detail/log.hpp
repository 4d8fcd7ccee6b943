/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process wide logger of gmailxx: level filter, optional sink replacing the standard error output, and tracing of the
protocol lines exchanged with the server.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <iterator>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace gmailxx::log
{

enum class level : std::uint8_t
{
    trace,
    debug,
    info,
    warn,
    error,
    off
};

/// Direction of a traced protocol line
enum class direction : std::uint8_t
{
    send,
    receive
};

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    constexpr std::string_view names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "OFF"};
    const auto index = static_cast<std::size_t>(lvl);
    return index < std::size(names) ? names[index] : "UNKNOWN";
}

struct entry
{
    level lvl = level::info;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    /// Set for the protocol trace entries, which have no message
    struct trace_info_t
    {
        direction dir;
        std::string protocol;
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;


/**
Logger singleton, safe to use from several threads.

The entries go to the callback if one is set, otherwise to the standard error output.
**/
class logger
{
public:

    /// Longest traced data kept, the rest is cut
    static constexpr std::size_t MAX_TRACE_LENGTH = 500;

    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    logger(const logger&) = delete;

    logger& operator=(const logger&) = delete;

    /**
    Setting the minimal level of the logged entries, `info` by default.
    **/
    void set_level(level lvl) noexcept
    {
        min_level_.store(lvl, std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return min_level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && lvl >= get_level();
    }

    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        set_callback(nullptr);
    }

    /**
    Switching the protocol tracing, off by default. Traced lines bypass the level filter.
    **/
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current());

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location loc = std::source_location::current());

    /**
    Making traced data printable: cut at `MAX_TRACE_LENGTH`, control characters other than CR and LF masked with a dot,
    trailing line breaks removed.
    **/
    [[nodiscard]] static std::string sanitize_trace(std::string_view data);

private:

    logger() = default;

    void dispatch(const entry& e);

    static void write_stderr(const entry& e);

    std::atomic<level> min_level_{level::info};

    std::atomic<bool> trace_enabled_{false};

    std::mutex mutex_;

    callback_t callback_;
};


/**
Sending the entries to a callback for the lifetime of the object, restoring the default sink, level and tracing switch
afterwards.
**/
class scoped_capture
{
public:

    explicit scoped_capture(callback_t cb, level lvl = level::info)
    {
        auto& lg = logger::instance();
        lg.set_callback(std::move(cb));
        lg.set_level(lvl);
    }

    scoped_capture(const scoped_capture&) = delete;

    scoped_capture& operator=(const scoped_capture&) = delete;

    ~scoped_capture()
    {
        auto& lg = logger::instance();
        lg.clear_callback();
        lg.set_level(level::info);
        lg.set_trace_enabled(false);
    }
};


// Header-only implementation (C++23)

inline void logger::log(level lvl, std::string_view message, std::source_location loc)
{
    if (!is_enabled(lvl))
        return;

    entry e;
    e.lvl = lvl;
    e.timestamp = std::chrono::system_clock::now();
    e.message.assign(message);
    e.location = loc;
    dispatch(e);
}


inline void logger::trace_protocol(std::string_view protocol, direction dir, std::string_view data,
    std::source_location loc)
{
    if (!is_trace_enabled())
        return;

    entry e;
    e.lvl = level::trace;
    e.timestamp = std::chrono::system_clock::now();
    e.location = loc;
    e.trace_info = entry::trace_info_t{dir, std::string(protocol), sanitize_trace(data)};
    dispatch(e);
}


inline std::string logger::sanitize_trace(std::string_view data)
{
    const bool cut = data.size() > MAX_TRACE_LENGTH;
    std::string out(cut ? data.substr(0, MAX_TRACE_LENGTH) : data);

    std::ranges::replace_if(out, [](char c) { return static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n'; },
        '.');
    if (cut)
        return out + "... [truncated]";

    const auto last = out.find_last_not_of("\r\n");
    out.erase(last == std::string::npos ? 0 : last + 1);
    return out;
}


inline void logger::dispatch(const entry& e)
{
    std::lock_guard lock(mutex_);
    if (callback_)
        callback_(e);
    else
        write_stderr(e);
}


inline void logger::write_stderr(const entry& e)
{
    const std::time_t time = std::chrono::system_clock::to_time_t(e.timestamp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::cerr << std::format("gmailxx {:02}:{:02}:{:02}.{:03} ", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms);
    if (e.trace_info)
        std::cerr << e.trace_info->protocol << (e.trace_info->dir == direction::send ? " >> " : " << ")
            << e.trace_info->data << '\n';
    else
        std::cerr << level_to_string(e.lvl) << ' ' << e.message << '\n';
}


#define GMAILXX_LOG(lvl, msg) \
    ::gmailxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define GMAILXX_TRACE(msg)  GMAILXX_LOG(::gmailxx::log::level::trace, msg)
#define GMAILXX_DEBUG(msg)  GMAILXX_LOG(::gmailxx::log::level::debug, msg)
#define GMAILXX_INFO(msg)   GMAILXX_LOG(::gmailxx::log::level::info, msg)
#define GMAILXX_WARN(msg)   GMAILXX_LOG(::gmailxx::log::level::warn, msg)
#define GMAILXX_ERROR(msg)  GMAILXX_LOG(::gmailxx::log::level::error, msg)

#define GMAILXX_TRACE_SEND(protocol, data) \
    ::gmailxx::log::logger::instance().trace_protocol(protocol, ::gmailxx::log::direction::send, data)

#define GMAILXX_TRACE_RECV(protocol, data) \
    ::gmailxx::log::logger::instance().trace_protocol(protocol, ::gmailxx::log::direction::receive, data)

} // namespace gmailxx::log
