/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Errors of the mail access layer, reported as std::expected (C++23).
throwing.hpp turns them into exceptions for the message accessors.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gmailxx
{

/// Layer an error comes from
enum class error_category : std::uint8_t
{
    none,
    network,
    protocol,
    imap,
    mime,
    input
};

/// Codes grouped by hundreds, one hundred per category
enum class error_code : std::uint16_t
{
    success = 0,

    connection_failed = 100,
    connection_closed = 101,
    dns_resolution_failed = 102,
    socket_error = 103,
    line_too_long = 104,

    invalid_response = 200,
    parse_error = 201,
    invalid_state = 202,

    imap_no_response = 300,
    imap_bad_response = 301,
    imap_mailbox_not_found = 302,
    imap_message_not_found = 303,

    mime_parse_error = 400,
    mime_encoding_error = 401,
    mime_invalid_header = 402,
    mime_missing_boundary = 403,

    invalid_argument = 500,
    invalid_mailbox = 501,
    io_error = 502
};

[[nodiscard]] constexpr error_category category_of(error_code ec) noexcept
{
    switch (static_cast<std::uint16_t>(ec) / 100)
    {
        case 1: return error_category::network;
        case 2: return error_category::protocol;
        case 3: return error_category::imap;
        case 4: return error_category::mime;
        case 5: return error_category::input;
        default: return error_category::none;
    }
}

[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    using enum error_code;
    switch (ec)
    {
        case success: return "Success";
        case connection_failed: return "Connection failed";
        case connection_closed: return "Connection closed";
        case dns_resolution_failed: return "DNS resolution failed";
        case socket_error: return "Socket error";
        case line_too_long: return "Line too long";
        case invalid_response: return "Invalid response";
        case parse_error: return "Parse error";
        case invalid_state: return "Invalid state";
        case imap_no_response: return "IMAP NO response";
        case imap_bad_response: return "IMAP BAD response";
        case imap_mailbox_not_found: return "IMAP mailbox not found";
        case imap_message_not_found: return "IMAP message not found";
        case mime_parse_error: return "MIME parse error";
        case mime_encoding_error: return "MIME encoding error";
        case mime_invalid_header: return "MIME invalid header";
        case mime_missing_boundary: return "MIME missing boundary";
        case invalid_argument: return "Invalid argument";
        case invalid_mailbox: return "Invalid mailbox";
        case io_error: return "I/O error";
    }
    return "Unknown error";
}


/**
Failure of an operation.

The server response carries the offending protocol line for IMAP errors, or the offending input (a file path, a header
name) for the other categories.
**/
class error
{
public:
    error() noexcept = default;

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code))
    {
    }

    error(error_code code, std::string message, std::string server_response = {}) noexcept
        : code_(code), message_(std::move(message)), server_response_(std::move(server_response))
    {
    }

    [[nodiscard]] error_code code() const noexcept
    {
        return code_;
    }

    [[nodiscard]] error_category category() const noexcept
    {
        return category_of(code_);
    }

    [[nodiscard]] const std::string& message() const noexcept
    {
        return message_;
    }

    [[nodiscard]] const std::string& server_response() const noexcept
    {
        return server_response_;
    }

    /**
    Formatting as `Code name: message [server response]`.
    **/
    [[nodiscard]] std::string to_string() const
    {
        std::string out(error_code_to_string(code_));
        if (!message_.empty() && message_ != out)
            out.append(": ").append(message_);
        if (!server_response_.empty())
            out.append(" [").append(server_response_).append("]");
        return out;
    }

private:
    error_code code_ = error_code::success;
    std::string message_;
    std::string server_response_;
};


template<typename T>
using result = std::expected<T, error>;

using result_void = std::expected<void, error>;

[[nodiscard]] inline result_void ok()
{
    return {};
}

template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::in_place, std::forward<T>(value));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message, std::string server_response = {})
{
    return std::unexpected(error(code, std::move(message), std::move(server_response)));
}


// Early return of the error of a result, in functions returning a result themselves.

#define GMAILXX_TRY_VOID(expr) \
    do { \
        auto&& gmailxx_try_result_ = (expr); \
        if (!gmailxx_try_result_) [[unlikely]] \
            return std::unexpected(std::move(gmailxx_try_result_).error()); \
    } while (0)

#define GMAILXX_TRY_ASSIGN(lhs, expr) \
    do { \
        auto&& gmailxx_try_result_ = (expr); \
        if (!gmailxx_try_result_) [[unlikely]] \
            return std::unexpected(std::move(gmailxx_try_result_).error()); \
        lhs = std::move(*gmailxx_try_result_); \
    } while (0)

} // namespace gmailxx
