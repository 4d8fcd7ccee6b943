/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <gmailxx/detail/asio_decl.hpp>
#include <gmailxx/detail/asio_error.hpp>
#include <gmailxx/detail/log.hpp>
#include <gmailxx/detail/result.hpp>

namespace gmailxx
{
namespace net
{

/// Longest response line accepted unless configured otherwise, CRLF excluded
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Ceiling of the configurable line length
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Blocking line exchange over a Boost.Asio stream, with the bytes read ahead kept for the next call.

Any type usable with `asio::read` and `asio::write` fits, a TCP socket or one end of a local socket pair.
**/
template<typename Stream>
class dialog
{
public:
    explicit dialog(Stream stream, std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH))
    {
    }

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    /// Tracing still requires the logger tracing switch to be on
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_ = enabled;
    }

    /**
    Writing a line, terminated with CRLF whatever ending it came with.
    **/
    [[nodiscard]] result<std::size_t> write_line(std::string_view line)
    {
        std::string payload = with_crlf(line);
        trace_line(gmailxx::log::direction::send, payload);
        asio::error_code ec;
        const std::size_t bytes = asio::write(stream_, asio::buffer(payload), ec);
        return to_result(ec, bytes);
    }

    /**
    Reading up to the next LF.

    @return Line without its CRLF, or `line_too_long` if it exceeds the maximum length, or the stream error.
    **/
    [[nodiscard]] result<std::string> read_line()
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            asio::error_code ec;
            auto buffer = asio::dynamic_buffer(read_buffer_, max_line_length_ + 2);
            asio::read_until(stream_, buffer, '\n', ec);
            if (ec)
                return fail<std::string>(error_from_asio(ec));
            pos = read_buffer_.find('\n');
            if (pos == std::string::npos)
                return fail<std::string>(error_code::invalid_response, "Line delimiter not found.");
        }

        const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            return fail<std::string>(error_code::line_too_long, "Line exceeds the maximum length.");
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace_line(gmailxx::log::direction::receive, line);
        return line;
    }

    /// Literal of `n` bytes, traced as a single entry
    [[nodiscard]] result<std::string> read_exactly(std::size_t n)
    {
        if (read_buffer_.size() < n)
        {
            asio::error_code ec;
            const std::size_t remaining = n - read_buffer_.size();
            auto buffer = asio::dynamic_buffer(read_buffer_);
            asio::read(stream_, buffer, asio::transfer_exactly(remaining), ec);
            if (ec)
                return fail<std::string>(error_from_asio(ec));
            if (read_buffer_.size() < n)
                return fail<std::string>(error_code::connection_closed, "Stream ended inside a literal.");
        }

        std::string out(read_buffer_.data(), n);
        read_buffer_.erase(0, n);
        trace_line(gmailxx::log::direction::receive, out);
        return out;
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    void max_line_length(std::size_t value) noexcept { max_line_length_ = std::min(value, MAX_ALLOWED_LINE_LENGTH); }
    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }

protected:
    static std::string with_crlf(std::string_view line)
    {
        if (line.ends_with('\n'))
            line.remove_suffix(1);
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        return std::string(line).append("\r\n");
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;

    std::string trace_protocol_{"NET"};
    bool trace_enabled_{true};

    void trace_line(gmailxx::log::direction dir, std::string_view data) const
    {
        auto& logger = gmailxx::log::logger::instance();
        if (!trace_enabled_ || !logger.is_trace_enabled())
            return;
        logger.trace_protocol(trace_protocol_, dir, data);
    }
};

} // namespace net
} // namespace gmailxx
