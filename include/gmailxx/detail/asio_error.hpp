/*

asio_error.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <utility>

#include <gmailxx/detail/asio_decl.hpp>
#include <gmailxx/detail/result.hpp>

namespace gmailxx
{

namespace asio_error_detail
{

struct mapping
{
    asio::error_code from;
    error_code to;
};

inline const mapping* find_mapping(const asio::error_code& ec)
{
    static const mapping table[] = {
        {asio::error::connection_refused, error_code::connection_failed},
        {asio::error::host_unreachable, error_code::connection_failed},
        {asio::error::network_unreachable, error_code::connection_failed},
        {asio::error::timed_out, error_code::connection_failed},
        {asio::error::eof, error_code::connection_closed},
        {asio::error::connection_reset, error_code::connection_closed},
        {asio::error::connection_aborted, error_code::connection_closed},
        {asio::error::broken_pipe, error_code::connection_closed},
        {asio::error::host_not_found, error_code::dns_resolution_failed},
        {asio::error::host_not_found_try_again, error_code::dns_resolution_failed},
        // read_until gives up on a full buffer without delimiter
        {asio::error::not_found, error_code::line_too_long},
        {asio::error::message_size, error_code::line_too_long},
    };

    for (const auto& entry : table)
        if (ec == entry.from)
            return &entry;
    return nullptr;
}

} // namespace asio_error_detail


/**
Error of a stream or resolver operation, `socket_error` unless the code has a more specific meaning.
**/
[[nodiscard]] inline error error_from_asio(const asio::error_code& ec)
{
    const auto* found = asio_error_detail::find_mapping(ec);
    return error(found != nullptr ? found->to : error_code::socket_error, ec.message());
}


[[nodiscard]] inline result<std::size_t> to_result(const asio::error_code& ec, std::size_t bytes)
{
    if (ec)
        return fail<std::size_t>(error_from_asio(ec));
    return bytes;
}

} // namespace gmailxx
