/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <gmailxx/detail/result.hpp>

namespace gmailxx::imap
{

enum class error_kind
{
    tagged_no,
    tagged_bad,
    not_found,
    parse
};

[[nodiscard]] constexpr error_code map_imap_error(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::tagged_no: return error_code::imap_no_response;
        case error_kind::tagged_bad: return error_code::imap_bad_response;
        case error_kind::not_found: return error_code::imap_message_not_found;
        case error_kind::parse: return error_code::invalid_response;
    }
    return error_code::invalid_response;
}

/// Server response part of an IMAP error: `tag command: line`
[[nodiscard]] inline std::string make_imap_detail(std::string_view tag, std::string_view command,
    std::string_view line)
{
    std::string detail;
    detail.append(tag);
    if (!tag.empty())
        detail += ' ';
    detail.append(command);
    detail += ": ";
    detail.append(line);
    return detail;
}

} // namespace gmailxx::imap
