/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Locale independent character helpers for protocol and header text.

*/

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace gmailxx
{
namespace detail
{

[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
{
    return (c | 0x20) >= 'a' && (c | 0x20) <= 'z';
}

[[nodiscard]] constexpr char fold_case(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 0x20) : c;
}

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, {}, fold_case, fold_case);
}

[[nodiscard]] inline std::string to_lower_ascii(std::string_view text)
{
    std::string out(text);
    std::ranges::transform(out, out.begin(), fold_case);
    return out;
}

[[nodiscard]] inline std::string to_upper_ascii(std::string_view text)
{
    std::string out(text);
    std::ranges::transform(out, out.begin(),
        [](char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c & ~0x20) : c; });
    return out;
}

/// Space, tab, CR and LF
[[nodiscard]] constexpr bool is_blank(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

[[nodiscard]] inline std::string_view trim_view(std::string_view text) noexcept
{
    while (!text.empty() && is_blank(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_blank(text.back()))
        text.remove_suffix(1);
    return text;
}

[[nodiscard]] inline std::string trim_copy(std::string_view text)
{
    return std::string(trim_view(text));
}

/// RFC 5322 field name: printable characters except the colon
[[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
{
    return !name.empty() && std::ranges::all_of(name, [](char c) { return c > ' ' && c < 127 && c != ':'; });
}

/// Header values stay on one line: control characters other than tab are refused
[[nodiscard]] inline bool is_valid_header_value(std::string_view value) noexcept
{
    return std::ranges::none_of(value, [](char c)
    {
        const auto u = static_cast<unsigned char>(c);
        return (u < 32 && c != '\t') || u == 127;
    });
}

[[nodiscard]] inline bool is_8bit_string(std::string_view text) noexcept
{
    return std::ranges::any_of(text, [](char c) { return static_cast<unsigned char>(c) > 127; });
}

} // namespace detail
} // namespace gmailxx
