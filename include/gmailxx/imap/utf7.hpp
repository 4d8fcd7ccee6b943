/*

utf7.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Modified UTF-7 of the IMAP mailbox names (RFC 3501, section 5.1.3).

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <gmailxx/detail/result.hpp>

namespace gmailxx::imap
{

namespace utf7_detail
{

inline constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+,";

inline int sextet_value(char ch)
{
    if (ch >= 'A' && ch <= 'Z')
        return ch - 'A';
    if (ch >= 'a' && ch <= 'z')
        return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9')
        return ch - '0' + 52;
    if (ch == '+')
        return 62;
    if (ch == ',')
        return 63;
    return -1;
}

/// Reads one code point, advancing `index`; returns false on malformed input.
inline bool next_code_point(std::string_view text, std::size_t& index, std::uint32_t& cp)
{
    const auto b0 = static_cast<unsigned char>(text[index]);
    std::size_t len = 0;
    std::uint32_t min_cp = 0;
    if (b0 < 0x80)
    {
        cp = b0;
        ++index;
        return true;
    }
    else if ((b0 >> 5) == 0x6)
    {
        len = 2;
        cp = b0 & 0x1F;
        min_cp = 0x80;
    }
    else if ((b0 >> 4) == 0xE)
    {
        len = 3;
        cp = b0 & 0x0F;
        min_cp = 0x800;
    }
    else if ((b0 >> 3) == 0x1E)
    {
        len = 4;
        cp = b0 & 0x07;
        min_cp = 0x10000;
    }
    else
        return false;

    if (index + len > text.size())
        return false;
    for (std::size_t k = 1; k < len; ++k)
    {
        const auto b = static_cast<unsigned char>(text[index + k]);
        if ((b & 0xC0) != 0x80)
            return false;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return false;
    index += len;
    return true;
}

inline void put_code_point(std::uint32_t cp, std::string& out)
{
    if (cp <= 0x7F)
        out += static_cast<char>(cp);
    else if (cp <= 0x7FF)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp <= 0xFFFF)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// Base64 of the UTF-16BE units, without padding.
inline void put_shifted(const std::vector<std::uint16_t>& units, std::string& out)
{
    std::uint32_t accumulator = 0;
    int bits = 0;
    for (std::uint16_t unit : units)
    {
        accumulator = (accumulator << 16) | unit;
        bits += 16;
        while (bits >= 6)
        {
            bits -= 6;
            out += alphabet[(accumulator >> bits) & 0x3F];
        }
        accumulator &= (1u << bits) - 1;
    }
    if (bits > 0)
        out += alphabet[(accumulator << (6 - bits)) & 0x3F];
}

} // namespace utf7_detail

/**
Encoding a UTF-8 mailbox name into modified UTF-7.

@param utf8 Mailbox name.
@return     Encoded name, or `invalid_mailbox` for malformed UTF-8.
**/
[[nodiscard]] inline result<std::string> encode_modified_utf7(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());
    std::vector<std::uint16_t> units;

    auto flush = [&]()
    {
        if (units.empty())
            return;
        out += '&';
        utf7_detail::put_shifted(units, out);
        out += '-';
        units.clear();
    };

    std::size_t index = 0;
    while (index < utf8.size())
    {
        std::uint32_t cp = 0;
        if (!utf7_detail::next_code_point(utf8, index, cp))
            return fail<std::string>(error_code::invalid_mailbox, "Invalid UTF-8 in mailbox name.");

        if (cp >= 0x20 && cp <= 0x7E)
        {
            flush();
            out += static_cast<char>(cp);
            if (cp == '&')
                out += '-';
        }
        else if (cp > 0xFFFF)
        {
            const std::uint32_t value = cp - 0x10000;
            units.push_back(static_cast<std::uint16_t>(0xD800 + (value >> 10)));
            units.push_back(static_cast<std::uint16_t>(0xDC00 + (value & 0x3FF)));
        }
        else
            units.push_back(static_cast<std::uint16_t>(cp));
    }
    flush();
    return out;
}

/**
Decoding a modified UTF-7 mailbox name into UTF-8.

@param mutf7 Encoded mailbox name as sent by the server.
@return      UTF-8 name, or `invalid_mailbox` for a malformed encoding.
**/
[[nodiscard]] inline result<std::string> decode_modified_utf7(std::string_view mutf7)
{
    std::string out;
    out.reserve(mutf7.size());

    std::size_t i = 0;
    while (i < mutf7.size())
    {
        const char ch = mutf7[i];
        if (static_cast<unsigned char>(ch) & 0x80)
            return fail<std::string>(error_code::invalid_mailbox, "Invalid modified UTF-7.");
        if (ch != '&')
        {
            out += ch;
            ++i;
            continue;
        }

        const std::size_t end = mutf7.find('-', i + 1);
        if (end == std::string_view::npos)
            return fail<std::string>(error_code::invalid_mailbox, "Unterminated modified UTF-7 shift.");
        if (end == i + 1)
        {
            out += '&';
            i = end + 1;
            continue;
        }

        std::uint32_t accumulator = 0;
        int bits = 0;
        std::uint16_t high = 0;
        for (std::size_t k = i + 1; k < end; ++k)
        {
            const int value = utf7_detail::sextet_value(mutf7[k]);
            if (value < 0)
                return fail<std::string>(error_code::invalid_mailbox, "Invalid modified UTF-7.");
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits += 6;
            if (bits < 16)
                continue;

            bits -= 16;
            const auto unit = static_cast<std::uint16_t>((accumulator >> bits) & 0xFFFF);
            accumulator &= (1u << bits) - 1;
            if (high != 0)
            {
                if (unit < 0xDC00 || unit > 0xDFFF)
                    return fail<std::string>(error_code::invalid_mailbox, "Invalid surrogate pair.");
                utf7_detail::put_code_point(0x10000 + ((high - 0xD800u) << 10) + (unit - 0xDC00u), out);
                high = 0;
            }
            else if (unit >= 0xD800 && unit <= 0xDBFF)
                high = unit;
            else if (unit >= 0xDC00 && unit <= 0xDFFF)
                return fail<std::string>(error_code::invalid_mailbox, "Invalid surrogate pair.");
            else
                utf7_detail::put_code_point(unit, out);
        }
        if (high != 0 || bits >= 6 || accumulator != 0)
            return fail<std::string>(error_code::invalid_mailbox, "Invalid modified UTF-7.");

        i = end + 1;
    }
    return out;
}

} // namespace gmailxx::imap
