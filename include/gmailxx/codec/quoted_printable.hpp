/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <gmailxx/codec/codec.hpp>
#include <gmailxx/config.hpp>


namespace gmailxx
{


/**
Quoted Printable decoder.

In the Q codec mode (RFC 2047 encoded words) the underscore stands for a space.
**/
class GMAILXX_EXPORT quoted_printable : public codec
{
public:

    quoted_printable(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy), q_codec_mode_(false)
    {
    }

    quoted_printable(const quoted_printable&) = delete;

    quoted_printable(quoted_printable&&) = delete;

    ~quoted_printable() = default;

    void operator=(const quoted_printable&) = delete;

    void operator=(quoted_printable&&) = delete;

    /**
    Decoding a quoted printable text.

    Soft line breaks are removed, hard line breaks are kept as they are in the input.

    @param text Quoted printable text.
    @return     Decoded string.
    **/
    std::string decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size());

        std::string::size_type i = 0;
        while (i < text.size())
        {
            const char ch = text[i];
            if (ch == UNDERSCORE_CHAR && q_codec_mode_)
            {
                dec_text += SPACE_CHAR;
                ++i;
                continue;
            }
            if (ch != EQUAL_CHAR)
            {
                dec_text += ch;
                ++i;
                continue;
            }

            // Soft line break, optionally preceded by trailing whitespace.
            std::string::size_type j = i + 1;
            while (j < text.size() && (text[j] == SPACE_CHAR || text[j] == TAB_CHAR))
                ++j;
            if (j == text.size())
            {
                i = j;
                continue;
            }
            if (text[j] == LF_CHAR)
            {
                i = j + 1;
                continue;
            }
            if (text[j] == CR_CHAR && j + 1 < text.size() && text[j + 1] == LF_CHAR)
            {
                i = j + 2;
                continue;
            }

            if (i + 2 < text.size())
            {
                const int hi = hex_digit_to_int(text[i + 1]);
                const int lo = hex_digit_to_int(text[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    dec_text += static_cast<char>((hi << 4) | lo);
                    i += 3;
                    continue;
                }
            }

            // Malformed escape, kept literally.
            dec_text += ch;
            ++i;
        }

        return dec_text;
    }

    /**
    Enabling or disabling the Q codec mode.

    @param mode True to enable, false to disable.
    **/
    void q_codec_mode(bool mode)
    {
        q_codec_mode_ = mode;
    }

    /**
    Returning the Q codec mode.

    @return True if enabled, false if disabled.
    **/
    bool q_codec_mode() const
    {
        return q_codec_mode_;
    }

private:

    /**
    Flag for the Q codec mode.
    **/
    bool q_codec_mode_;
};


} // namespace gmailxx
