/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <gmailxx/codec/codec.hpp>
#include <gmailxx/config.hpp>


namespace gmailxx
{


/**
Base64 codec.
**/
class GMAILXX_EXPORT base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Setting the encoder and decoder line policies.

    Line policies are rounded down to a multiple of four, so that a line never splits an encoded quadruple.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    base64(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy)
    {
        line1_policy_ -= line1_policy_ % SEXTETS_NO;
        lines_policy_ -= lines_policy_ % SEXTETS_NO;
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Encoding a string into vector of Base64 encoded lines by applying the line policy.

    @param text String to encode.
    @return     Vector of Base64 encoded lines, without line terminators.
    **/
    std::vector<std::string> encode(std::string_view text) const
    {
        std::string flat;
        flat.reserve((text.size() + 2) / OCTETS_NO * SEXTETS_NO);

        std::size_t i = 0;
        while (i + OCTETS_NO <= text.size())
        {
            const auto o0 = static_cast<unsigned char>(text[i]);
            const auto o1 = static_cast<unsigned char>(text[i + 1]);
            const auto o2 = static_cast<unsigned char>(text[i + 2]);
            flat += CHARSET[o0 >> 2];
            flat += CHARSET[((o0 & 0x03) << 4) | (o1 >> 4)];
            flat += CHARSET[((o1 & 0x0f) << 2) | (o2 >> 6)];
            flat += CHARSET[o2 & 0x3f];
            i += OCTETS_NO;
        }

        const std::size_t remaining = text.size() - i;
        if (remaining == 1)
        {
            const auto o0 = static_cast<unsigned char>(text[i]);
            flat += CHARSET[o0 >> 2];
            flat += CHARSET[(o0 & 0x03) << 4];
            flat += "==";
        }
        else if (remaining == 2)
        {
            const auto o0 = static_cast<unsigned char>(text[i]);
            const auto o1 = static_cast<unsigned char>(text[i + 1]);
            flat += CHARSET[o0 >> 2];
            flat += CHARSET[((o0 & 0x03) << 4) | (o1 >> 4)];
            flat += CHARSET[(o1 & 0x0f) << 2];
            flat += EQUAL_CHAR;
        }

        std::vector<std::string> enc_text;
        std::string::size_type policy = line1_policy_ == 0 ? flat.size() : line1_policy_;
        std::string::size_type pos = 0;
        while (pos < flat.size())
        {
            enc_text.push_back(flat.substr(pos, policy));
            pos += policy;
            if (lines_policy_ != 0)
                policy = lines_policy_;
        }
        return enc_text;
    }

    /**
    Decoding a vector of Base64 encoded lines to a string.

    Whitespace inside the lines is skipped, decoding stops at the first padding character.

    @param text        Vector of Base64 encoded lines.
    @return            Decoded string.
    @throw codec_error Bad character.
    @throw codec_error Bad line policy.
    **/
    std::string decode(const std::vector<std::string>& text) const
    {
        std::string dec_text;
        unsigned int accumulator = 0;
        int bits = 0;

        for (const auto& line : text)
        {
            if (line.length() > lines_policy_)
                throw codec_error("Bad line policy.");

            for (char ch : line)
            {
                if (ch == EQUAL_CHAR)
                    return dec_text;
                if (ch == SPACE_CHAR || ch == TAB_CHAR || ch == CR_CHAR || ch == LF_CHAR)
                    continue;

                const int value = sextet_value(ch);
                if (value < 0)
                    throw codec_error("Bad character `" + std::string(1, ch) + "`.");

                accumulator = (accumulator << 6) | static_cast<unsigned int>(value);
                bits += 6;
                if (bits >= 8)
                {
                    bits -= 8;
                    dec_text += static_cast<char>((accumulator >> bits) & 0xff);
                }
            }
        }

        return dec_text;
    }

    /**
    Decoding a Base64 string to a string.

    @param text Base64 encoded string.
    @return     Decoded string.
    @throw *    `decode(const std::vector<std::string>&)`.
    **/
    std::string decode(std::string_view text) const
    {
        std::vector<std::string> v;
        v.emplace_back(text);
        return decode(v);
    }

private:

    /**
    Value of a character from the Base64 character set.

    @param ch Character to look up.
    @return   Six bit value, or -1 if the character is not in the set.
    **/
    static int sextet_value(char ch)
    {
        if (ch >= 'A' && ch <= 'Z')
            return ch - 'A';
        if (ch >= 'a' && ch <= 'z')
            return ch - 'a' + 26;
        if (ch >= '0' && ch <= '9')
            return ch - '0' + 52;
        if (ch == PLUS_CHAR)
            return 62;
        if (ch == SLASH_CHAR)
            return 63;
        return -1;
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace gmailxx
