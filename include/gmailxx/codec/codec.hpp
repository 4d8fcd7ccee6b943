/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <climits>
#include <string>
#include <string_view>
#include <stdexcept>
#include <gmailxx/config.hpp>


namespace gmailxx
{


/**
Base of the transfer and header codecs: shared characters, charsets and the line length policies.
**/
class GMAILXX_EXPORT codec
{
public:

    /**
    Value of a hex digit of either case, -1 for any other character.
    **/
    static constexpr int hex_digit_to_int(char digit)
    {
        if (digit >= '0' && digit <= '9')
            return digit - '0';
        const char upper = static_cast<char>(digit & ~0x20);
        if (upper >= 'A' && upper <= 'F')
            return upper - 'A' + 10;
        return -1;
    }

    static constexpr char CR_CHAR = '\r';
    static constexpr char LF_CHAR = '\n';
    static constexpr char PLUS_CHAR = '+';
    static constexpr char SLASH_CHAR = '/';
    static constexpr char EQUAL_CHAR = '=';
    static constexpr char SPACE_CHAR = ' ';
    static constexpr char TAB_CHAR = '\t';
    static constexpr char QUESTION_MARK_CHAR = '?';
    static constexpr char UNDERSCORE_CHAR = '_';

    inline static const std::string END_OF_LINE{"\r\n"};

    inline static const std::string CHARSET_ASCII{"US-ASCII"};

    inline static const std::string CHARSET_UTF8{"UTF-8"};

    /**
    Line length policy; `NONE` disables the length checks of the decoders.
    **/
    enum class line_len_policy_t : std::string::size_type {RECOMMENDED = 78, NONE = UINT_MAX};

    /**
    Encoding of a header text: plain, or one of the encoded word methods.
    **/
    enum class codec_t {ASCII, BASE64, QUOTED_PRINTABLE};

    /**
    @param line1_policy Length policy of the first encoded line.
    @param lines_policy Length policy of the following encoded lines, and of every decoded line.
    **/
    codec(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : line1_policy_(line1_policy), lines_policy_(lines_policy)
    {
    }

    codec(const codec&) = delete;

    codec& operator=(const codec&) = delete;

    virtual ~codec() = default;

protected:

    std::string::size_type line1_policy_;

    std::string::size_type lines_policy_;
};


/**
Error thrown by codecs.
**/
class codec_error : public std::runtime_error
{
public:

    using std::runtime_error::runtime_error;
};


} // namespace gmailxx
