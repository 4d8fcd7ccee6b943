/*

q_codec.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <string_view>
#include <vector>
#include <tuple>
#include <boost/algorithm/string.hpp>
#include <gmailxx/codec/codec.hpp>
#include <gmailxx/codec/base64.hpp>
#include <gmailxx/codec/quoted_printable.hpp>
#include <gmailxx/config.hpp>


namespace gmailxx
{


/**
Q codec, the RFC 2047 encoded words of the header values.

Encoded words are decoded to their bytes, the charsets ISO-8859-1 and its aliases are converted to UTF-8.
**/
class GMAILXX_EXPORT q_codec : public codec
{
public:

    /**
    Setting the encoder and decoder line policies.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    q_codec(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy)
    {
    }

    q_codec(const q_codec&) = delete;

    q_codec(q_codec&&) = delete;

    ~q_codec() = default;

    void operator=(const q_codec&) = delete;

    void operator=(q_codec&&) = delete;

    /**
    Encoding a text into a sequence of encoded words.

    @param text        String to encode.
    @param charset     Charset used by the string.
    @param method      Encoding method, only Base64 is supported.
    @return            Encoded words, one per line.
    @throw codec_error Bad encoding method.
    **/
    std::vector<std::string> encode(std::string_view text, const std::string& charset, codec_t method) const
    {
        if (method != codec_t::BASE64)
            throw codec_error("Bad encoding method.");

        const std::string prefix = "=?" + boost::to_upper_copy(charset) + "?" + BASE64_CODEC_STR + "?";
        const std::string::size_type flags_len = prefix.size() + 2;
        auto reduce = [flags_len](std::string::size_type policy)
        {
            return policy > flags_len + 4 ? policy - flags_len : std::string::size_type{4};
        };

        base64 b64(reduce(line1_policy_), reduce(lines_policy_));
        std::vector<std::string> enc_text;
        for (const auto& line : b64.encode(text))
            enc_text.push_back(prefix + line + "?=");
        return enc_text;
    }

    /**
    Decoding the content of a single encoded word, the part between `=?` and `?=`.

    @param text        Encoded word without the delimiters, like `UTF-8?B?SGk=`.
    @return            Decoded string, its charset and its codec method.
    @throw codec_error Missing Q codec separator for codec type.
    @throw codec_error Missing Q codec charset.
    @throw codec_error Missing last Q codec separator.
    @throw codec_error Bad encoding method.
    @throw *           `base64::decode(std::string_view)`.
    **/
    std::tuple<std::string, std::string, codec_t> decode(std::string_view text) const
    {
        std::string::size_type method_pos = text.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string_view::npos)
            throw codec_error("Missing Q codec separator for codec type.");
        std::string charset = boost::to_upper_copy(std::string(text.substr(0, method_pos)));
        // RFC 2231 language suffix.
        std::string::size_type star_pos = charset.find('*');
        if (star_pos != std::string::npos)
            charset.erase(star_pos);
        if (charset.empty())
            throw codec_error("Missing Q codec charset.");
        std::string::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos)
            throw codec_error("Missing last Q codec separator.");
        std::string method(text.substr(method_pos + 1, content_pos - method_pos - 1));
        std::string_view text_c = text.substr(content_pos + 1);

        if (boost::iequals(method, BASE64_CODEC_STR))
        {
            base64 b64(line1_policy_, lines_policy_);
            return std::make_tuple(b64.decode(text_c), charset, codec_t::BASE64);
        }
        if (boost::iequals(method, QP_CODEC_STR))
        {
            quoted_printable qp(line1_policy_, lines_policy_);
            qp.q_codec_mode(true);
            return std::make_tuple(qp.decode(text_c), charset, codec_t::QUOTED_PRINTABLE);
        }
        throw codec_error("Bad encoding method.");
    }

    /**
    Decoding all encoded words of a header value.

    Whitespace between two adjacent encoded words is dropped, text outside of encoded words is kept as it is. A
    sequence starting with `=?` that does not form an encoded word is kept literally.

    @param text String to decode.
    @return     Decoded string, the charset of the last encoded word and its codec method.
    @throw *    `decode(std::string_view)`.
    **/
    std::tuple<std::string, std::string, codec_t> check_decode(std::string_view text) const
    {
        std::string dec_text;
        std::string charset = CHARSET_ASCII;
        codec_t method_type = codec_t::ASCII;
        std::string pending_space;
        bool after_word = false;

        std::string::size_type pos = 0;
        while (pos < text.size())
        {
            const std::string::size_type end = find_word_end(text, pos);
            if (end == std::string_view::npos)
            {
                if (text[pos] == SPACE_CHAR || text[pos] == TAB_CHAR || text[pos] == CR_CHAR || text[pos] == LF_CHAR)
                {
                    if (after_word)
                        pending_space += text[pos];
                    else
                        dec_text += text[pos];
                }
                else
                {
                    dec_text += pending_space;
                    pending_space.clear();
                    after_word = false;
                    dec_text += text[pos];
                }
                ++pos;
                continue;
            }

            pending_space.clear();
            auto word = decode(text.substr(pos + 2, end - pos - 2));
            charset = std::get<1>(word);
            method_type = std::get<2>(word);
            dec_text += to_utf8(std::get<0>(word), charset);
            after_word = true;
            pos = end + 2;
        }
        dec_text += pending_space;

        return std::make_tuple(dec_text, charset, method_type);
    }

    /**
    Converting a decoded text to UTF-8 if its charset is a known single byte one.

    @param text    Decoded bytes.
    @param charset Upper case charset name.
    @return        UTF-8 text, or the bytes unchanged for other charsets.
    **/
    static std::string to_utf8(const std::string& text, const std::string& charset)
    {
        if (charset != "ISO-8859-1" && charset != "LATIN1" && charset != "ISO_8859-1" && charset != "L1")
            return text;

        std::string out;
        out.reserve(text.size() * 2);
        for (char ch : text)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (c < 0x80)
                out += ch;
            else
            {
                out += static_cast<char>(0xC0 | (c >> 6));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
        }
        return out;
    }

private:

    /**
    String representation of Base64 method.
    **/
    inline static const std::string BASE64_CODEC_STR{"B"};

    /**
    String representation of Quoted Printable method.
    **/
    inline static const std::string QP_CODEC_STR{"Q"};

    /**
    Finding the end of an encoded word starting at the given position.

    @param text Header value.
    @param pos  Position to check for the `=?` delimiter.
    @return     Position of the closing `?=`, or `npos` if no encoded word starts at `pos`.
    **/
    static std::string::size_type find_word_end(std::string_view text, std::string::size_type pos)
    {
        if (pos + 1 >= text.size() || text[pos] != EQUAL_CHAR || text[pos + 1] != QUESTION_MARK_CHAR)
            return std::string_view::npos;

        const std::string::size_type method_pos = text.find(QUESTION_MARK_CHAR, pos + 2);
        if (method_pos == std::string_view::npos || method_pos == pos + 2)
            return std::string_view::npos;
        const std::string::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos != method_pos + 2)
            return std::string_view::npos;
        const std::string::size_type end = text.find("?=", content_pos + 1);
        if (end == std::string_view::npos)
            return std::string_view::npos;
        for (std::string::size_type i = pos + 2; i < end; ++i)
            if (text[i] == SPACE_CHAR || text[i] == TAB_CHAR)
                return std::string_view::npos;
        return end;
    }
};


} // namespace gmailxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
