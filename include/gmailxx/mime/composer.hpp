/*

composer.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

#include <gmailxx/codec/base64.hpp>
#include <gmailxx/codec/q_codec.hpp>
#include <gmailxx/detail/ascii.hpp>
#include <gmailxx/detail/asio_decl.hpp>
#include <gmailxx/detail/log.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/mime/attachment_source.hpp>
#include <gmailxx/mime/date_time.hpp>
#include <gmailxx/mime/media_type.hpp>
#include <gmailxx/mime/mime.hpp>


namespace gmailxx
{


/**
Parameters of an outgoing message.
**/
struct compose_options
{
    std::string subject;

    /**
    Recipients, as the raw `To` header value.
    **/
    std::string to;

    std::optional<std::string> cc;

    std::optional<std::string> bcc;

    /**
    Author, as the raw `From` header value.
    **/
    std::optional<std::string> sender;

    std::optional<std::string> reply_to;

    std::string text;

    /**
    Flag if the text is HTML.
    **/
    bool is_html = false;

    std::vector<attachment_source> attachments;

    /**
    Extra headers added to the root. If they carry `Date` or `Message-ID`, these are not generated.
    **/
    mime::headers_t headers;
};


namespace composer_detail
{

inline constexpr auto LINE_POLICY = static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED);

inline long process_id()
{
#ifdef _WIN32
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(::getpid());
#endif
}

inline std::string unique_token()
{
    thread_local std::mt19937_64 rng(std::random_device{}());
    static std::atomic<std::uint64_t> counter{0};
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto cs = std::chrono::duration_cast<std::chrono::milliseconds>(now).count() / 10;
    const std::uint64_t rnd = rng() + ++counter;
    return std::to_string(cs) + "." + std::to_string(process_id()) + "." + std::to_string(rnd);
}

inline std::string make_boundary()
{
    return "=_" + unique_token();
}

/**
Making a `Message-ID` value, like `<171234567890.4242.1234567890123@host>`.
**/
inline std::string make_message_id()
{
    asio::error_code ec;
    std::string host = asio::ip::host_name(ec);
    if (ec || host.empty())
        host = "localhost";
    return "<" + unique_token() + "@" + host + ">";
}

inline std::string to_crlf(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 40);
    for (std::string::size_type i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r'))
            out += '\r';
        out += text[i];
    }
    return out;
}

inline std::string base64_content(std::string_view bytes)
{
    base64 b64(LINE_POLICY, LINE_POLICY);
    std::string out;
    for (const auto& line : b64.encode(bytes))
    {
        if (!out.empty())
            out += codec::END_OF_LINE;
        out += line;
    }
    return out;
}

/**
Text part, `us-ascii` and 7bit for seven bit text, otherwise `utf-8` and Base64.
**/
inline mime make_text_part(const std::string& text, const std::string& subtype)
{
    mime part;
    content_type_t ct("text", subtype);
    if (detail::is_8bit_string(text))
    {
        ct.params["charset"] = "utf-8";
        part.content_type(ct);
        part.content_transfer_encoding(content_transfer_encoding_t::BASE64);
        part.content(base64_content(text));
    }
    else
    {
        ct.params["charset"] = "us-ascii";
        part.content_type(ct);
        part.content_transfer_encoding(content_transfer_encoding_t::BIT7);
        part.content(to_crlf(text));
    }
    return part;
}

inline result<mime> make_attachment_part(const attachment_source& source)
{
    if (source.kind == source_kind::mime_part)
        return source.part;

    std::ifstream file(source.path, std::ios::binary);
    if (!file)
        return fail<mime>(error_code::invalid_argument, "Cannot open attachment.", source.path);
    std::string bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
        return fail<mime>(error_code::invalid_argument, "Cannot read attachment.", source.path);

    mime part;
    part.content_type(guess_media_type(source.path));
    content_disposition_t cd;
    cd.disposition = "attachment";
    cd.params["filename"] = std::filesystem::path(source.path).filename().string();
    part.content_disposition(cd);
    part.content_transfer_encoding(content_transfer_encoding_t::BASE64);
    part.content(base64_content(bytes));
    GMAILXX_DEBUG("compose: attached " + source.path + " (" + std::to_string(bytes.size()) + " bytes)");
    return part;
}

/**
Subject as it goes to the header, Base64 encoded words for eight bit text.
**/
inline std::string encode_subject(const std::string& subject)
{
    if (!detail::is_8bit_string(subject))
        return subject;

    q_codec qc(LINE_POLICY, LINE_POLICY);
    std::string out;
    for (const auto& word : qc.encode(subject, codec::CHARSET_UTF8, codec::codec_t::BASE64))
    {
        if (!out.empty())
            out += ' ';
        out += word;
    }
    return out;
}

inline bool has_header(const mime::headers_t& headers, std::string_view name)
{
    for (const auto& hdr : headers)
        if (detail::iequals_ascii(hdr.first, name))
            return true;
    return false;
}

} // namespace composer_detail


/**
Composing an outgoing message.

Without attachments and HTML the message is a single text part. Otherwise the root is `multipart/mixed` with the text
part first, HTML text wrapped into `multipart/alternative`, followed by one part per attachment.

@param opts Message parameters.
@return     Root of the composed message, `invalid_argument` for an unreadable attachment file or a header value with
            CR or LF.
**/
[[nodiscard]] inline result<mime> compose(const compose_options& opts)
{
    using namespace composer_detail;

    mime root;
    if (!opts.is_html && opts.attachments.empty())
    {
        root = make_text_part(opts.text, "plain");
        if (auto rv = root.add_header("MIME-Version", "1.0"); !rv)
            return fail<mime>(std::move(rv.error()));
    }
    else
    {
        content_type_t mixed("multipart", "mixed");
        mixed.params["boundary"] = make_boundary();
        root.content_type(mixed);
        if (auto rv = root.add_header("MIME-Version", "1.0"); !rv)
            return fail<mime>(std::move(rv.error()));

        if (opts.is_html)
        {
            mime alternative;
            content_type_t alt("multipart", "alternative");
            alt.params["boundary"] = make_boundary();
            alternative.content_type(alt);
            alternative.add_part(make_text_part(opts.text, "html"));
            root.add_part(std::move(alternative));
        }
        else
            root.add_part(make_text_part(opts.text, "plain"));

        for (const auto& source : opts.attachments)
        {
            auto part = make_attachment_part(source);
            if (!part)
                return fail<mime>(std::move(part.error()));
            root.add_part(std::move(*part));
        }
    }

    auto set = [&root](const std::string& name, const std::string& value) { return root.set_header(name, value); };

    result_void rv = set("To", opts.to);
    if (rv && opts.cc)
        rv = set("Cc", *opts.cc);
    if (rv && opts.bcc)
        rv = set("Bcc", *opts.bcc);
    if (rv && opts.sender)
        rv = set("From", *opts.sender);
    if (rv && opts.sender && !opts.reply_to)
        rv = set("Reply-To", *opts.sender);
    if (rv && !has_header(opts.headers, "Date"))
        rv = set("Date", format_date(local_now()));
    if (rv && !has_header(opts.headers, "Message-ID"))
        rv = set("Message-ID", make_message_id());
    if (rv && opts.reply_to)
        rv = set("Reply-To", *opts.reply_to);
    if (rv)
        rv = set("Subject", encode_subject(opts.subject));
    for (const auto& [name, value] : opts.headers)
    {
        if (!rv)
            break;
        rv = set(name, value);
    }
    if (!rv)
        return fail<mime>(std::move(rv.error()));

    GMAILXX_DEBUG("compose: message to " + opts.to + " with " + std::to_string(opts.attachments.size()) +
        " attachment(s)");
    return root;
}


} // namespace gmailxx
