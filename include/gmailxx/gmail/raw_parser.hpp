/*

raw_parser.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Turning one FETCH response entry (header block and raw body) into the fields of a message.

*/


#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <gmailxx/codec/q_codec.hpp>
#include <gmailxx/detail/log.hpp>
#include <gmailxx/detail/regex.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/gmail/attachment.hpp>
#include <gmailxx/imap/utf7.hpp>
#include <gmailxx/mime/date_time.hpp>
#include <gmailxx/mime/mime.hpp>


namespace gmailxx::gmail
{


/**
Fields of a parsed message.
**/
struct parsed_message
{
    /**
    Headers of the root part by name as received, the last one wins.
    **/
    std::map<std::string, std::string> headers;

    /**
    Subject with the encoded words decoded.
    **/
    std::string subject;

    std::optional<std::string> body;

    std::optional<std::string> html;

    std::string to;

    std::string from;

    std::string cc;

    std::string delivered_to;

    date_time_t sent_at;

    std::set<std::string> flags;

    std::set<std::string> labels;

    std::optional<std::string> thread_id;

    std::optional<std::string> message_id;

    std::vector<attachment> attachments;
};


namespace raw_parser_detail
{

inline std::optional<std::string> search_number(const std::string& header_block, const detail::regex& pattern)
{
    detail::smatch match;
    if (!detail::regex_search(header_block, match, pattern))
        return std::nullopt;
    return std::string(match[1].first, match[1].second);
}

} // namespace raw_parser_detail


/**
Parsing the flag list `FLAGS (...)` of a header block.

@param header_block FETCH response text around the body literal.
@return             Flags as sent, empty if there is no flag list.
**/
inline std::set<std::string> parse_flags(const std::string& header_block)
{
    static const detail::regex pattern(R"(FLAGS \(([^)]*)\))");

    std::set<std::string> flags;
    detail::smatch match;
    if (!detail::regex_search(header_block, match, pattern))
        return flags;

    const std::string list(match[1].first, match[1].second);
    std::string::size_type pos = 0;
    while (pos < list.size())
    {
        const auto end = std::min(list.find(' ', pos), list.size());
        if (end > pos)
            flags.insert(list.substr(pos, end - pos));
        pos = end + 1;
    }
    return flags;
}


/**
Parsing the Gmail labels `X-GM-LABELS (...)` of a header block.

Labels are separated by spaces, a quoted label may contain spaces and backslash escapes and is unquoted. Labels
come modified UTF-7 encoded and are decoded to UTF-8; one failing to decode is kept as received.

@param header_block FETCH response text around the body literal.
@return             Labels, empty if there is no label list.
**/
inline std::set<std::string> parse_labels(const std::string& header_block)
{
    static const detail::regex pattern(R"(X-GM-LABELS \()");

    std::set<std::string> labels;
    detail::smatch match;
    if (!detail::regex_search(header_block, match, pattern))
        return labels;

    const std::string_view block = header_block;
    std::string::size_type i = static_cast<std::string::size_type>(match[0].second - header_block.begin());
    while (i < block.size() && block[i] != ')')
    {
        if (block[i] == ' ')
        {
            ++i;
            continue;
        }

        std::string label;
        if (block[i] == '"')
        {
            for (++i; i < block.size() && block[i] != '"'; ++i)
            {
                if (block[i] == '\\' && i + 1 < block.size())
                    ++i;
                label += block[i];
            }
            ++i;
        }
        else
        {
            for (; i < block.size() && block[i] != ' ' && block[i] != ')'; ++i)
                label += block[i];
        }

        if (label.empty())
            continue;
        auto decoded = imap::decode_modified_utf7(label);
        if (!decoded)
        {
            GMAILXX_DEBUG("raw parser: label kept undecoded, " + decoded.error().message());
            labels.insert(std::move(label));
        }
        else
            labels.insert(std::move(*decoded));
    }
    return labels;
}


/**
Gmail thread id `X-GM-THRID <digits>` of a header block, nothing if absent.
**/
inline std::optional<std::string> parse_thread_id(const std::string& header_block)
{
    static const detail::regex pattern(R"(X-GM-THRID (\d+))");
    return raw_parser_detail::search_number(header_block, pattern);
}


/**
Gmail message id `X-GM-MSGID <digits>` of a header block, nothing if absent.
**/
inline std::optional<std::string> parse_message_id(const std::string& header_block)
{
    static const detail::regex pattern(R"(X-GM-MSGID (\d+))");
    return raw_parser_detail::search_number(header_block, pattern);
}


/**
Decoding the encoded words of a subject into one string.

A subject with a malformed encoded word is kept as received.
**/
inline std::string parse_subject(std::string_view subject)
{
    constexpr auto no_policy = static_cast<std::string::size_type>(codec::line_len_policy_t::NONE);
    q_codec qc(no_policy, no_policy);
    try
    {
        return std::get<0>(qc.check_decode(subject));
    }
    catch (const codec_error& exc)
    {
        GMAILXX_WARN(std::string("raw parser: subject kept undecoded, ") + exc.what());
        return std::string(subject);
    }
}


/**
Parsing one FETCH response entry.

@param header_block FETCH response text around the body literal, carrying flags, labels and Gmail ids.
@param raw_body     Raw RFC 822 message.
@return             Parsed fields, or `parse_error` for a missing or bad `Date` header, or the MIME parsing error.
**/
[[nodiscard]] inline result<parsed_message> parse_raw(std::string_view header_block, std::string_view raw_body)
{
    auto root = mime::parse(raw_body);
    if (!root)
        return fail<parsed_message>(std::move(root.error()));

    parsed_message msg;
    for (const auto& [name, value] : root->headers())
        msg.headers[name] = value;

    msg.to = root->header("To").value_or("");
    msg.from = root->header("From").value_or("");
    msg.cc = root->header("Cc").value_or("");
    msg.delivered_to = root->header("Delivered-To").value_or("");
    msg.subject = parse_subject(root->header("Subject").value_or(""));

    if (root->is_multipart())
    {
        std::optional<error> decode_error;
        root->walk([&msg, &decode_error](const mime& part)
        {
            if (decode_error)
                return;
            const bool is_plain = part.content_type().is("text", "plain");
            const bool is_html = part.content_type().is("text", "html");
            if (!is_plain && !is_html)
                return;

            auto text = part.decoded_content();
            if (!text)
            {
                decode_error = std::move(text.error());
                return;
            }
            // The last part of each kind wins.
            if (is_plain)
                msg.body = std::move(*text);
            else
                msg.html = std::move(*text);
        });
        if (decode_error)
            return fail<parsed_message>(std::move(*decode_error));
    }
    else if (root->content_type().is("text"))
        msg.body = root->content();

    const auto date = root->header("Date");
    if (!date)
        return fail<parsed_message>(error_code::parse_error, "Missing Date header.");
    auto sent_at = parse_date(*date);
    if (!sent_at)
        return fail<parsed_message>(std::move(sent_at.error()));
    msg.sent_at = *sent_at;

    const std::string block(header_block);
    msg.flags = parse_flags(block);
    msg.labels = parse_labels(block);
    msg.thread_id = parse_thread_id(block);
    msg.message_id = parse_message_id(block);

    if (root->is_multipart())
    {
        for (const auto& part : root->parts())
        {
            if (part.content_disposition().disposition != "attachment")
                continue;
            auto att = attachment::from_part(part);
            if (!att)
                return fail<parsed_message>(std::move(att.error()));
            if (*att)
                msg.attachments.push_back(std::move(*att));
            else
                GMAILXX_DEBUG("raw parser: dropped empty attachment '" + att->name() + "'");
        }
    }

    return msg;
}


} // namespace gmailxx::gmail
