/*

mime.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <algorithm>
#include <charconv>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gmailxx/codec/base64.hpp>
#include <gmailxx/codec/q_codec.hpp>
#include <gmailxx/codec/quoted_printable.hpp>
#include <gmailxx/detail/ascii.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/config.hpp>


namespace gmailxx
{


/**
Parameters of a structured header, names in lower case.
**/
typedef std::map<std::string, std::string> mime_params_t;


/**
Content type of a MIME part, like `text/plain; charset="utf-8"`.
**/
struct GMAILXX_EXPORT content_type_t
{
    /**
    Top level type in lower case.
    **/
    std::string type = "text";

    /**
    Subtype in lower case.
    **/
    std::string subtype = "plain";

    mime_params_t params;

    content_type_t() = default;

    content_type_t(std::string type_, std::string subtype_)
        : type(detail::to_lower_ascii(type_)), subtype(detail::to_lower_ascii(subtype_))
    {
    }

    /**
    Returning the media type as `type/subtype`.
    **/
    std::string media_type() const
    {
        return type + "/" + subtype;
    }

    /**
    Checking the type and, if given, the subtype, case insensitive.
    **/
    bool is(std::string_view type_, std::string_view subtype_ = {}) const
    {
        return detail::iequals_ascii(type, type_) && (subtype_.empty() || detail::iequals_ascii(subtype, subtype_));
    }

    /**
    Returning a parameter value, empty if absent.

    @param name Parameter name in lower case.
    **/
    std::string param(const std::string& name) const
    {
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    }

    std::string to_string() const;

    /**
    Parsing a Content-Type header value.

    A value without the `type/subtype` form is treated as `text/plain`, as RFC 2045 requires.

    @param value Header value.
    @return      Parsed content type.
    **/
    static content_type_t parse(std::string_view value);
};


/**
Content disposition of a MIME part, like `attachment; filename="a.pdf"`.
**/
struct GMAILXX_EXPORT content_disposition_t
{
    /**
    Disposition type in lower case, empty if the part has no disposition.
    **/
    std::string disposition;

    mime_params_t params;

    std::string param(const std::string& name) const
    {
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    }

    std::string to_string() const;

    static content_disposition_t parse(std::string_view value);
};


/**
Content transfer encodings.
**/
enum class content_transfer_encoding_t {NONE, BIT7, BIT8, BASE64, QUOTED_PRINTABLE, BINARY};


/**
One node of a MIME tree.

The node keeps its headers in the received order, with the structured ones (content type, disposition, transfer
encoding) also available in parsed form. The content is kept as received; `decoded_content()` removes the transfer
encoding. Multipart nodes and `message/rfc822` nodes have child parts.
**/
class GMAILXX_EXPORT mime
{
public:

    typedef std::pair<std::string, std::string> header_t;

    typedef std::vector<header_t> headers_t;

    inline static const std::string CONTENT_TYPE_HEADER{"Content-Type"};

    inline static const std::string CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};

    inline static const std::string CONTENT_DISPOSITION_HEADER{"Content-Disposition"};

    /**
    Maximum nesting of parts accepted by the parser.
    **/
    static constexpr unsigned MAX_DEPTH = 64;

    mime() = default;

    mime(const mime&) = default;

    mime(mime&&) = default;

    ~mime() = default;

    mime& operator=(const mime&) = default;

    mime& operator=(mime&&) = default;

    /**
    Parsing raw RFC 822 bytes into a MIME tree.

    Both CRLF and bare LF line endings are accepted. A line in the header block which is neither a header nor a
    continuation ends the header block.

    @param raw Raw message.
    @return    Root of the tree, or `mime_missing_boundary` for a multipart without boundary, `mime_parse_error` for a
               multipart whose boundary never occurs or for too deep nesting, `mime_invalid_header` for a continuation
               line without a header.
    **/
    [[nodiscard]] static result<mime> parse(std::string_view raw);

    /**
    Formatting the tree to CRLF terminated bytes.

    @return Formatted headers, empty line and content or parts.
    **/
    std::string format() const;

    const headers_t& headers() const
    {
        return headers_;
    }

    /**
    Value of the last header with the given name, compared case insensitive.

    @param name Header name.
    @return     Header value or nothing if there is no such header.
    **/
    std::optional<std::string> header(std::string_view name) const;

    /**
    Adding a header after the existing ones.

    @param name  Header name.
    @param value Header value.
    @return      `invalid_argument` if the name or value is not valid.
    **/
    [[nodiscard]] result_void add_header(const std::string& name, const std::string& value);

    /**
    Replacing all headers of the given name by a single one, or adding it if there is none.
    **/
    [[nodiscard]] result_void set_header(const std::string& name, const std::string& value);

    void remove_header(std::string_view name);

    const content_type_t& content_type() const
    {
        return content_type_;
    }

    void content_type(const content_type_t& ct);

    const content_disposition_t& content_disposition() const
    {
        return content_disposition_;
    }

    void content_disposition(const content_disposition_t& cd);

    content_transfer_encoding_t content_transfer_encoding() const
    {
        return encoding_;
    }

    void content_transfer_encoding(content_transfer_encoding_t encoding);

    bool is_multipart() const
    {
        return content_type_.is("multipart");
    }

    /**
    Content as received, transfer encoding not removed.
    **/
    const std::string& content() const
    {
        return content_;
    }

    void content(std::string text)
    {
        content_ = std::move(text);
    }

    /**
    Content with the transfer encoding removed.

    @return Decoded bytes, or `mime_encoding_error` if Base64 content is malformed.
    **/
    [[nodiscard]] result<std::string> decoded_content() const;

    /**
    File name of the part.

    Taken from the `filename` disposition parameter, or the `name` content type parameter. RFC 2231 parameters and
    RFC 2047 encoded words are decoded.

    @return File name, empty if the part has none.
    **/
    std::string filename() const;

    const std::vector<mime>& parts() const
    {
        return parts_;
    }

    void add_part(mime part)
    {
        parts_.push_back(std::move(part));
    }

    /**
    Visiting this node and then all descendants, depth first.

    @param visitor Callable taking `const mime&`.
    **/
    template<typename Visitor>
    void walk(Visitor&& visitor) const
    {
        visitor(*this);
        for (const auto& part : parts_)
            part.walk(visitor);
    }

private:

    static result<mime> parse_node(std::string_view raw, unsigned depth);

    /**
    Updating the parsed form of a structured header.
    **/
    void refresh_structured(const std::string& name, const std::string& value);

    void set_header_unchecked(const std::string& name, const std::string& value);

    headers_t headers_;

    content_type_t content_type_;

    content_disposition_t content_disposition_;

    content_transfer_encoding_t encoding_ = content_transfer_encoding_t::NONE;

    std::string content_;

    std::vector<mime> parts_;
};


namespace mime_detail
{

inline constexpr auto NO_POLICY = static_cast<std::string::size_type>(codec::line_len_policy_t::NONE);

inline std::string quote_param(std::string_view value)
{
    std::string out = "\"";
    for (char ch : value)
    {
        if (ch == '"' || ch == '\\')
            out += '\\';
        out += ch;
    }
    out += '"';
    return out;
}

inline std::string format_params(const mime_params_t& params)
{
    std::string out;
    for (const auto& [name, value] : params)
        out += "; " + name + "=" + quote_param(value);
    return out;
}

inline std::string percent_decode(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::string::size_type i = 0; i < text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size())
        {
            const int hi = codec::hex_digit_to_int(text[i + 1]);
            const int lo = codec::hex_digit_to_int(text[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

/// Splits on `;` outside of quoted strings.
inline std::vector<std::string_view> split_params(std::string_view text)
{
    std::vector<std::string_view> items;
    bool quoted = false;
    std::string::size_type start = 0;
    for (std::string::size_type i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\\' && quoted)
            ++i;
        else if (text[i] == '"')
            quoted = !quoted;
        else if (text[i] == ';' && !quoted)
        {
            items.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    items.push_back(text.substr(std::min(start, text.size())));
    return items;
}

inline std::string unquote(std::string_view value)
{
    if (value.size() < 2 || value.front() != '"')
        return std::string(value);

    std::string out;
    for (std::string::size_type i = 1; i < value.size(); ++i)
    {
        if (value[i] == '"')
            break;
        if (value[i] == '\\' && i + 1 < value.size())
            ++i;
        out += value[i];
    }
    return out;
}

/**
Parsing the parameters following the first `;` of a structured header.

RFC 2231 extended (`name*`) and continued (`name*0`, `name*1*`) parameters are joined and decoded, they take
precedence over a plain parameter of the same name.
**/
inline mime_params_t parse_params(std::string_view text)
{
    struct segment
    {
        unsigned index;
        std::string value;
        bool extended;
    };

    mime_params_t params;
    std::map<std::string, std::vector<segment>> continued;

    for (auto item : split_params(text))
    {
        item = detail::trim_view(item);
        const auto eq = item.find('=');
        if (item.empty() || eq == std::string_view::npos)
            continue;
        const std::string name = detail::to_lower_ascii(detail::trim_view(item.substr(0, eq)));
        const std::string value = unquote(detail::trim_view(item.substr(eq + 1)));
        if (name.empty())
            continue;

        const auto star = name.find('*');
        if (star == std::string::npos)
        {
            params[name] = value;
            continue;
        }

        std::string_view rest = std::string_view(name).substr(star + 1);
        segment seg{0, value, rest.empty()};
        if (!rest.empty())
        {
            if (rest.back() == '*')
            {
                seg.extended = true;
                rest.remove_suffix(1);
            }
            const auto conv = std::from_chars(rest.data(), rest.data() + rest.size(), seg.index);
            if (conv.ec != std::errc() || conv.ptr != rest.data() + rest.size())
                continue;
        }
        continued[name.substr(0, star)].push_back(std::move(seg));
    }

    for (auto& [name, segments] : continued)
    {
        std::sort(segments.begin(), segments.end(),
            [](const segment& a, const segment& b) { return a.index < b.index; });

        std::string charset;
        std::string value;
        for (const auto& seg : segments)
        {
            std::string_view part = seg.value;
            if (!seg.extended)
            {
                value += part;
                continue;
            }
            if (seg.index == 0)
            {
                const auto q1 = part.find('\'');
                const auto q2 = q1 == std::string_view::npos ? q1 : part.find('\'', q1 + 1);
                if (q2 != std::string_view::npos)
                {
                    charset = detail::to_upper_ascii(part.substr(0, q1));
                    part = part.substr(q2 + 1);
                }
            }
            value += percent_decode(part);
        }
        params[name] = q_codec::to_utf8(value, charset);
    }

    return params;
}

} // namespace mime_detail


// ------------------------------------------------------------
// Header-only implementation (C++23)
// ------------------------------------------------------------

inline std::string content_type_t::to_string() const
{
    return media_type() + mime_detail::format_params(params);
}


inline content_type_t content_type_t::parse(std::string_view value)
{
    content_type_t ct;
    const auto semicolon = value.find(';');
    const std::string_view media = detail::trim_view(value.substr(0, semicolon));
    const auto slash = media.find('/');
    if (slash != std::string_view::npos && slash > 0 && slash + 1 < media.size())
    {
        ct.type = detail::to_lower_ascii(detail::trim_view(media.substr(0, slash)));
        ct.subtype = detail::to_lower_ascii(detail::trim_view(media.substr(slash + 1)));
    }
    if (semicolon != std::string_view::npos)
        ct.params = mime_detail::parse_params(value.substr(semicolon + 1));
    return ct;
}


inline std::string content_disposition_t::to_string() const
{
    return disposition + mime_detail::format_params(params);
}


inline content_disposition_t content_disposition_t::parse(std::string_view value)
{
    content_disposition_t cd;
    const auto semicolon = value.find(';');
    cd.disposition = detail::to_lower_ascii(detail::trim_view(value.substr(0, semicolon)));
    if (semicolon != std::string_view::npos)
        cd.params = mime_detail::parse_params(value.substr(semicolon + 1));
    return cd;
}


inline result<mime> mime::parse(std::string_view raw)
{
    return parse_node(raw, 0);
}


inline result<mime> mime::parse_node(std::string_view raw, unsigned depth)
{
    if (depth > MAX_DEPTH)
        return fail<mime>(error_code::mime_parse_error, "MIME parts nested too deep.");

    mime node;
    std::string name;
    std::string value;
    auto flush = [&node, &name, &value]()
    {
        if (name.empty())
            return;
        const std::string trimmed = detail::trim_copy(value);
        node.headers_.emplace_back(name, trimmed);
        node.refresh_structured(name, trimmed);
        name.clear();
        value.clear();
    };

    std::string::size_type pos = 0;
    std::string::size_type body_start = raw.size();
    while (pos < raw.size())
    {
        const auto eol = raw.find('\n', pos);
        const auto line_end = eol == std::string_view::npos ? raw.size() : eol;
        const auto next = eol == std::string_view::npos ? raw.size() : eol + 1;
        std::string_view line = raw.substr(pos, line_end - pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (line.empty())
        {
            body_start = next;
            break;
        }

        if (line.front() == ' ' || line.front() == '\t')
        {
            if (name.empty())
                return fail<mime>(error_code::mime_invalid_header, "Header continuation without a header.",
                    std::string(line));
            value += line;
        }
        else
        {
            const auto colon = line.find(':');
            const std::string_view header_name = colon == std::string_view::npos ? std::string_view{} :
                detail::trim_view(line.substr(0, colon));
            if (!detail::is_valid_header_name(header_name))
            {
                body_start = pos;
                break;
            }
            flush();
            name = header_name;
            value = line.substr(colon + 1);
        }
        pos = next;
    }
    flush();

    node.content_ = raw.substr(std::min(body_start, raw.size()));

    if (node.is_multipart())
    {
        const std::string boundary = node.content_type_.param("boundary");
        if (boundary.empty())
            return fail<mime>(error_code::mime_missing_boundary, "Multipart content without boundary.",
                node.content_type_.media_type());

        const std::string_view body = node.content_;
        const std::string delimiter = "--" + boundary;
        bool found = false;
        bool in_part = false;
        bool closed = false;
        std::string::size_type part_start = 0;
        std::vector<std::string_view> chunks;

        std::string::size_type line_start = 0;
        while (line_start <= body.size())
        {
            const auto eol = body.find('\n', line_start);
            const auto line_end = eol == std::string_view::npos ? body.size() : eol;
            std::string_view line = body.substr(line_start, line_end - line_start);
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
                line.remove_suffix(1);

            if (line.starts_with(delimiter))
            {
                const std::string_view rest = line.substr(delimiter.size());
                if (rest.empty() || rest == "--")
                {
                    if (in_part)
                    {
                        auto end = line_start;
                        if (end > part_start && body[end - 1] == '\n')
                            --end;
                        if (end > part_start && body[end - 1] == '\r')
                            --end;
                        chunks.push_back(body.substr(part_start, end - part_start));
                    }
                    found = true;
                    if (rest == "--")
                    {
                        closed = true;
                        break;
                    }
                    in_part = true;
                    part_start = eol == std::string_view::npos ? body.size() : eol + 1;
                }
            }

            if (eol == std::string_view::npos)
                break;
            line_start = eol + 1;
        }

        if (!found)
            return fail<mime>(error_code::mime_parse_error, "Multipart boundary not found.", boundary);
        if (in_part && !closed)
            chunks.push_back(body.substr(part_start));

        for (auto chunk : chunks)
        {
            auto part = parse_node(chunk, depth + 1);
            if (!part)
                return fail<mime>(std::move(part.error()));
            node.parts_.push_back(std::move(*part));
        }
    }
    else if (node.content_type_.is("message", "rfc822"))
    {
        auto inner = parse_node(node.content_, depth + 1);
        if (!inner)
            return fail<mime>(std::move(inner.error()));
        node.parts_.push_back(std::move(*inner));
    }

    return node;
}


inline std::string mime::format() const
{
    const std::string_view eol = codec::END_OF_LINE;
    std::string out;
    for (const auto& [name, value] : headers_)
        out.append(name).append(": ").append(value).append(eol);
    out.append(eol);

    if (!is_multipart() || parts_.empty())
        return out.append(content_);

    const std::string delimiter = "--" + content_type_.param("boundary");
    for (const auto& part : parts_)
        out.append(delimiter).append(eol).append(part.format()).append(eol);
    return out.append(delimiter).append("--").append(eol);
}


inline std::optional<std::string> mime::header(std::string_view name) const
{
    for (auto it = headers_.rbegin(); it != headers_.rend(); ++it)
        if (detail::iequals_ascii(it->first, name))
            return it->second;
    return std::nullopt;
}


inline result_void mime::add_header(const std::string& name, const std::string& value)
{
    if (!detail::is_valid_header_name(name))
        return fail(error_code::invalid_argument, "Header name format error.", name);
    if (!detail::is_valid_header_value(value))
        return fail(error_code::invalid_argument, "Header value format error.", name);
    headers_.emplace_back(name, value);
    refresh_structured(name, value);
    return ok();
}


inline result_void mime::set_header(const std::string& name, const std::string& value)
{
    if (!detail::is_valid_header_name(name))
        return fail(error_code::invalid_argument, "Header name format error.", name);
    if (!detail::is_valid_header_value(value))
        return fail(error_code::invalid_argument, "Header value format error.", name);
    set_header_unchecked(name, value);
    return ok();
}


inline void mime::remove_header(std::string_view name)
{
    std::erase_if(headers_, [name](const header_t& hdr) { return detail::iequals_ascii(hdr.first, name); });
    if (detail::iequals_ascii(name, CONTENT_TYPE_HEADER))
        content_type_ = content_type_t();
    else if (detail::iequals_ascii(name, CONTENT_DISPOSITION_HEADER))
        content_disposition_ = content_disposition_t();
    else if (detail::iequals_ascii(name, CONTENT_TRANSFER_ENCODING_HEADER))
        encoding_ = content_transfer_encoding_t::NONE;
}


inline void mime::content_type(const content_type_t& ct)
{
    set_header_unchecked(CONTENT_TYPE_HEADER, ct.to_string());
}


inline void mime::content_disposition(const content_disposition_t& cd)
{
    set_header_unchecked(CONTENT_DISPOSITION_HEADER, cd.to_string());
}


inline void mime::content_transfer_encoding(content_transfer_encoding_t encoding)
{
    std::string value;
    switch (encoding)
    {
        case content_transfer_encoding_t::BIT7: value = "7bit"; break;
        case content_transfer_encoding_t::BIT8: value = "8bit"; break;
        case content_transfer_encoding_t::BASE64: value = "base64"; break;
        case content_transfer_encoding_t::QUOTED_PRINTABLE: value = "quoted-printable"; break;
        case content_transfer_encoding_t::BINARY: value = "binary"; break;
        case content_transfer_encoding_t::NONE: break;
    }
    if (value.empty())
        remove_header(CONTENT_TRANSFER_ENCODING_HEADER);
    else
        set_header_unchecked(CONTENT_TRANSFER_ENCODING_HEADER, value);
}


inline result<std::string> mime::decoded_content() const
{
    if (encoding_ == content_transfer_encoding_t::BASE64)
    {
        try
        {
            base64 b64(mime_detail::NO_POLICY, mime_detail::NO_POLICY);
            return b64.decode(content_);
        }
        catch (const codec_error& exc)
        {
            return fail<std::string>(error_code::mime_encoding_error, "Base64 content decoding failure.", exc.what());
        }
    }
    if (encoding_ == content_transfer_encoding_t::QUOTED_PRINTABLE)
    {
        quoted_printable qp(mime_detail::NO_POLICY, mime_detail::NO_POLICY);
        return qp.decode(content_);
    }
    return content_;
}


inline std::string mime::filename() const
{
    std::string name = content_disposition_.param("filename");
    if (name.empty())
        name = content_type_.param("name");
    if (name.empty())
        return name;

    q_codec qc(mime_detail::NO_POLICY, mime_detail::NO_POLICY);
    try
    {
        return std::get<0>(qc.check_decode(name));
    }
    catch (const codec_error&)
    {
        // Not a valid encoded word, the name is used as it is.
        return name;
    }
}


inline void mime::refresh_structured(const std::string& name, const std::string& value)
{
    if (detail::iequals_ascii(name, CONTENT_TYPE_HEADER))
        content_type_ = content_type_t::parse(value);
    else if (detail::iequals_ascii(name, CONTENT_DISPOSITION_HEADER))
        content_disposition_ = content_disposition_t::parse(value);
    else if (detail::iequals_ascii(name, CONTENT_TRANSFER_ENCODING_HEADER))
    {
        const std::string enc = detail::to_lower_ascii(detail::trim_view(value));
        if (enc == "base64")
            encoding_ = content_transfer_encoding_t::BASE64;
        else if (enc == "quoted-printable")
            encoding_ = content_transfer_encoding_t::QUOTED_PRINTABLE;
        else if (enc == "7bit")
            encoding_ = content_transfer_encoding_t::BIT7;
        else if (enc == "8bit")
            encoding_ = content_transfer_encoding_t::BIT8;
        else if (enc == "binary")
            encoding_ = content_transfer_encoding_t::BINARY;
        else
            encoding_ = content_transfer_encoding_t::NONE;
    }
}


inline void mime::set_header_unchecked(const std::string& name, const std::string& value)
{
    auto it = std::find_if(headers_.begin(), headers_.end(),
        [&name](const header_t& hdr) { return detail::iequals_ascii(hdr.first, name); });
    if (it == headers_.end())
        headers_.emplace_back(name, value);
    else
    {
        it->second = value;
        headers_.erase(std::remove_if(std::next(it), headers_.end(),
            [&name](const header_t& hdr) { return detail::iequals_ascii(hdr.first, name); }), headers_.end());
    }
    refresh_structured(name, value);
}


} // namespace gmailxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
