/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <gmailxx/detail/ascii.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/imap/utf7.hpp>
#include <gmailxx/net/dialog.hpp>

namespace gmailxx::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

/**
Lines of one tagged command exchange.

A line announcing a literal is joined with the line following the literal, so an untagged line holds the whole
response text around its literals.
**/
struct response
{
    std::string tag;
    status st = status::unknown;
    std::string text;
    std::vector<std::string> untagged_lines;
    std::vector<std::string> continuation;
    std::vector<std::string> tagged_lines;
    std::vector<std::string> literals;

    /// Index into `untagged_lines` of the line each literal belongs to
    std::vector<std::size_t> literal_lines;
};

struct options
{
    std::size_t max_line_length = gmailxx::net::DEFAULT_MAX_LINE_LENGTH;

    /// Tracing the protocol lines, if the logger tracing is enabled as well
    bool trace = true;

    /// Prefix of the command tags, followed by a counter
    std::string tag_prefix = "A";
};

struct mailbox_folder
{
    std::string name;
    char delimiter = '/';
    std::vector<std::string> attributes;
};

/**
Refusing an argument which would end the command line early.

@param value Argument sent inline.
@param what  Argument name for the error message.
@return      `invalid_argument` if the value contains CR, LF or NUL.
**/
[[nodiscard]] inline result_void check_argument(std::string_view value, std::string_view what)
{
    if (value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos)
        return ok();
    return fail(error_code::invalid_argument, "CR, LF or NUL in " + std::string(what) + ".", std::string(value));
}

/**
Quoting a string argument, escaping quotes and backslashes.

@param text Argument.
@return     Quoted string, or `invalid_argument` if the text contains CR, LF or NUL.
**/
[[nodiscard]] inline result<std::string> to_astring(std::string_view text)
{
    GMAILXX_TRY_VOID(check_argument(text, "string argument"));
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '"';
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            quoted += '\\';
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

/**
Mailbox name argument: modified UTF-7 encoded and quoted.
**/
[[nodiscard]] inline result<std::string> to_mailbox(std::string_view utf8_mailbox)
{
    GMAILXX_TRY_VOID(check_argument(utf8_mailbox, "mailbox name"));
    std::string encoded;
    GMAILXX_TRY_ASSIGN(encoded, encode_modified_utf7(utf8_mailbox));
    return to_astring(encoded);
}

/**
Cursor over the words of a response line.
**/
class token_reader
{
public:

    explicit token_reader(std::string_view text) noexcept
        : rest_(text)
    {
        skip_spaces();
    }

    [[nodiscard]] bool at_end() const noexcept
    {
        return rest_.empty();
    }

    [[nodiscard]] char peek() const noexcept
    {
        return rest_.empty() ? '\0' : rest_.front();
    }

    [[nodiscard]] std::string_view rest() const noexcept
    {
        return rest_;
    }

    /**
    Next word up to a space, empty at the end of the line.
    **/
    std::string_view atom()
    {
        const auto end = std::min(rest_.find(' '), rest_.size());
        const std::string_view word = rest_.substr(0, end);
        rest_.remove_prefix(end);
        skip_spaces();
        return word;
    }

    /**
    Next quoted string without its quotes and escapes, or the next atom.

    @return False for an unterminated quoted string or at the end of the line.
    **/
    bool string(std::string& out)
    {
        out.clear();
        if (rest_.empty())
            return false;
        if (rest_.front() != '"')
        {
            out.assign(atom());
            return true;
        }

        std::size_t i = 1;
        for (; i < rest_.size() && rest_[i] != '"'; ++i)
        {
            if (rest_[i] == '\\' && i + 1 < rest_.size())
                ++i;
            out += rest_[i];
        }
        if (i == rest_.size())
            return false;
        rest_.remove_prefix(i + 1);
        skip_spaces();
        return true;
    }

    /**
    Content of the parenthesized list at the cursor, without nesting.

    @return False if the cursor is not at a complete list.
    **/
    bool list(std::string_view& out)
    {
        if (peek() != '(')
            return false;
        const auto close = rest_.find(')');
        if (close == std::string_view::npos)
            return false;
        out = rest_.substr(1, close - 1);
        rest_.remove_prefix(close + 1);
        skip_spaces();
        return true;
    }

private:

    void skip_spaces() noexcept
    {
        const auto first = rest_.find_first_not_of(' ');
        rest_.remove_prefix(first == std::string_view::npos ? rest_.size() : first);
    }

    std::string_view rest_;
};


/**
Size of the literal announced at the end of a line, as `{n}` or the non synchronizing `{n+}`.
**/
[[nodiscard]] inline bool extract_literal_size(std::string_view line, std::size_t& out)
{
    if (!line.ends_with('}'))
        return false;
    const auto open = line.rfind('{');
    if (open == std::string_view::npos)
        return false;

    std::string_view digits = line.substr(open + 1, line.size() - open - 2);
    if (digits.ends_with('+'))
        digits.remove_suffix(1);
    if (digits.empty() || !std::ranges::all_of(digits, gmailxx::detail::is_ascii_digit))
        return false;

    std::size_t size = 0;
    for (char digit : digits)
        size = size * 10 + static_cast<std::size_t>(digit - '0');
    out = size;
    return true;
}

[[nodiscard]] inline bool is_tagged_line(std::string_view line, std::string_view tag)
{
    return !tag.empty() && line.size() > tag.size() && line.starts_with(tag) && line[tag.size()] == ' ';
}

[[nodiscard]] inline status parse_status_word(std::string_view word)
{
    static constexpr std::pair<std::string_view, status> words[] = {
        {"OK", status::ok}, {"NO", status::no}, {"BAD", status::bad}, {"PREAUTH", status::preauth}, {"BYE", status::bye}};

    for (const auto& [name, st] : words)
        if (gmailxx::detail::iequals_ascii(word, name))
            return st;
    return status::unknown;
}

/**
Sorting a line into the response and taking the status from it.

Untagged status lines set the status only while no other line did, so the tagged line always has the last word.

@param resp Response to update.
@param line Received line.
@param tag  Tag of the command, empty for the greeting.
**/
inline void handle_line(response& resp, const std::string& line, std::string_view tag)
{
    const bool tagged = is_tagged_line(line, tag);
    if (tagged)
        resp.tagged_lines.push_back(line);
    else if (line.starts_with('+'))
    {
        resp.continuation.push_back(line);
        return;
    }
    else
        resp.untagged_lines.push_back(line);

    if (!tagged && (!line.starts_with('*') || resp.st != status::unknown))
        return;

    token_reader reader(std::string_view(line).substr(tagged ? tag.size() : 1));
    const status st = parse_status_word(reader.atom());
    if (tagged || st != status::unknown)
    {
        resp.st = st;
        resp.text.assign(reader.rest());
    }
}

/**
Parsing an untagged `* LIST (attributes) "delimiter" name` line.

@param line   Received line.
@param folder Parsed folder, name as sent (modified UTF-7).
@return       Whether the line is a LIST line.
**/
[[nodiscard]] inline bool parse_list_line(std::string_view line, mailbox_folder& folder)
{
    token_reader reader(line);
    if (reader.atom() != "*" || !gmailxx::detail::iequals_ascii(reader.atom(), "LIST"))
        return false;

    std::string_view attributes;
    std::string delimiter;
    std::string name;
    if (!reader.list(attributes) || !reader.string(delimiter) || !reader.string(name))
        return false;

    folder.attributes.clear();
    for (token_reader attr_reader(attributes); !attr_reader.at_end();)
        folder.attributes.emplace_back(attr_reader.atom());
    folder.delimiter = (delimiter.empty() || gmailxx::detail::iequals_ascii(delimiter, "NIL")) ? '\0' : delimiter.front();
    folder.name = std::move(name);
    return true;
}

/**
STORE data item, like `+FLAGS (\Seen)` or `-X-GM-LABELS ("Work")`.

@param item_name Data item name without the sign.
@param add       Adding or removing.
@param value     Value put in the parenthesized list as given.
**/
[[nodiscard]] inline std::string build_store_item(std::string_view item_name, bool add, std::string_view value)
{
    std::string item(1, add ? '+' : '-');
    item.append(item_name).append(" (").append(value).append(")");
    return item;
}

} // namespace gmailxx::imap
