/*

session.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <gmailxx/detail/asio_decl.hpp>
#include <gmailxx/detail/asio_error.hpp>
#include <gmailxx/detail/log.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/gmail/session.hpp>
#include <gmailxx/imap/error_mapping.hpp>
#include <gmailxx/imap/types.hpp>
#include <gmailxx/imap/utf7.hpp>
#include <gmailxx/net/dialog.hpp>

namespace gmailxx::imap
{

/**
Blocking IMAP session over a connected stream, providing the Gmail operations of a message.

The uid commands select the mailbox of the message first unless it is the selected one already. Not thread safe.
**/
template<typename Stream>
class session : public gmail::mail_session
{
public:
    using dialog_type = gmailxx::net::dialog<Stream>;

    /**
    Taking over a connected stream. The greeting is not read.

    @param stream Connected stream.
    @param opts   Session options.
    **/
    explicit session(Stream stream, options opts = {})
        : dialog_(std::move(stream), opts.max_line_length),
          options_(std::move(opts))
    {
        dialog_.set_trace_protocol("IMAP");
        dialog_.set_trace_enabled(options_.trace);
    }

    /**
    Reading the server greeting.

    @return Greeting response, `connection_closed` if the server says BYE.
    **/
    [[nodiscard]] result<response> read_greeting();

    /**
    Selecting a mailbox.

    @param mailbox Mailbox name in UTF-8.
    @return        Server response, or the tagged NO/BAD error.
    **/
    [[nodiscard]] result<response> select(std::string_view mailbox);

    /**
    Sending a command and reading the response up to its tagged line.

    @param command Command without tag and CRLF.
    @return        Response, `imap_no_response` or `imap_bad_response` for a tagged NO or BAD.
    **/
    [[nodiscard]] result<response> command(std::string_view command);

    [[nodiscard]] result_void logout();

    /**
    Name of the selected mailbox, empty if none.
    **/
    const std::string& selected_mailbox() const noexcept
    {
        return selected_mailbox_;
    }

    [[nodiscard]] result<gmail::fetch_response> fetch_by_uid(std::string_view uid, std::string_view items,
        std::string_view mailbox) override;

    [[nodiscard]] result_void store_flags(std::string_view uid, gmail::store_mode mode, std::string_view flag,
        std::string_view mailbox) override;

    /**
    Adding or removing a label, sent modified UTF-7 encoded as Gmail stores them.
    **/
    [[nodiscard]] result_void store_label(std::string_view uid, gmail::store_mode mode, std::string_view label,
        std::string_view mailbox) override;

    [[nodiscard]] result_void copy(std::string_view uid, std::string_view target_mailbox,
        std::string_view source_mailbox) override;

    [[nodiscard]] result<std::set<std::string>> list_labels() override;

    [[nodiscard]] dialog_type& dialog() noexcept { return dialog_; }

private:
    result<response> read_response(std::string_view tag, std::string_view command);

    result<response> finalize_response(response&& resp, std::string_view command);

    result_void store(std::string_view uid, std::string_view item, std::string_view mailbox);

    /// Selecting the mailbox unless it is empty or selected already
    result_void ensure_selected(std::string_view mailbox);

    dialog_type dialog_;
    options options_;
    std::uint64_t tag_counter_ = 0;
    std::string selected_mailbox_;
};


/**
Connecting a plain TCP session and reading the greeting.

@param context Context of the socket.
@param host    Server host name.
@param service Port or service name, like `143`.
@param opts    Session options.
@return        Connected session, or the DNS, connection or greeting error.
**/
[[nodiscard]] inline result<session<asio::tcp::socket>> connect(asio::io_context& context, const std::string& host,
    const std::string& service, options opts = {})
{
    asio::error_code ec;
    asio::tcp::resolver resolver(context);
    const auto endpoints = resolver.resolve(host, service, ec);
    if (ec)
        return fail<session<asio::tcp::socket>>(error_from_asio(ec));

    asio::tcp::socket socket(context);
    asio::connect(socket, endpoints, ec);
    if (ec)
        return fail<session<asio::tcp::socket>>(error_from_asio(ec));

    GMAILXX_INFO("imap: connected to " + host + ":" + service);
    session<asio::tcp::socket> sess(std::move(socket), std::move(opts));
    auto greeting = sess.read_greeting();
    if (!greeting)
        return fail<session<asio::tcp::socket>>(std::move(greeting.error()));
    return sess;
}


// Header-only implementation (C++23)

template<typename Stream>
result<response> session<Stream>::read_greeting()
{
    std::string line;
    GMAILXX_TRY_ASSIGN(line, dialog_.read_line());

    response resp;
    handle_line(resp, line, std::string_view{});
    if (resp.st == status::bye)
        return fail<response>(error_code::connection_closed, "Server refused the connection.", line);
    if (resp.st != status::ok && resp.st != status::preauth)
        return fail<response>(map_imap_error(error_kind::parse), "Unexpected greeting.", line);
    return resp;
}


template<typename Stream>
result<response> session<Stream>::select(std::string_view mailbox)
{
    std::string box;
    GMAILXX_TRY_ASSIGN(box, to_mailbox(mailbox));

    const std::string cmd = "SELECT " + box;

    response resp;
    GMAILXX_TRY_ASSIGN(resp, command(cmd));
    selected_mailbox_.assign(mailbox);
    GMAILXX_DEBUG("imap: selected " + selected_mailbox_);
    return resp;
}


template<typename Stream>
result<response> session<Stream>::command(std::string_view command)
{
    GMAILXX_TRY_VOID(check_argument(command, "command"));

    const std::string tag = options_.tag_prefix + std::to_string(++tag_counter_);
    std::string line = tag;
    line.append(" ").append(command);
    GMAILXX_TRY_VOID(dialog_.write_line(line));
    return read_response(tag, command);
}


template<typename Stream>
result_void session<Stream>::logout()
{
    response resp;
    GMAILXX_TRY_ASSIGN(resp, command("LOGOUT"));
    selected_mailbox_.clear();
    return ok();
}


template<typename Stream>
result<gmail::fetch_response> session<Stream>::fetch_by_uid(std::string_view uid, std::string_view items,
    std::string_view mailbox)
{
    GMAILXX_TRY_VOID(check_argument(uid, "uid"));
    GMAILXX_TRY_VOID(ensure_selected(mailbox));

    std::string cmd = "UID FETCH ";
    cmd.append(uid).append(" ").append(items);

    response resp;
    GMAILXX_TRY_ASSIGN(resp, command(cmd));

    for (std::size_t i = 0; i < resp.literals.size(); ++i)
    {
        const std::string& line = resp.untagged_lines[resp.literal_lines[i]];
        // * <sequence number> FETCH (...)
        token_reader reader(line);
        const std::string_view star = reader.atom();
        reader.atom();
        if (star != "*" || !gmailxx::detail::iequals_ascii(reader.atom(), "FETCH"))
            continue;
        return gmail::fetch_response{line, std::move(resp.literals[i])};
    }

    return fail<gmail::fetch_response>(map_imap_error(error_kind::not_found), "No message with this uid.",
        make_imap_detail(resp.tag, cmd, resp.text));
}


template<typename Stream>
result_void session<Stream>::store_flags(std::string_view uid, gmail::store_mode mode, std::string_view flag,
    std::string_view mailbox)
{
    GMAILXX_TRY_VOID(check_argument(flag, "flag"));
    return store(uid, build_store_item("FLAGS", mode == gmail::store_mode::add, flag), mailbox);
}


template<typename Stream>
result_void session<Stream>::store_label(std::string_view uid, gmail::store_mode mode, std::string_view label,
    std::string_view mailbox)
{
    GMAILXX_TRY_VOID(check_argument(label, "label"));
    std::string encoded;
    GMAILXX_TRY_ASSIGN(encoded, encode_modified_utf7(label));
    std::string value;
    GMAILXX_TRY_ASSIGN(value, to_astring(encoded));
    return store(uid, build_store_item("X-GM-LABELS", mode == gmail::store_mode::add, value), mailbox);
}


template<typename Stream>
result_void session<Stream>::copy(std::string_view uid, std::string_view target_mailbox,
    std::string_view source_mailbox)
{
    GMAILXX_TRY_VOID(check_argument(uid, "uid"));
    std::string target;
    GMAILXX_TRY_ASSIGN(target, to_mailbox(target_mailbox));

    GMAILXX_TRY_VOID(ensure_selected(source_mailbox));

    std::string cmd = "UID COPY ";
    cmd.append(uid).append(" ").append(target);

    response resp;
    GMAILXX_TRY_ASSIGN(resp, command(cmd));
    return ok();
}


template<typename Stream>
result<std::set<std::string>> session<Stream>::list_labels()
{
    response resp;
    GMAILXX_TRY_ASSIGN(resp, command(R"(LIST "" "*")"));

    std::set<std::string> labels;
    for (const auto& line : resp.untagged_lines)
    {
        mailbox_folder folder;
        if (!parse_list_line(line, folder))
            continue;
        auto name = decode_modified_utf7(folder.name);
        if (!name)
        {
            GMAILXX_WARN("imap: mailbox name kept undecoded, " + name.error().message());
            labels.insert(std::move(folder.name));
            continue;
        }
        labels.insert(std::move(*name));
    }
    return labels;
}


template<typename Stream>
result<response> session<Stream>::read_response(std::string_view tag, std::string_view command)
{
    response resp;
    resp.tag.assign(tag);

    while (true)
    {
        std::string line;
        GMAILXX_TRY_ASSIGN(line, dialog_.read_line());
        handle_line(resp, line, tag);
        if (is_tagged_line(line, tag))
            break;

        std::size_t literal_size = 0;
        while (extract_literal_size(line, literal_size))
        {
            if (line.empty() || line[0] == '+')
                return fail<response>(map_imap_error(error_kind::parse), "Literal outside of a response line.",
                    make_imap_detail(tag, command, line));

            std::string literal;
            GMAILXX_TRY_ASSIGN(literal, dialog_.read_exactly(literal_size));
            resp.literals.push_back(std::move(literal));
            resp.literal_lines.push_back(resp.untagged_lines.size() - 1);

            GMAILXX_TRY_ASSIGN(line, dialog_.read_line());
            resp.untagged_lines.back() += line;
        }
    }

    return finalize_response(std::move(resp), command);
}


template<typename Stream>
result<response> session<Stream>::finalize_response(response&& resp, std::string_view command)
{
    const std::string tagged = resp.tagged_lines.empty() ? resp.text : resp.tagged_lines.back();
    if (resp.st == status::no)
        return fail<response>(map_imap_error(error_kind::tagged_no), "IMAP tagged NO.",
            make_imap_detail(resp.tag, command, tagged));
    if (resp.st == status::bad)
        return fail<response>(map_imap_error(error_kind::tagged_bad), "IMAP tagged BAD.",
            make_imap_detail(resp.tag, command, tagged));
    if (resp.st != status::ok)
        return fail<response>(map_imap_error(error_kind::parse), "IMAP parse error.",
            make_imap_detail(resp.tag, command, tagged));
    return std::move(resp);
}


template<typename Stream>
result_void session<Stream>::store(std::string_view uid, std::string_view item, std::string_view mailbox)
{
    GMAILXX_TRY_VOID(check_argument(uid, "uid"));
    GMAILXX_TRY_VOID(ensure_selected(mailbox));

    std::string cmd = "UID STORE ";
    cmd.append(uid).append(" ").append(item);

    response resp;
    GMAILXX_TRY_ASSIGN(resp, command(cmd));
    return ok();
}


template<typename Stream>
result_void session<Stream>::ensure_selected(std::string_view mailbox)
{
    if (mailbox.empty() || mailbox == selected_mailbox_)
        return ok();
    response resp;
    GMAILXX_TRY_ASSIGN(resp, select(mailbox));
    return ok();
}

} // namespace gmailxx::imap
