/*

session.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <set>
#include <string>
#include <string_view>

#include <gmailxx/detail/result.hpp>


namespace gmailxx::gmail
{


/**
Adding or removing a flag or label.
**/
enum class store_mode
{
    add,
    remove
};


/**
One FETCH response entry.
**/
struct fetch_response
{
    /**
    Response text around the body literal, like `* 1 FETCH (X-GM-THRID 1 FLAGS (\Seen) UID 7 BODY[] {n}` followed by
    the text after the literal.
    **/
    std::string header_block;

    /**
    Raw RFC 822 message.
    **/
    std::string raw_body;
};


/**
Protocol operations of a mail account, as used by a message.

The uid operations name the mailbox the uid belongs to, an empty name meaning the mailbox in use.

Implementations report failures through the returned results and are not required to be thread safe.
**/
class mail_session
{
public:

    virtual ~mail_session() = default;

    /**
    Fetching one message by its uid.

    @param uid     Message uid.
    @param items   FETCH data items, like `(BODY.PEEK[] FLAGS)`.
    @param mailbox Mailbox of the message.
    @return        Header block and raw body.
    **/
    [[nodiscard]] virtual result<fetch_response> fetch_by_uid(std::string_view uid, std::string_view items,
        std::string_view mailbox) = 0;

    [[nodiscard]] virtual result_void store_flags(std::string_view uid, store_mode mode, std::string_view flag,
        std::string_view mailbox) = 0;

    [[nodiscard]] virtual result_void store_label(std::string_view uid, store_mode mode, std::string_view label,
        std::string_view mailbox) = 0;

    /**
    Copying a message from the source mailbox to the target one.
    **/
    [[nodiscard]] virtual result_void copy(std::string_view uid, std::string_view target_mailbox,
        std::string_view source_mailbox) = 0;

    /**
    Names of all mailboxes and labels of the account.
    **/
    [[nodiscard]] virtual result<std::set<std::string>> list_labels() = 0;
};


} // namespace gmailxx::gmail
