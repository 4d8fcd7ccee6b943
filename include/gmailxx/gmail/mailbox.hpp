/*

mailbox.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <gmailxx/gmail/session.hpp>


namespace gmailxx::gmail
{


/**
Names of the Gmail special folders.
**/
struct folder_names
{
    std::string trash = "[Gmail]/Trash";

    /**
    Trash folder name of the accounts using British English.
    **/
    std::string bin = "[Gmail]/Bin";

    std::string all_mail = "[Gmail]/All Mail";

    bool is_trash(std::string_view name) const
    {
        return name == trash || name == bin;
    }
};


/**
Non-owning reference to the mailbox a message belongs to.

The session must outlive every reference to it.
**/
class mailbox_ref
{
public:

    mailbox_ref(std::string name, mail_session* session, folder_names folders = {})
        : name_(std::move(name)), session_(session), folders_(std::move(folders))
    {
    }

    const std::string& name() const noexcept
    {
        return name_;
    }

    mail_session* session() const noexcept
    {
        return session_;
    }

    const folder_names& folders() const noexcept
    {
        return folders_;
    }

private:

    std::string name_;

    mail_session* session_;

    folder_names folders_;
};


} // namespace gmailxx::gmail
