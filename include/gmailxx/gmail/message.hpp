/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gmailxx/config.hpp>
#include <gmailxx/detail/log.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/gmail/attachment.hpp>
#include <gmailxx/gmail/flags.hpp>
#include <gmailxx/gmail/mailbox.hpp>
#include <gmailxx/gmail/raw_parser.hpp>
#include <gmailxx/gmail/session.hpp>
#include <gmailxx/mime/date_time.hpp>

#if GMAILXX_THROWING_ENABLED
#include <gmailxx/throwing.hpp>
#endif


namespace gmailxx::gmail
{


/**
Message of a Gmail mailbox, identified by its uid.

The fields are fetched from the session on first access and cached. Mutations issue one command each and keep the
cached flags and labels in sync.
**/
class GMAILXX_EXPORT message
{
public:

    /**
    Data items fetched for one message.
    **/
    static constexpr std::string_view FETCH_ITEMS = "(BODY.PEEK[] FLAGS X-GM-THRID X-GM-MSGID X-GM-LABELS)";

    message(mailbox_ref mailbox, std::string uid)
        : mailbox_(std::move(mailbox)), uid_(std::move(uid))
    {
    }

    const std::string& uid() const noexcept
    {
        return uid_;
    }

    const mailbox_ref& mailbox() const noexcept
    {
        return mailbox_;
    }

    /**
    Whether the fields are populated.
    **/
    bool loaded() const noexcept
    {
        return fields_.has_value();
    }

    /**
    Fetching and parsing the message, replacing the cached fields.

    @return Error of the session or of the parser; the cached fields are unchanged then.
    **/
    [[nodiscard]] result_void load();

    /**
    Populating the fields from data fetched elsewhere, like a bulk fetch.

    @param header_block FETCH response text around the body literal.
    @param raw_body     Raw RFC 822 message.
    @return             Parser error; the cached fields are unchanged then.
    **/
    [[nodiscard]] result_void parse(std::string_view header_block, std::string_view raw_body);

    /**
    Loading the message unless it is loaded already.
    **/
    [[nodiscard]] result_void ensure_loaded()
    {
        if (loaded())
            return ok();
        return load();
    }

    /**
    Cached fields, empty if not loaded.
    **/
    const std::optional<parsed_message>& fields() const noexcept
    {
        return fields_;
    }

#if GMAILXX_THROWING_ENABLED

    // Accessors loading the message on first use and throwing `gmailxx::exception` on failure.

    const std::map<std::string, std::string>& headers()
    {
        return loaded_fields().headers;
    }

    const std::string& subject()
    {
        return loaded_fields().subject;
    }

    const std::optional<std::string>& body()
    {
        return loaded_fields().body;
    }

    const std::optional<std::string>& html()
    {
        return loaded_fields().html;
    }

    const std::string& to()
    {
        return loaded_fields().to;
    }

    const std::string& from()
    {
        return loaded_fields().from;
    }

    const std::string& cc()
    {
        return loaded_fields().cc;
    }

    const std::string& delivered_to()
    {
        return loaded_fields().delivered_to;
    }

    const date_time_t& sent_at()
    {
        return loaded_fields().sent_at;
    }

    const date_time_t& date()
    {
        return sent_at();
    }

    /**
    Sending date as `M/D/YY` in the sender's offset.
    **/
    std::string string_sent_at()
    {
        return format_short_date(sent_at());
    }

    std::string string_date()
    {
        return string_sent_at();
    }

    /**
    Address after the last `<` of the From header, or the whole header if it has no angle brackets.
    **/
    std::string from_address();

    const std::set<std::string>& flags()
    {
        return loaded_fields().flags;
    }

    const std::set<std::string>& labels()
    {
        return loaded_fields().labels;
    }

    const std::optional<std::string>& thread_id()
    {
        return loaded_fields().thread_id;
    }

    const std::optional<std::string>& message_id()
    {
        return loaded_fields().message_id;
    }

    const std::vector<attachment>& attachments()
    {
        return loaded_fields().attachments;
    }

    bool is_read()
    {
        return flags().contains(std::string(flags::seen));
    }

    bool is_starred()
    {
        return flags().contains(std::string(flags::flagged));
    }

    bool is_draft()
    {
        return flags().contains(std::string(flags::draft));
    }

    bool is_deleted()
    {
        return flags().contains(std::string(flags::deleted));
    }

    bool has_label(const std::string& label)
    {
        return labels().contains(label);
    }

#endif // GMAILXX_THROWING_ENABLED

    [[nodiscard]] result_void read()
    {
        return change_flag(store_mode::add, flags::seen);
    }

    [[nodiscard]] result_void unread()
    {
        return change_flag(store_mode::remove, flags::seen);
    }

    [[nodiscard]] result_void mark_as_read()
    {
        return read();
    }

    [[nodiscard]] result_void mark_as_unread()
    {
        return unread();
    }

    [[nodiscard]] result_void star()
    {
        return change_flag(store_mode::add, flags::flagged);
    }

    [[nodiscard]] result_void unstar()
    {
        return change_flag(store_mode::remove, flags::flagged);
    }

    /**
    Adding a Gmail label. The command is sent even if the label is cached already.
    **/
    [[nodiscard]] result_void add_label(const std::string& label)
    {
        return change_label(store_mode::add, label);
    }

    [[nodiscard]] result_void remove_label(const std::string& label)
    {
        return change_label(store_mode::remove, label);
    }

    /**
    Flagging the message as deleted and moving it to the trash folder of the account, unless it is in a trash folder.

    The trash folder is the default one if the account lists it, otherwise the British English one.

    @return First failing session error.
    **/
    [[nodiscard]] result_void remove();

    /**
    Copying the message to another mailbox and removing the original, unless the target is a trash folder.

    There is no rollback: if removing fails the copy stays.

    @param target_mailbox Mailbox name.
    @return               First failing session error.
    **/
    [[nodiscard]] result_void move_to(const std::string& target_mailbox);

    /**
    Moving the message to the All Mail folder.
    **/
    [[nodiscard]] result_void archive()
    {
        return move_to(mailbox_.folders().all_mail);
    }

private:

    result<mail_session*> session() const;

    result_void change_flag(store_mode mode, std::string_view flag);

    result_void change_label(store_mode mode, const std::string& label);

    static void apply(std::set<std::string>& set, store_mode mode, std::string_view item);

#if GMAILXX_THROWING_ENABLED
    const parsed_message& loaded_fields()
    {
        unwrap(ensure_loaded());
        return *fields_;
    }
#endif

    mailbox_ref mailbox_;

    std::string uid_;

    std::optional<parsed_message> fields_;
};


// Header-only implementation (C++23)

inline result_void message::load()
{
    mail_session* s = nullptr;
    GMAILXX_TRY_ASSIGN(s, session());

    GMAILXX_DEBUG("message: fetching uid " + uid_ + " from " + mailbox_.name());
    fetch_response response;
    GMAILXX_TRY_ASSIGN(response, s->fetch_by_uid(uid_, FETCH_ITEMS, mailbox_.name()));
    return parse(response.header_block, response.raw_body);
}


inline result_void message::parse(std::string_view header_block, std::string_view raw_body)
{
    auto parsed = parse_raw(header_block, raw_body);
    if (!parsed)
    {
        GMAILXX_DEBUG("message: parsing uid " + uid_ + " failed, " + parsed.error().to_string());
        return fail(std::move(parsed.error()));
    }
    fields_ = std::move(*parsed);
    return ok();
}


#if GMAILXX_THROWING_ENABLED
inline std::string message::from_address()
{
    const std::string& sender = from();
    const auto open = sender.rfind('<');
    if (open == std::string::npos || sender.find('>') == std::string::npos)
        return sender;
    std::string address = sender.substr(open + 1);
    std::erase(address, '>');
    return address;
}
#endif


inline result_void message::remove()
{
    GMAILXX_TRY_VOID(change_flag(store_mode::add, flags::deleted));

    const folder_names& folders = mailbox_.folders();
    if (folders.is_trash(mailbox_.name()))
        return ok();

    mail_session* s = nullptr;
    GMAILXX_TRY_ASSIGN(s, session());
    std::set<std::string> labels;
    GMAILXX_TRY_ASSIGN(labels, s->list_labels());
    return move_to(labels.contains(folders.trash) ? folders.trash : folders.bin);
}


inline result_void message::move_to(const std::string& target_mailbox)
{
    mail_session* s = nullptr;
    GMAILXX_TRY_ASSIGN(s, session());

    GMAILXX_DEBUG("message: copying uid " + uid_ + " from " + mailbox_.name() + " to " + target_mailbox);
    GMAILXX_TRY_VOID(s->copy(uid_, target_mailbox, mailbox_.name()));
    if (mailbox_.folders().is_trash(target_mailbox))
        return ok();
    return remove();
}


inline result<mail_session*> message::session() const
{
    if (mailbox_.session() == nullptr)
        return fail<mail_session*>(error_code::invalid_state, "Message is not attached to a session.", uid_);
    return mailbox_.session();
}


inline result_void message::change_flag(store_mode mode, std::string_view flag)
{
    mail_session* s = nullptr;
    GMAILXX_TRY_ASSIGN(s, session());

    GMAILXX_DEBUG(std::string("message: ") + (mode == store_mode::add ? "+" : "-") + std::string(flag) + " on uid " + uid_);
    GMAILXX_TRY_VOID(s->store_flags(uid_, mode, flag, mailbox_.name()));
    if (fields_)
        apply(fields_->flags, mode, flag);
    return ok();
}


inline result_void message::change_label(store_mode mode, const std::string& label)
{
    mail_session* s = nullptr;
    GMAILXX_TRY_ASSIGN(s, session());

    GMAILXX_DEBUG(std::string("message: ") + (mode == store_mode::add ? "+" : "-") + "label " + label + " on uid " + uid_);
    GMAILXX_TRY_VOID(s->store_label(uid_, mode, label, mailbox_.name()));
    if (fields_)
        apply(fields_->labels, mode, label);
    return ok();
}


inline void message::apply(std::set<std::string>& set, store_mode mode, std::string_view item)
{
    if (mode == store_mode::add)
        set.emplace(item);
    else
        set.erase(std::string(item));
}


} // namespace gmailxx::gmail
