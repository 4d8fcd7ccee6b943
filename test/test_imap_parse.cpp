/*

test_imap_parse.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_parse_test

#include <cstddef>
#include <boost/test/unit_test.hpp>
#include <gmailxx/imap/error_mapping.hpp>
#include <gmailxx/imap/types.hpp>


using gmailxx::error_code;
namespace imap = gmailxx::imap;


BOOST_AUTO_TEST_CASE(imap_parse_literal_size)
{
    std::size_t size = 0;
    BOOST_TEST(imap::extract_literal_size("* 1 FETCH (UID 7 BODY[] {42}", size));
    BOOST_TEST(size == 42u);
    BOOST_TEST(imap::extract_literal_size("A1 APPEND INBOX {5+}", size));
    BOOST_TEST(size == 5u);

    BOOST_TEST(!imap::extract_literal_size("* 1 FETCH (FLAGS (\\Seen))", size));
    BOOST_TEST(!imap::extract_literal_size("* 1 FETCH {abc}", size));
    BOOST_TEST(!imap::extract_literal_size("{}", size));
}

BOOST_AUTO_TEST_CASE(imap_parse_tagged_line)
{
    BOOST_TEST(imap::is_tagged_line("A12 OK done", "A12"));
    BOOST_TEST(!imap::is_tagged_line("A123 OK done", "A12"));
    BOOST_TEST(!imap::is_tagged_line("* OK done", "A12"));
    BOOST_TEST(!imap::is_tagged_line("* OK done", ""));
    BOOST_TEST(!imap::is_tagged_line("A12", "A12"));
}

BOOST_AUTO_TEST_CASE(imap_parse_status_words)
{
    BOOST_TEST((imap::parse_status_word("ok") == imap::status::ok));
    BOOST_TEST((imap::parse_status_word("NO") == imap::status::no));
    BOOST_TEST((imap::parse_status_word("Bad") == imap::status::bad));
    BOOST_TEST((imap::parse_status_word("PREAUTH") == imap::status::preauth));
    BOOST_TEST((imap::parse_status_word("BYE") == imap::status::bye));
    BOOST_TEST((imap::parse_status_word("FETCH") == imap::status::unknown));
}

BOOST_AUTO_TEST_CASE(imap_parse_handle_lines)
{
    imap::response greeting;
    imap::handle_line(greeting, "* OK Gimap ready", "");
    BOOST_TEST((greeting.st == imap::status::ok));
    BOOST_TEST(greeting.text == "Gimap ready");
    BOOST_TEST(greeting.untagged_lines.size() == 1u);

    imap::response resp;
    imap::handle_line(resp, "* 3 EXISTS", "A1");
    imap::handle_line(resp, "+ go ahead", "A1");
    imap::handle_line(resp, "* OK [UIDVALIDITY 1] valid", "A1");
    imap::handle_line(resp, "A1 NO [NONEXISTENT] Unknown mailbox", "A1");
    BOOST_TEST(resp.untagged_lines.size() == 2u);
    BOOST_TEST(resp.continuation.size() == 1u);
    BOOST_TEST(resp.tagged_lines.size() == 1u);
    BOOST_TEST((resp.st == imap::status::no));
    BOOST_TEST(resp.text == "[NONEXISTENT] Unknown mailbox");
}

BOOST_AUTO_TEST_CASE(imap_parse_list_lines)
{
    imap::mailbox_folder folder;
    BOOST_TEST(imap::parse_list_line("* LIST (\\HasNoChildren \\Trash) \"/\" \"[Gmail]/Trash\"", folder));
    BOOST_TEST(folder.name == "[Gmail]/Trash");
    BOOST_TEST(folder.delimiter == '/');
    BOOST_REQUIRE(folder.attributes.size() == 2u);
    BOOST_TEST(folder.attributes[1] == "\\Trash");

    BOOST_TEST(imap::parse_list_line("* LIST () NIL INBOX", folder));
    BOOST_TEST(folder.name == "INBOX");
    BOOST_TEST(folder.delimiter == '\0');
    BOOST_TEST(folder.attributes.empty());

    BOOST_TEST(imap::parse_list_line("* list (\\Noselect) \"/\" \"say \\\"hi\\\"\"", folder));
    BOOST_TEST(folder.name == "say \"hi\"");

    BOOST_TEST(!imap::parse_list_line("* FLAGS (\\Seen)", folder));
    BOOST_TEST(!imap::parse_list_line("* LIST \"/\" INBOX", folder));
    BOOST_TEST(!imap::parse_list_line("A1 LIST () \"/\" INBOX", folder));
}

BOOST_AUTO_TEST_CASE(imap_quote_arguments)
{
    auto plain = imap::to_astring("Work");
    BOOST_REQUIRE(plain.has_value());
    BOOST_TEST(*plain == "\"Work\"");

    auto escaped = imap::to_astring("a\"b\\c");
    BOOST_REQUIRE(escaped.has_value());
    BOOST_TEST(*escaped == "\"a\\\"b\\\\c\"");

    auto injected = imap::to_astring("Work\r\nA2 LOGOUT");
    BOOST_REQUIRE(!injected);
    BOOST_TEST((injected.error().code() == error_code::invalid_argument));

    auto mailbox = imap::to_mailbox("[Gmail]/Entw\xC3\xBC" "rfe");
    BOOST_REQUIRE(mailbox.has_value());
    BOOST_TEST(*mailbox == "\"[Gmail]/Entw&APw-rfe\"");

    auto bad_utf8 = imap::to_mailbox("bad \xC3");
    BOOST_REQUIRE(!bad_utf8);
    BOOST_TEST((bad_utf8.error().code() == error_code::invalid_mailbox));
}

BOOST_AUTO_TEST_CASE(imap_store_items)
{
    BOOST_TEST(imap::build_store_item("FLAGS", true, "\\Seen") == "+FLAGS (\\Seen)");
    BOOST_TEST(imap::build_store_item("X-GM-LABELS", false, "\"Work\"") == "-X-GM-LABELS (\"Work\")");
}

BOOST_AUTO_TEST_CASE(imap_error_mapping)
{
    BOOST_TEST((imap::map_imap_error(imap::error_kind::tagged_no) == error_code::imap_no_response));
    BOOST_TEST((imap::map_imap_error(imap::error_kind::tagged_bad) == error_code::imap_bad_response));
    BOOST_TEST((imap::map_imap_error(imap::error_kind::not_found) == error_code::imap_message_not_found));
    BOOST_TEST((imap::map_imap_error(imap::error_kind::parse) == error_code::invalid_response));
    BOOST_TEST(imap::make_imap_detail("A3", "SELECT \"x\"", "A3 NO nope") == "A3 SELECT \"x\": A3 NO nope");
    BOOST_TEST(imap::make_imap_detail("", "greeting", "* BAD") == "greeting: * BAD");
}
