/*

test_raw_parser.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE raw_parser_test

#include <set>
#include <string>
#include <boost/test/unit_test.hpp>
#include <gmailxx/gmail/raw_parser.hpp>


using std::set;
using std::string;
using gmailxx::error_code;
using gmailxx::gmail::parse_flags;
using gmailxx::gmail::parse_labels;
using gmailxx::gmail::parse_message_id;
using gmailxx::gmail::parse_raw;
using gmailxx::gmail::parse_subject;
using gmailxx::gmail::parse_thread_id;


namespace
{

const string HEADER_BLOCK =
    "* 3 FETCH (X-GM-THRID 1780123456789012345 X-GM-MSGID 1780123456789099999 "
    "X-GM-LABELS (\"\\\\Important\" Work \"Project X\") UID 42 FLAGS (\\Seen \\Flagged) BODY[] {512})";

const string PLAIN_MSG =
    "Delivered-To: me@gmail.com\r\n"
    "From: Alice <alice@example.com>\r\n"
    "To: me@gmail.com\r\n"
    "Cc: bob@example.com\r\n"
    "Subject: =?UTF-8?B?SMOpbGxv?= world\r\n"
    "Date: Tue, 01 Oct 2024 09:05:00 +0200\r\n"
    "Content-Type: text/plain; charset=utf-8\r\n"
    "Content-Transfer-Encoding: quoted-printable\r\n"
    "\r\n"
    "raw =C3=A9 payload\r\n";

const string MIXED_MSG =
    "From: alice@example.com\r\n"
    "To: me@gmail.com\r\n"
    "Subject: report\r\n"
    "Date: Wed, 02 Oct 2024 10:00:00 +0000\r\n"
    "MIME-Version: 1.0\r\n"
    "Content-Type: multipart/mixed; boundary=\"outer\"\r\n"
    "\r\n"
    "--outer\r\n"
    "Content-Type: multipart/alternative; boundary=\"inner\"\r\n"
    "\r\n"
    "--inner\r\n"
    "Content-Type: text/plain; charset=us-ascii\r\n"
    "\r\n"
    "first plain\r\n"
    "--inner\r\n"
    "Content-Type: text/html; charset=utf-8\r\n"
    "Content-Transfer-Encoding: base64\r\n"
    "\r\n"
    "PHA+aGk8L3A+\r\n"
    "--inner--\r\n"
    "--outer\r\n"
    "Content-Type: text/plain\r\n"
    "\r\n"
    "second plain\r\n"
    "--outer\r\n"
    "Content-Type: application/pdf; name=\"r.pdf\"\r\n"
    "Content-Disposition: attachment; filename=\"r.pdf\"\r\n"
    "Content-Transfer-Encoding: base64\r\n"
    "\r\n"
    "JVBERi0xLjQ=\r\n"
    "--outer\r\n"
    "Content-Type: application/octet-stream\r\n"
    "Content-Disposition: attachment; filename=\"empty.bin\"\r\n"
    "\r\n"
    "\r\n"
    "--outer--\r\n";

}


BOOST_AUTO_TEST_CASE(markers_of_header_block)
{
    BOOST_TEST((parse_flags(HEADER_BLOCK) == set<string>{"\\Seen", "\\Flagged"}));
    BOOST_TEST((parse_labels(HEADER_BLOCK) == set<string>{"\\Important", "Work", "Project X"}));
    BOOST_TEST(*parse_thread_id(HEADER_BLOCK) == "1780123456789012345");
    BOOST_TEST(*parse_message_id(HEADER_BLOCK) == "1780123456789099999");
}

BOOST_AUTO_TEST_CASE(quoted_labels_are_unquoted)
{
    BOOST_TEST((parse_labels("X-GM-LABELS (\"Work\" \"Important\")") == set<string>{"Work", "Important"}));
}

BOOST_AUTO_TEST_CASE(labels_decoded_from_modified_utf7)
{
    const auto labels = parse_labels("* 1 FETCH (X-GM-LABELS (\"Caf&AOk-\" R&-D \"Broken&Jjo\") UID 7)");
    BOOST_TEST((labels == set<string>{"Caf\xC3\xA9", "R&D", "Broken&Jjo"}));
}

BOOST_AUTO_TEST_CASE(missing_markers_are_empty)
{
    const string block = "* 1 FETCH (UID 7 BODY[] {10})";
    BOOST_TEST(parse_flags(block).empty());
    BOOST_TEST(parse_labels(block).empty());
    BOOST_TEST(!parse_thread_id(block));
    BOOST_TEST(!parse_message_id(block));
    BOOST_TEST(parse_flags("* 1 FETCH (FLAGS () UID 7)").empty());
    BOOST_TEST(parse_labels("* 1 FETCH (X-GM-LABELS () UID 7)").empty());
}

BOOST_AUTO_TEST_CASE(subject_decoding)
{
    BOOST_TEST(parse_subject("=?UTF-8?B?SMOpbGxv?= world") == "H\xC3\xA9llo world");
    BOOST_TEST(parse_subject("=?UTF-8?X?bad?=") == "=?UTF-8?X?bad?=");
    BOOST_TEST(parse_subject("").empty());
}

BOOST_AUTO_TEST_CASE(single_part_message)
{
    auto msg = parse_raw(HEADER_BLOCK, PLAIN_MSG);
    BOOST_REQUIRE(msg);
    BOOST_TEST(msg->subject == "H\xC3\xA9llo world");
    BOOST_TEST(msg->from == "Alice <alice@example.com>");
    BOOST_TEST(msg->to == "me@gmail.com");
    BOOST_TEST(msg->cc == "bob@example.com");
    BOOST_TEST(msg->delivered_to == "me@gmail.com");
    BOOST_TEST(msg->headers.at("Subject") == "=?UTF-8?B?SMOpbGxv?= world");

    // The body of a single part message is its payload as received.
    BOOST_REQUIRE(msg->body);
    BOOST_TEST(*msg->body == "raw =C3=A9 payload\r\n");
    BOOST_TEST(!msg->html);

    BOOST_TEST(msg->sent_at.offset.count() == 120);
    BOOST_TEST(msg->flags.contains("\\Seen"));
    BOOST_TEST(msg->labels.contains("Project X"));
    BOOST_TEST(msg->attachments.empty());
}

BOOST_AUTO_TEST_CASE(multipart_message)
{
    auto msg = parse_raw("* 1 FETCH (UID 9 BODY[] {100})", MIXED_MSG);
    BOOST_REQUIRE(msg);

    // The last plain and html parts win.
    BOOST_REQUIRE(msg->body);
    BOOST_TEST(*msg->body == "second plain");
    BOOST_REQUIRE(msg->html);
    BOOST_TEST(*msg->html == "<p>hi</p>");
    BOOST_TEST(msg->cc.empty());
    BOOST_TEST(msg->delivered_to.empty());
    BOOST_TEST(!msg->thread_id);

    // The empty attachment is dropped.
    BOOST_REQUIRE(msg->attachments.size() == 1u);
    BOOST_TEST(msg->attachments[0].name() == "r.pdf");
    BOOST_TEST(msg->attachments[0].payload() == "%PDF-1.4");
    BOOST_TEST(msg->attachments[0].content_type() == "application/pdf");
}

BOOST_AUTO_TEST_CASE(missing_or_bad_date)
{
    auto no_date = parse_raw("", "Subject: x\r\n\r\nbody");
    BOOST_REQUIRE(!no_date);
    BOOST_TEST((no_date.error().code() == error_code::parse_error));

    auto bad_date = parse_raw("", "Subject: x\r\nDate: yesterday\r\n\r\nbody");
    BOOST_REQUIRE(!bad_date);
    BOOST_TEST((bad_date.error().code() == error_code::parse_error));
}

BOOST_AUTO_TEST_CASE(mime_errors_surface)
{
    auto missing_boundary = parse_raw("",
        "Date: Wed, 02 Oct 2024 10:00:00 +0000\r\nContent-Type: multipart/mixed\r\n\r\nbody");
    BOOST_REQUIRE(!missing_boundary);
    BOOST_TEST((missing_boundary.error().code() == error_code::mime_missing_boundary));

    auto bad_base64 = parse_raw("",
        "Date: Wed, 02 Oct 2024 10:00:00 +0000\r\n"
        "Content-Type: multipart/mixed; boundary=b\r\n\r\n"
        "--b\r\nContent-Type: text/plain\r\nContent-Transfer-Encoding: base64\r\n\r\n!!!!\r\n--b--\r\n");
    BOOST_REQUIRE(!bad_base64);
    BOOST_TEST((bad_base64.error().code() == error_code::mime_encoding_error));
}
