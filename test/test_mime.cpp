/*

test_mime.cpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE mime_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <gmailxx/mime/media_type.hpp>
#include <gmailxx/mime/mime.hpp>


using std::string;
using gmailxx::content_disposition_t;
using gmailxx::content_transfer_encoding_t;
using gmailxx::content_type_t;
using gmailxx::error_code;
using gmailxx::mime;


namespace
{

const string MULTIPART_MSG =
    "From: alice@example.com\r\n"
    "Subject: folded\r\n"
    " subject\r\n"
    "Content-Type: multipart/mixed; boundary=\"b1\"\r\n"
    "\r\n"
    "This is the preamble.\r\n"
    "--b1\r\n"
    "Content-Type: text/plain; charset=us-ascii\r\n"
    "\r\n"
    "plain text\r\n"
    "--b1\r\n"
    "Content-Type: application/octet-stream; name=\"a.bin\"\r\n"
    "Content-Transfer-Encoding: base64\r\n"
    "Content-Disposition: attachment; filename=\"a.bin\"\r\n"
    "\r\n"
    "AAEC\r\n"
    "--b1--\r\n"
    "epilogue\r\n";

}


BOOST_AUTO_TEST_CASE(parse_content_type)
{
    content_type_t ct = content_type_t::parse("Text/HTML; Charset=\"utf-8\"; format=flowed");
    BOOST_TEST(ct.type == "text");
    BOOST_TEST(ct.subtype == "html");
    BOOST_TEST(ct.param("charset") == "utf-8");
    BOOST_TEST(ct.param("format") == "flowed");
    BOOST_TEST(ct.is("text"));
    BOOST_TEST(ct.is("text", "html"));
    BOOST_TEST(!ct.is("text", "plain"));

    content_type_t bad = content_type_t::parse("garbage");
    BOOST_TEST(bad.media_type() == "text/plain");
}

BOOST_AUTO_TEST_CASE(parse_disposition_rfc2231)
{
    content_disposition_t cd = content_disposition_t::parse("attachment; filename*=UTF-8''na%C3%AFve.txt");
    BOOST_TEST(cd.disposition == "attachment");
    BOOST_TEST(cd.param("filename") == "na\xC3\xAFve.txt");

    content_disposition_t cont = content_disposition_t::parse(
        "Attachment; filename*0=\"long \"; filename*1=\"name.txt\"");
    BOOST_TEST(cont.disposition == "attachment");
    BOOST_TEST(cont.param("filename") == "long name.txt");

    content_disposition_t latin = content_disposition_t::parse("attachment; filename*=iso-8859-1'fr'caf%E9.txt");
    BOOST_TEST(latin.param("filename") == "caf\xC3\xA9.txt");
}

BOOST_AUTO_TEST_CASE(parse_multipart_tree)
{
    auto root = mime::parse(MULTIPART_MSG);
    BOOST_REQUIRE(root);
    BOOST_TEST(root->is_multipart());
    BOOST_TEST(*root->header("subject") == "folded subject");
    BOOST_TEST(*root->header("FROM") == "alice@example.com");
    BOOST_TEST(!root->header("Cc"));

    BOOST_REQUIRE(root->parts().size() == 2u);
    const mime& text = root->parts()[0];
    BOOST_TEST(text.content_type().is("text", "plain"));
    BOOST_TEST(text.content() == "plain text");

    const mime& bin = root->parts()[1];
    BOOST_TEST(bin.content_disposition().disposition == "attachment");
    BOOST_TEST(bin.filename() == "a.bin");
    auto payload = bin.decoded_content();
    BOOST_REQUIRE(payload);
    BOOST_TEST(*payload == string("\x00\x01\x02", 3));
}

BOOST_AUTO_TEST_CASE(walk_visits_all_nodes)
{
    auto root = mime::parse(MULTIPART_MSG);
    BOOST_REQUIRE(root);
    std::vector<string> types;
    root->walk([&types](const mime& node) { types.push_back(node.content_type().media_type()); });
    BOOST_REQUIRE(types.size() == 3u);
    BOOST_TEST(types[0] == "multipart/mixed");
    BOOST_TEST(types[1] == "text/plain");
    BOOST_TEST(types[2] == "application/octet-stream");
}

BOOST_AUTO_TEST_CASE(parse_tolerates_missing_close_delimiter)
{
    const string raw =
        "Content-Type: multipart/alternative; boundary=x\n"
        "\n"
        "--x\n"
        "Content-Type: text/html\n"
        "\n"
        "<p>hi</p>\n";
    auto root = mime::parse(raw);
    BOOST_REQUIRE(root);
    BOOST_REQUIRE(root->parts().size() == 1u);
    BOOST_TEST(root->parts()[0].content_type().is("text", "html"));
    BOOST_TEST(root->parts()[0].content() == "<p>hi</p>\n");
}

BOOST_AUTO_TEST_CASE(parse_errors)
{
    auto no_boundary = mime::parse("Content-Type: multipart/mixed\r\n\r\nbody\r\n");
    BOOST_REQUIRE(!no_boundary);
    BOOST_TEST((no_boundary.error().code() == error_code::mime_missing_boundary));

    auto no_delimiter = mime::parse("Content-Type: multipart/mixed; boundary=zz\r\n\r\nno parts here\r\n");
    BOOST_REQUIRE(!no_delimiter);
    BOOST_TEST((no_delimiter.error().code() == error_code::mime_parse_error));

    auto orphan = mime::parse(" orphan continuation\r\nSubject: x\r\n\r\nbody");
    BOOST_REQUIRE(!orphan);
    BOOST_TEST((orphan.error().code() == error_code::mime_invalid_header));
}

BOOST_AUTO_TEST_CASE(invalid_header_line_starts_body)
{
    auto root = mime::parse("Subject: x\r\nthis is not a header\r\nmore\r\n");
    BOOST_REQUIRE(root);
    BOOST_TEST(root->headers().size() == 1u);
    BOOST_TEST(root->content() == "this is not a header\r\nmore\r\n");
}

BOOST_AUTO_TEST_CASE(bad_base64_content)
{
    auto root = mime::parse("Content-Transfer-Encoding: base64\r\n\r\n@@@@\r\n");
    BOOST_REQUIRE(root);
    auto decoded = root->decoded_content();
    BOOST_REQUIRE(!decoded);
    BOOST_TEST((decoded.error().code() == error_code::mime_encoding_error));
}

BOOST_AUTO_TEST_CASE(quoted_printable_content)
{
    auto root = mime::parse("Content-Transfer-Encoding: Quoted-Printable\r\n\r\ncaf=C3=A9 =\r\nau lait");
    BOOST_REQUIRE(root);
    BOOST_TEST((root->content_transfer_encoding() == content_transfer_encoding_t::QUOTED_PRINTABLE));
    auto decoded = root->decoded_content();
    BOOST_REQUIRE(decoded);
    BOOST_TEST(*decoded == "caf\xC3\xA9 au lait");
}

BOOST_AUTO_TEST_CASE(encoded_filename_from_content_type)
{
    auto root = mime::parse("Content-Type: application/pdf; name=\"=?UTF-8?B?cmFwcG9ydC5wZGY=?=\"\r\n\r\n%PDF");
    BOOST_REQUIRE(root);
    BOOST_TEST(root->filename() == "rapport.pdf");
}

BOOST_AUTO_TEST_CASE(header_validation)
{
    mime part;
    BOOST_TEST(!part.add_header("Bad Name", "x"));
    BOOST_TEST(!part.set_header("X-Test", "line\r\nInjected: yes"));
    BOOST_TEST(part.set_header("X-Test", "one").has_value());
    BOOST_TEST(part.set_header("x-test", "two").has_value());
    BOOST_TEST(part.headers().size() == 1u);
    BOOST_TEST(*part.header("X-Test") == "two");
    part.remove_header("X-TEST");
    BOOST_TEST(part.headers().empty());
}

BOOST_AUTO_TEST_CASE(format_multipart_then_parse)
{
    mime root;
    content_type_t ct("multipart", "mixed");
    ct.params["boundary"] = "sep";
    root.content_type(ct);

    mime text;
    text.content_type(content_type_t("text", "plain"));
    text.content("first");
    root.add_part(text);

    mime other;
    other.content_type(content_type_t("text", "html"));
    other.content("<b>second</b>");
    root.add_part(other);

    const string raw = root.format();
    BOOST_TEST(raw.find("--sep\r\n") != string::npos);
    BOOST_TEST(raw.find("--sep--\r\n") != string::npos);

    auto parsed = mime::parse(raw);
    BOOST_REQUIRE(parsed);
    BOOST_REQUIRE(parsed->parts().size() == 2u);
    BOOST_TEST(parsed->parts()[0].content() == "first");
    BOOST_TEST(parsed->parts()[1].content() == "<b>second</b>");
}

BOOST_AUTO_TEST_CASE(message_rfc822_child)
{
    const string raw =
        "Content-Type: message/rfc822\r\n"
        "\r\n"
        "Subject: inner\r\n"
        "\r\n"
        "inner body";
    auto root = mime::parse(raw);
    BOOST_REQUIRE(root);
    BOOST_REQUIRE(root->parts().size() == 1u);
    BOOST_TEST(*root->parts()[0].header("Subject") == "inner");
    BOOST_TEST(root->parts()[0].content() == "inner body");
}

BOOST_AUTO_TEST_CASE(guess_media_type_by_extension)
{
    BOOST_TEST(gmailxx::guess_media_type("report.PDF").media_type() == "application/pdf");
    BOOST_TEST(gmailxx::guess_media_type("/tmp/photo.jpeg").media_type() == "image/jpeg");
    BOOST_TEST(gmailxx::guess_media_type("notes.txt").media_type() == "text/plain");
    BOOST_TEST(gmailxx::guess_media_type("archive.unknownext").media_type() == "application/octet-stream");
    BOOST_TEST(gmailxx::guess_media_type("README").media_type() == "application/octet-stream");
}
