/*

test_imap_session.cpp
---------------------

Runs the IMAP session against a scripted server on the loopback interface.

*/

#define BOOST_TEST_MODULE imap_session_test

#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/test/unit_test.hpp>
#include <gmailxx/gmail/message.hpp>
#include <gmailxx/imap/session.hpp>

using gmailxx::error_code;
using gmailxx::gmail::mailbox_ref;
using gmailxx::gmail::message;
using gmailxx::gmail::store_mode;

namespace asio = boost::asio;
namespace imap = gmailxx::imap;
using tcp = asio::ip::tcp;

namespace
{

/// Accepts one connection and runs a script on it in its own thread
class fake_server
{
public:
    using script_t = std::function<void(fake_server&)>;

    fake_server()
        : acceptor_(context_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)), socket_(context_)
    {
    }

    ~fake_server()
    {
        join();
    }

    std::string port() const
    {
        return std::to_string(acceptor_.local_endpoint().port());
    }

    void run(script_t script)
    {
        thread_ = std::thread([this, script = std::move(script)] {
            boost::system::error_code ec;
            acceptor_.accept(socket_, ec);
            if (!ec)
                script(*this);
        });
    }

    void join()
    {
        if (thread_.joinable())
            thread_.join();
    }

    /// Next client line without CRLF, empty once the client is gone
    std::string read_line()
    {
        boost::system::error_code ec;
        const std::size_t n = asio::read_until(socket_, asio::dynamic_buffer(buffer_), "\r\n", ec);
        if (ec)
            return {};
        std::string line = buffer_.substr(0, n - 2);
        buffer_.erase(0, n);
        received.push_back(line);
        return line;
    }

    void write(const std::string& data)
    {
        boost::system::error_code ec;
        asio::write(socket_, asio::buffer(data), ec);
    }

    void close()
    {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    std::vector<std::string> received;

private:
    asio::io_context context_;
    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::thread thread_;
    std::string buffer_;
};

const std::string GREETING = "* OK Gimap ready for requests from 127.0.0.1\r\n";

const std::string RAW_MESSAGE =
    "From: Alice <alice@example.com>\r\n"
    "To: me@gmail.com\r\n"
    "Subject: =?UTF-8?B?Q2Fmw6k=?=\r\n"
    "Date: Tue, 01 Oct 2024 09:05:00 +0200\r\n"
    "\r\n"
    "See you there.\r\n";

}


BOOST_AUTO_TEST_CASE(greeting_and_select)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        srv.read_line();
        srv.write("* 3 EXISTS\r\n* OK [UIDVALIDITY 11] UIDs valid\r\nA1 OK [READ-WRITE] INBOX selected. (Success)\r\n");
        srv.read_line();
        srv.write("* BYE LOGOUT Requested\r\nA2 OK 73 good day (Success)\r\n");
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());
        BOOST_TEST(sess->selected_mailbox().empty());

        auto selected = sess->select("INBOX");
        BOOST_REQUIRE(selected.has_value());
        BOOST_TEST(selected->untagged_lines.size() == 2u);
        BOOST_TEST(selected->text == "[READ-WRITE] INBOX selected. (Success)");
        BOOST_TEST(sess->selected_mailbox() == "INBOX");

        BOOST_TEST(sess->logout().has_value());
        BOOST_TEST(sess->selected_mailbox().empty());
    }

    server.join();
    BOOST_REQUIRE(server.received.size() == 2u);
    BOOST_TEST(server.received[0] == "A1 SELECT \"INBOX\"");
    BOOST_TEST(server.received[1] == "A2 LOGOUT");
}

BOOST_AUTO_TEST_CASE(greeting_bye)
{
    fake_server server;
    server.run([](fake_server& srv) { srv.write("* BYE Too many connections\r\n"); });

    asio::io_context ctx;
    auto sess = imap::connect(ctx, "127.0.0.1", server.port());
    BOOST_REQUIRE(!sess);
    BOOST_TEST((sess.error().code() == error_code::connection_closed));
    BOOST_TEST(sess.error().server_response() == "* BYE Too many connections");
}

BOOST_AUTO_TEST_CASE(greeting_line_too_long)
{
    fake_server server;
    server.run([](fake_server& srv) { srv.write("* OK " + std::string(200, 'x') + "\r\n"); });

    imap::options opts;
    opts.max_line_length = 32;
    asio::io_context ctx;
    auto sess = imap::connect(ctx, "127.0.0.1", server.port(), opts);
    BOOST_REQUIRE(!sess);
    BOOST_TEST((sess.error().code() == error_code::line_too_long));
}

BOOST_AUTO_TEST_CASE(connection_refused)
{
    std::string port;
    {
        asio::io_context ctx;
        tcp::acceptor acc(ctx, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        port = std::to_string(acc.local_endpoint().port());
    }

    asio::io_context ctx;
    auto sess = imap::connect(ctx, "127.0.0.1", port);
    BOOST_REQUIRE(!sess);
    BOOST_TEST((sess.error().code() == error_code::connection_failed));
}

BOOST_AUTO_TEST_CASE(tagged_no_and_bad)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        srv.read_line();
        srv.write("A1 NO [NONEXISTENT] Unknown Mailbox: Missing (now in authenticated state) (Failure)\r\n");
        srv.read_line();
        srv.write("A2 BAD Unknown command\r\n");
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());

        auto selected = sess->select("Missing");
        BOOST_REQUIRE(!selected);
        BOOST_TEST((selected.error().code() == error_code::imap_no_response));
        BOOST_TEST(selected.error().server_response().starts_with("A1 SELECT \"Missing\": A1 NO [NONEXISTENT]"));
        BOOST_TEST(sess->selected_mailbox().empty());

        auto unknown = sess->command("FROB");
        BOOST_REQUIRE(!unknown);
        BOOST_TEST((unknown.error().code() == error_code::imap_bad_response));
    }
    server.join();
}

BOOST_AUTO_TEST_CASE(command_injection_rejected)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        srv.read_line();
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());
        auto injected = sess->command("NOOP\r\nA9 LOGOUT");
        BOOST_REQUIRE(!injected);
        BOOST_TEST((injected.error().code() == error_code::invalid_argument));
        auto label = sess->store_label("7", store_mode::add, "bad\nlabel", "");
        BOOST_REQUIRE(!label);
        BOOST_TEST((label.error().code() == error_code::invalid_argument));
    }
    server.join();
    BOOST_TEST(server.received.empty());
}

BOOST_AUTO_TEST_CASE(fetch_literal_into_message)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        srv.read_line();
        srv.write("* 5 EXISTS\r\nA1 OK [READ-WRITE] INBOX selected. (Success)\r\n");
        srv.read_line();
        srv.write("* 1 FETCH (X-GM-THRID 1803 X-GM-MSGID 1804 X-GM-LABELS (\\Important \"Work\") UID 7 "
            "FLAGS (\\Seen) BODY[] {" + std::to_string(RAW_MESSAGE.size()) + "}\r\n" + RAW_MESSAGE +
            ")\r\nA2 OK Success\r\n");
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());
        BOOST_REQUIRE(sess->select("INBOX").has_value());

        // INBOX is selected already, the fetch goes out alone
        message msg(mailbox_ref("INBOX", &*sess), "7");
        BOOST_REQUIRE(msg.load().has_value());
        BOOST_TEST(msg.subject() == "Caf\xC3\xA9");
        BOOST_TEST(msg.from_address() == "alice@example.com");
        BOOST_TEST(*msg.body() == "See you there.\r\n");
        BOOST_TEST(*msg.thread_id() == "1803");
        BOOST_TEST(*msg.message_id() == "1804");
        BOOST_TEST(msg.has_label("Work"));
        BOOST_TEST(msg.has_label("\\Important"));
        BOOST_TEST(msg.is_read());
        BOOST_TEST(msg.string_sent_at() == "10/1/24");
    }

    server.join();
    BOOST_REQUIRE(server.received.size() == 2u);
    BOOST_TEST(server.received[1] == "A2 UID FETCH 7 (BODY.PEEK[] FLAGS X-GM-THRID X-GM-MSGID X-GM-LABELS)");
}

BOOST_AUTO_TEST_CASE(fetch_unknown_uid)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        srv.read_line();
        srv.write("A1 OK Success\r\n");
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());
        auto fetched = sess->fetch_by_uid("999", message::FETCH_ITEMS, "");
        BOOST_REQUIRE(!fetched);
        BOOST_TEST((fetched.error().code() == error_code::imap_message_not_found));
    }
    server.join();
}

BOOST_AUTO_TEST_CASE(mutations_send_store_and_copy)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        for (int i = 1; i <= 5; ++i)
        {
            if (srv.read_line().empty())
                return;
            srv.write("A" + std::to_string(i) + " OK Success\r\n");
        }
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());

        message msg(mailbox_ref("INBOX", &*sess), "7");
        BOOST_REQUIRE(msg.star().has_value());
        BOOST_REQUIRE(msg.add_label("My Label").has_value());
        BOOST_REQUIRE(msg.remove_label("Work").has_value());
        BOOST_REQUIRE(msg.move_to("[Gmail]/Trash").has_value());
        BOOST_TEST(sess->selected_mailbox() == "INBOX");
    }

    server.join();
    const std::vector<std::string> expected{
        "A1 SELECT \"INBOX\"",
        "A2 UID STORE 7 +FLAGS (\\Flagged)",
        "A3 UID STORE 7 +X-GM-LABELS (\"My Label\")",
        "A4 UID STORE 7 -X-GM-LABELS (\"Work\")",
        "A5 UID COPY 7 \"[Gmail]/Trash\""};
    BOOST_TEST(server.received == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(commands_follow_the_message_mailbox)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        for (int i = 1; i <= 7; ++i)
        {
            if (srv.read_line().empty())
                return;
            srv.write("A" + std::to_string(i) + " OK Success\r\n");
        }
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());

        message inbox_msg(mailbox_ref("INBOX", &*sess), "3");
        message work_msg(mailbox_ref("Work", &*sess), "7");
        BOOST_REQUIRE(inbox_msg.star().has_value());
        BOOST_REQUIRE(work_msg.star().has_value());
        BOOST_REQUIRE(work_msg.add_label("Caf\xC3\xA9").has_value());
        BOOST_TEST(sess->selected_mailbox() == "Work");
        BOOST_REQUIRE(inbox_msg.move_to("[Gmail]/Trash").has_value());
        BOOST_TEST(sess->selected_mailbox() == "INBOX");
    }

    server.join();
    const std::vector<std::string> expected{
        "A1 SELECT \"INBOX\"",
        "A2 UID STORE 3 +FLAGS (\\Flagged)",
        "A3 SELECT \"Work\"",
        "A4 UID STORE 7 +FLAGS (\\Flagged)",
        "A5 UID STORE 7 +X-GM-LABELS (\"Caf&AOk-\")",
        "A6 SELECT \"INBOX\"",
        "A7 UID COPY 3 \"[Gmail]/Trash\""};
    BOOST_TEST(server.received == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(list_labels_decoded)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        srv.read_line();
        srv.write(
            "* LIST (\\HasNoChildren) \"/\" \"INBOX\"\r\n"
            "* LIST (\\HasChildren \\Noselect) \"/\" \"[Gmail]\"\r\n"
            "* LIST (\\Drafts \\HasNoChildren) \"/\" \"[Gmail]/Entw&APw-rfe\"\r\n"
            "* LIST (\\HasNoChildren \\Trash) \"/\" \"[Gmail]/Trash\"\r\n"
            "* LIST (\\HasNoChildren) \"/\" \"Broken&Jjo\"\r\n"
            "A1 OK Success\r\n");
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());
        auto labels = sess->list_labels();
        BOOST_REQUIRE(labels.has_value());
        BOOST_TEST(labels->size() == 5u);
        BOOST_TEST(labels->contains("INBOX"));
        BOOST_TEST(labels->contains("[Gmail]/Entw\xC3\xBC" "rfe"));
        BOOST_TEST(labels->contains("[Gmail]/Trash"));
        BOOST_TEST(labels->contains("Broken&Jjo"));
    }

    server.join();
    BOOST_REQUIRE(server.received.size() == 1u);
    BOOST_TEST(server.received[0] == "A1 LIST \"\" \"*\"");
}

BOOST_AUTO_TEST_CASE(connection_closed_mid_response)
{
    fake_server server;
    server.run([](fake_server& srv) {
        srv.write(GREETING);
        srv.read_line();
        srv.write("* 1 FETCH (UID 7 BODY[] {500}\r\nshort");
        srv.close();
    });

    {
        asio::io_context ctx;
        auto sess = imap::connect(ctx, "127.0.0.1", server.port());
        BOOST_REQUIRE(sess.has_value());
        auto fetched = sess->fetch_by_uid("7", message::FETCH_ITEMS, "");
        BOOST_REQUIRE(!fetched);
        BOOST_TEST((fetched.error().code() == error_code::connection_closed));
    }
    server.join();
}
