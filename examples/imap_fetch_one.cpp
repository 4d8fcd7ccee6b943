/*

imap_fetch_one.cpp
------------------

Connects to a preauthenticated IMAP endpoint (like a local bridge to Gmail), loads one message of the inbox and stars
it.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <gmailxx/gmailxx.hpp>
#include "example_util.hpp"


using gmailxx::gmail::mailbox_ref;
using gmailxx::gmail::message;
using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    const std::string host = argc > 1 ? argv[1] : "127.0.0.1";
    const std::string port = argc > 2 ? argv[2] : "1143";
    const std::string uid = argc > 3 ? argv[3] : "1";

    gmailxx::log::logger::instance().set_trace_enabled(true);

    boost::asio::io_context io_ctx;
    auto conn = gmailxx::imap::connect(io_ctx, host, port);
    if (!conn)
    {
        print_error(conn.error());
        return EXIT_FAILURE;
    }

    if (auto selected = conn->select("INBOX"); !selected)
    {
        print_error(selected.error());
        return EXIT_FAILURE;
    }

    message msg(mailbox_ref("INBOX", &*conn), uid);
    try
    {
        cout << "subject: " << msg.subject() << endl;
        cout << "from: " << msg.from_address() << endl;
        cout << "sent: " << msg.string_sent_at() << endl;
        for (const auto& label : msg.labels())
            cout << "label: " << label << endl;
        for (const auto& att : msg.attachments())
            cout << "attachment: " << att.name() << " (" << att.size() << " kB)" << endl;
    }
    catch (const gmailxx::exception& exc)
    {
        cout << exc.what() << endl;
        return EXIT_FAILURE;
    }

    if (auto starred = msg.star(); !starred)
        print_error(starred.error());

    if (auto out = conn->logout(); !out)
        print_error(out.error());
    return EXIT_SUCCESS;
}
