/*

compose_message.cpp
-------------------

Composes a message with an HTML body and an attachment, and prints it.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <gmailxx/mime/composer.hpp>
#include "example_util.hpp"


using gmailxx::attachment_source;
using gmailxx::compose_options;
using std::cout;


int main(int argc, char* argv[])
{
    compose_options opts;
    opts.subject = "R\xC3\xA9sum\xC3\xA9 du trimestre";
    opts.sender = "gmailxx <gmailxx@example.com>";
    opts.to = "recipient <recipient@example.com>";
    opts.text = "<h1>Quarterly summary</h1><p>See the attached file.</p>";
    opts.is_html = true;
    if (argc > 1)
        opts.attachments.push_back(attachment_source::from_path(argv[1]));

    auto msg = gmailxx::compose(opts);
    if (!msg)
    {
        print_error(msg.error());
        return EXIT_FAILURE;
    }

    cout << msg->format();
    return EXIT_SUCCESS;
}
