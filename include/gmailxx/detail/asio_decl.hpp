/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Boost.Asio declarations used by the blocking network layer of gmailxx.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101200 // Boost.Asio 1.12.0
#error "Boost.Asio version 1.12.0 or higher is required (Boost 1.66+)"
#endif

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace gmailxx::asio
{
    // Core types
    using boost::asio::buffer;
    using boost::asio::io_context;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Blocking operations
    using boost::asio::connect;
    using boost::asio::read;
    using boost::asio::read_until;
    using boost::asio::write;
    using boost::asio::dynamic_buffer;
    using boost::asio::transfer_exactly;

    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;
} // namespace gmailxx::asio
