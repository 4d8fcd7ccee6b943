#pragma once

#include <iostream>
#include <gmailxx/detail/result.hpp>

inline void print_error(const gmailxx::error& err)
{
    std::cout << "Error: " << gmailxx::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    if (!err.server_response().empty())
        std::cout << "Server: " << err.server_response() << "\n";
}
