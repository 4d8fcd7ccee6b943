#pragma once

#include <string>
#include <gmailxx/config.hpp>

#if GMAILXX_USE_STD_REGEX
#include <regex>
#else
#include <boost/regex.hpp>
#endif

namespace gmailxx::detail
{
#if GMAILXX_USE_STD_REGEX
using regex = std::regex;
using smatch = std::smatch;

inline bool regex_search(const std::string& input, smatch& matches, const regex& pattern)
{
    return std::regex_search(input, matches, pattern);
}
#else
using regex = boost::regex;
using smatch = boost::smatch;

inline bool regex_search(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_search(input, matches, pattern);
}
#endif
} // namespace gmailxx::detail
