/*

flags.hpp
---------

System flags as they appear on the wire.

*/

#pragma once

#include <string_view>

namespace gmailxx::gmail::flags
{

inline constexpr std::string_view seen{"\\Seen"};
inline constexpr std::string_view flagged{"\\Flagged"};
inline constexpr std::string_view deleted{"\\Deleted"};
inline constexpr std::string_view draft{"\\Draft"};

} // namespace gmailxx::gmail::flags
