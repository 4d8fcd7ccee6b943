/*

date_time.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <charconv>
#include <chrono>
#include <format>
#include <iterator>
#include <string>
#include <string_view>

#include <gmailxx/detail/ascii.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/config.hpp>


namespace gmailxx
{


/**
Point in time of a `Date` header: the UTC instant and the UTC offset the header was written in.
**/
struct GMAILXX_EXPORT date_time_t
{
    std::chrono::sys_seconds utc{};

    std::chrono::minutes offset{0};

    /**
    Wall clock time in the header's own offset.
    **/
    std::chrono::local_seconds local() const
    {
        return std::chrono::local_seconds{utc.time_since_epoch() + offset};
    }

    bool operator==(const date_time_t&) const = default;
};


namespace date_time_detail
{

inline bool parse_int(std::string_view& in, std::size_t min_digits, std::size_t max_digits, int& out)
{
    std::size_t n = 0;
    while (n < in.size() && n < max_digits && detail::is_ascii_digit(in[n]))
        ++n;
    if (n < min_digits)
        return false;
    const auto conv = std::from_chars(in.data(), in.data() + n, out);
    if (conv.ec != std::errc())
        return false;
    in.remove_prefix(n);
    return true;
}

inline bool consume_char(std::string_view& in, char expected)
{
    if (!in.empty() && in.front() == expected)
    {
        in.remove_prefix(1);
        return true;
    }
    return false;
}

inline void skip_space(std::string_view& in)
{
    while (!in.empty() && (in.front() == ' ' || in.front() == '\t' || in.front() == '\r' || in.front() == '\n'))
        in.remove_prefix(1);
}

inline unsigned month_from_abbrev(std::string_view mon)
{
    static constexpr std::array<std::string_view, 12> months = {
        "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
    for (unsigned i = 0; i < months.size(); ++i)
        if (detail::iequals_ascii(months[i], mon))
            return i + 1;
    return 0;
}

/// Obsolete zone names of RFC 5322 section 4.3, offsets in hours.
inline bool obsolete_zone_offset(std::string_view zone, int& hours)
{
    struct entry { std::string_view name; int hours; };
    static constexpr std::array<entry, 11> zones = {{
        {"UT", 0}, {"GMT", 0}, {"Z", 0},
        {"EST", -5}, {"EDT", -4}, {"CST", -6}, {"CDT", -5},
        {"MST", -7}, {"MDT", -6}, {"PST", -8}, {"PDT", -7}
    }};
    for (const auto& e : zones)
    {
        if (detail::iequals_ascii(e.name, zone))
        {
            hours = e.hours;
            return true;
        }
    }
    return false;
}

} // namespace date_time_detail


/**
Parsing a `Date` header value as defined by RFC 5322.

The weekday and the seconds are optional, two digit years are mapped as RFC 5322 requires, the zone is either numeric
or one of the obsolete names. A missing zone or an unknown alphabetic zone is taken as `-0000`. A trailing comment is
ignored.

@param value Header value.
@return      Parsed date, or `parse_error`.
**/
[[nodiscard]] inline result<date_time_t> parse_date(std::string_view value)
{
    using namespace date_time_detail;
    auto bad_date = [value]()
    {
        return fail<date_time_t>(error_code::parse_error, "Date parsing error.", std::string(value));
    };

    std::string_view sv = detail::trim_view(value);
    if (sv.empty())
        return bad_date();

    // Optional day of week.
    if (detail::is_ascii_alpha(sv.front()))
    {
        while (!sv.empty() && detail::is_ascii_alpha(sv.front()))
            sv.remove_prefix(1);
        skip_space(sv);
        if (!consume_char(sv, ','))
            return bad_date();
        skip_space(sv);
    }

    int day = 0;
    if (!parse_int(sv, 1, 2, day))
        return bad_date();
    skip_space(sv);

    std::size_t mon_len = 0;
    while (mon_len < sv.size() && detail::is_ascii_alpha(sv[mon_len]))
        ++mon_len;
    const unsigned month = month_from_abbrev(sv.substr(0, mon_len));
    if (month == 0)
        return bad_date();
    sv.remove_prefix(mon_len);
    skip_space(sv);

    std::string_view year_sv = sv;
    int year = 0;
    if (!parse_int(sv, 2, 4, year))
        return bad_date();
    const std::size_t year_digits = year_sv.size() - sv.size();
    if (year_digits == 2)
        year += year < 50 ? 2000 : 1900;
    else if (year_digits == 3)
        year += 1900;
    skip_space(sv);

    int hour = 0, minute = 0, second = 0;
    if (!parse_int(sv, 1, 2, hour) || !consume_char(sv, ':') || !parse_int(sv, 2, 2, minute))
        return bad_date();
    if (consume_char(sv, ':') && !parse_int(sv, 2, 2, second))
        return bad_date();
    skip_space(sv);

    int offset_minutes = 0;
    if (!sv.empty() && (sv.front() == '+' || sv.front() == '-'))
    {
        const int sign = sv.front() == '+' ? 1 : -1;
        sv.remove_prefix(1);
        int tz_h = 0, tz_m = 0;
        if (!parse_int(sv, 2, 2, tz_h) || !parse_int(sv, 2, 2, tz_m) || tz_m > 59)
            return bad_date();
        offset_minutes = sign * (tz_h * 60 + tz_m);
    }
    else if (!sv.empty() && detail::is_ascii_alpha(sv.front()))
    {
        std::size_t zone_len = 0;
        while (zone_len < sv.size() && detail::is_ascii_alpha(sv[zone_len]))
            ++zone_len;
        int hours = 0;
        if (obsolete_zone_offset(sv.substr(0, zone_len), hours))
            offset_minutes = hours * 60;
        sv.remove_prefix(zone_len);
    }
    skip_space(sv);
    if (!sv.empty() && sv.front() != '(')
        return bad_date();

    const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60)
        return bad_date();

    const auto local_tp = std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
        std::chrono::seconds{second};
    const std::chrono::minutes offset{offset_minutes};

    // RFC 5322: local time = utc + offset.
    return date_time_t{std::chrono::sys_seconds{local_tp - offset}, offset};
}


/**
Formatting a date as an RFC 5322 `Date` header value, like `Tue, 01 Oct 2024 09:05:00 +0200`.
**/
inline std::string format_date(const date_time_t& dt)
{
    std::string result = std::format("{:%a, %d %b %Y %H:%M:%S}", dt.local());

    const auto offset_minutes = dt.offset.count();
    const auto abs_minutes = offset_minutes < 0 ? -offset_minutes : offset_minutes;
    std::format_to(std::back_inserter(result), " {}{:02d}{:02d}", offset_minutes < 0 ? '-' : '+', abs_minutes / 60,
        abs_minutes % 60);
    return result;
}


/**
Formatting the day of a date as `M/D/YY` in the date's own offset, like `10/1/24`.
**/
inline std::string format_short_date(const date_time_t& dt)
{
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(dt.local())};
    return std::format("{}/{}/{:%y}", static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), ymd.year());
}


/**
Current time with the offset of the local time zone.
**/
inline date_time_t local_now()
{
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    const auto info = std::chrono::current_zone()->get_info(now);
    return date_time_t{now, std::chrono::duration_cast<std::chrono::minutes>(info.offset)};
}


} // namespace gmailxx
