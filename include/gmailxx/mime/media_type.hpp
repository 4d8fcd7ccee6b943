/*

media_type.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <string>
#include <string_view>

#include <gmailxx/detail/ascii.hpp>
#include <gmailxx/mime/mime.hpp>


namespace gmailxx
{


/**
Guessing the media type of a file from its extension.

@param filename File name or path.
@return         Media type, `application/octet-stream` for an unknown or missing extension.
**/
inline content_type_t guess_media_type(std::string_view filename)
{
    struct entry { std::string_view ext; std::string_view type; std::string_view subtype; };
    static constexpr std::array<entry, 34> types = {{
        // Text
        {"txt", "text", "plain"}, {"text", "text", "plain"}, {"log", "text", "plain"}, {"c", "text", "plain"},
        {"h", "text", "plain"}, {"cpp", "text", "plain"}, {"csv", "text", "csv"}, {"css", "text", "css"},
        {"htm", "text", "html"}, {"html", "text", "html"}, {"ics", "text", "calendar"}, {"xml", "text", "xml"},
        {"js", "text", "javascript"},

        // Images
        {"gif", "image", "gif"}, {"ico", "image", "vnd.microsoft.icon"}, {"jpeg", "image", "jpeg"},
        {"jpg", "image", "jpeg"}, {"png", "image", "png"}, {"svg", "image", "svg+xml"}, {"webp", "image", "webp"},
        {"bmp", "image", "bmp"}, {"tif", "image", "tiff"}, {"tiff", "image", "tiff"},

        // Audio and video
        {"mp3", "audio", "mpeg"}, {"wav", "audio", "x-wav"}, {"mp4", "video", "mp4"},

        // Application
        {"pdf", "application", "pdf"}, {"json", "application", "json"}, {"zip", "application", "zip"},
        {"gz", "application", "gzip"}, {"tar", "application", "x-tar"}, {"doc", "application", "msword"},
        {"xls", "application", "vnd.ms-excel"}, {"eml", "message", "rfc822"}
    }};

    const auto slash = filename.find_last_of("/\\");
    if (slash != std::string_view::npos)
        filename.remove_prefix(slash + 1);
    const auto dot = filename.rfind('.');
    if (dot != std::string_view::npos && dot + 1 < filename.size())
    {
        const std::string_view ext = filename.substr(dot + 1);
        for (const auto& e : types)
            if (detail::iequals_ascii(e.ext, ext))
                return content_type_t(std::string(e.type), std::string(e.subtype));
    }
    return content_type_t("application", "octet-stream");
}


} // namespace gmailxx
