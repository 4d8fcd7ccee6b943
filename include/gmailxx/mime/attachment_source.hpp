/*

attachment_source.hpp
---------------------

Source of an outgoing attachment: a ready MIME part, or a file loaded when the message is composed.

*/

#pragma once

#include <string>
#include <utility>

#include <gmailxx/mime/mime.hpp>

namespace gmailxx
{

enum class source_kind { mime_part, file_path };

struct attachment_source
{
    source_kind kind{source_kind::mime_part};
    std::string path;
    mime part;

    static attachment_source from_path(std::string file_path)
    {
        attachment_source src;
        src.kind = source_kind::file_path;
        src.path = std::move(file_path);
        return src;
    }

    static attachment_source from_part(mime mime_part)
    {
        attachment_source src;
        src.kind = source_kind::mime_part;
        src.part = std::move(mime_part);
        return src;
    }
};

} // namespace gmailxx
