/*

attachment.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <gmailxx/detail/log.hpp>
#include <gmailxx/detail/result.hpp>
#include <gmailxx/mime/mime.hpp>


namespace gmailxx::gmail
{


/**
Decoded attachment of a received message.

The attachment owns its payload, so it stays valid after the message it came from is gone.
**/
class attachment
{
public:

    attachment() = default;

    attachment(std::string name, std::string payload, std::string content_type = {})
        : name_(std::move(name)), payload_(std::move(payload)), content_type_(std::move(content_type))
    {
    }

    /**
    Making an attachment from a MIME part, transfer encoding removed.

    @param part Part with the attachment disposition.
    @return     Attachment, or the decoding error of the part.
    **/
    [[nodiscard]] static result<attachment> from_part(const mime& part)
    {
        auto payload = part.decoded_content();
        if (!payload)
            return fail<attachment>(std::move(payload.error()));
        return attachment(part.filename(), std::move(*payload), part.content_type().media_type());
    }

    /**
    File name, empty if the part carries none.
    **/
    const std::string& name() const noexcept
    {
        return name_;
    }

    const std::string& payload() const noexcept
    {
        return payload_;
    }

    const std::string& content_type() const noexcept
    {
        return content_type_;
    }

    /**
    Payload size in kilobytes of 1000 bytes, rounded up.

    @return Size, zero exactly when the payload is empty.
    **/
    std::size_t size() const noexcept
    {
        return (payload_.size() + 999) / 1000;
    }

    /**
    An attachment of size zero is false.
    **/
    explicit operator bool() const noexcept
    {
        return size() != 0;
    }

    /**
    Writing the payload to a file, overwriting it if it exists.

    @param path Target file, or a directory to write into under the attachment name. Without path the attachment name
                in the current directory is used.
    @return     `invalid_argument` if a name is needed but the attachment has none, `io_error` if writing fails.
    **/
    [[nodiscard]] result_void save(const std::optional<std::filesystem::path>& path = std::nullopt) const
    {
        std::filesystem::path target;
        std::error_code ec;
        if (path && !std::filesystem::is_directory(*path, ec))
            target = *path;
        else
        {
            if (name_.empty())
                return fail(error_code::invalid_argument, "Attachment has no name to save under.");
            const std::filesystem::path file_name = std::filesystem::path(name_).filename();
            target = path ? *path / file_name : file_name;
        }

        std::ofstream file(target, std::ios::binary | std::ios::trunc);
        if (!file)
            return fail(error_code::io_error, "Cannot open file for writing.", target.string());
        file.write(payload_.data(), static_cast<std::streamsize>(payload_.size()));
        file.close();
        if (!file)
            return fail(error_code::io_error, "Cannot write file.", target.string());

        GMAILXX_DEBUG("attachment: saved " + std::to_string(payload_.size()) + " bytes to " + target.string());
        return ok();
    }

private:

    std::string name_;

    std::string payload_;

    std::string content_type_;
};


} // namespace gmailxx::gmail
