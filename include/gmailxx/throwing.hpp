/*

throwing.hpp
------------

Helpers to bridge gmailxx::result into exceptions for users who prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <utility>

#include <gmailxx/config.hpp>
#include <gmailxx/detail/result.hpp>

namespace gmailxx
{

#if !GMAILXX_THROWING_ENABLED
#error "GMAILXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error err)
        : std::runtime_error(err.to_string()),
          error_(std::move(err))
    {
    }

    [[nodiscard]] const error& err() const noexcept { return error_; }

    [[nodiscard]] error_code code() const noexcept { return error_.code(); }

private:
    error error_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result_void&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace gmailxx
