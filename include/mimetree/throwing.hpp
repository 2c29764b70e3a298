/*

throwing.hpp
------------

Helpers to bridge mimetree::result into exceptions for users who prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <utility>

#include <mimetree/config.hpp>
#include <mimetree/detail/result.hpp>

namespace mimetree
{

#if !MIMETREE_THROWING_ENABLED
#error "MIMETREE_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error err)
        : std::runtime_error(err.to_string()), error_(std::move(err))
    {
    }

    [[nodiscard]] const error& info() const noexcept { return error_; }

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

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace mimetree
