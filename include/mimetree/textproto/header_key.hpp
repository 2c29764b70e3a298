/*

header_key.hpp
--------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Canonical form of MIME header field names.

*/

#pragma once

#include <string>
#include <string_view>
#include <mimetree/detail/ascii.hpp>

namespace mimetree::textproto
{

/**
Checking whether a byte may appear in a header field name (RFC 7230 token).

@param ch Byte to check.
@return   True for a token byte.
**/
[[nodiscard]] constexpr bool valid_header_field_byte(char ch) noexcept
{
    return detail::is_token_char(ch);
}


/**
Rewriting a field name in place to canonical form: first letter and every letter after a hyphen in upper case, the rest in lower case.

A name with a space or any other non-token byte is left as it is.

@param key Field name to rewrite.
**/
inline void canonicalize_mime_header_key(std::string& key)
{
    for (char ch : key)
    {
        if (!valid_header_field_byte(ch))
            return;
    }

    bool upper = true;
    for (char& ch : key)
    {
        ch = upper ? detail::ascii_toupper(ch) : detail::ascii_tolower(ch);
        upper = ch == '-';
    }
}


/**
Canonical form of a MIME header field name, for example `Content-Type` for `content-TYPE`.

@param key Field name.
@return    Canonical name; `key` unchanged when it holds a non-token byte or is already canonical.
**/
[[nodiscard]] inline std::string canonical_mime_header_key(std::string_view key)
{
    bool upper = true;
    for (char ch : key)
    {
        if (!valid_header_field_byte(ch))
            return std::string(key);
        if ((upper && ch >= 'a' && ch <= 'z') || (!upper && ch >= 'A' && ch <= 'Z'))
        {
            std::string canonical(key);
            canonicalize_mime_header_key(canonical);
            return canonical;
        }
        upper = ch == '-';
    }
    return std::string(key);
}

} // namespace mimetree::textproto
