/*

media_type.hpp
--------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Parser of `Content-Type` style values: a media type followed by semicolon separated parameters.

*/


#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Parsed media type.
**/
struct MIMETREE_EXPORT media_type
{
    /**
    Parameters keyed by lower-cased name.
    **/
    using params_t = std::map<std::string, std::string>;

    /**
    Lower-cased `type/subtype`.
    **/
    std::string value;

    params_t params;

    /**
    Getting a parameter.

    @param name Lower-cased parameter name.
    @return     Parameter value, empty string if absent.
    **/
    std::string param(const std::string& name) const
    {
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    }
};


namespace detail
{


/**
Quote character of parameter values.
**/
inline constexpr char QUOTE_CHAR = '"';


/**
Parameter separator.
**/
inline constexpr char PARAM_SEPARATOR = ';';


/**
Separator of a parameter name and its value.
**/
inline constexpr char PARAM_VALUE_SEPARATOR = '=';


inline std::string_view trim_left_space(std::string_view text)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r' || text.front() == '\n'))
        text.remove_prefix(1);
    return text;
}


/**
Consuming a token at the start of the text.

@param text Text to consume, advanced past the token.
@return     Token, empty if the text does not start with one.
**/
inline std::string_view consume_token(std::string_view& text)
{
    std::string_view::size_type length = 0;
    while (length < text.length() && is_token_char(text[length]))
        length++;
    auto token = text.substr(0, length);
    text.remove_prefix(length);
    return token;
}


/**
Consuming a parameter value, either a token or a quoted string.

@param text     Text to consume, advanced past the value on success.
@param value    Unquoted value.
@return         False if no value could be read.
**/
inline bool consume_value(std::string_view& text, std::string& value)
{
    if (text.empty())
        return false;
    if (text.front() != QUOTE_CHAR)
    {
        value = consume_token(text);
        return !value.empty();
    }

    std::string unquoted;
    for (std::string_view::size_type i = 1; i < text.length(); i++)
    {
        const char ch = text[i];
        if (ch == QUOTE_CHAR)
        {
            value = std::move(unquoted);
            text.remove_prefix(i + 1);
            return true;
        }
        if (ch == '\\' && i + 1 < text.length())
        {
            unquoted += text[++i];
            continue;
        }
        if (ch == '\r' || ch == '\n')
            return false;
        unquoted += ch;
    }
    // unterminated quoted string
    return false;
}


} // namespace detail


/**
Parsing a media type with its parameters, for example `multipart/mixed; boundary="abc"`.

@param text Header value.
@return     Media type, or `error_code::media_type_error` for a missing or invalid type, a malformed or repeated parameter.
**/
inline result<media_type> parse_media_type(std::string_view text)
{
    auto semicolon = text.find(detail::PARAM_SEPARATOR);
    std::string_view type = detail::trim_space_tab(text.substr(0, semicolon));
    if (type.empty())
        return fail<media_type>(error_code::media_type_error, "No media type found.");

    std::string_view rest = type;
    auto major = detail::consume_token(rest);
    if (major.empty() || rest.empty() || rest.front() != '/')
        return fail<media_type>(error_code::media_type_error, "Media type without subtype.", std::string(type));
    rest.remove_prefix(1);
    auto minor = detail::consume_token(rest);
    if (minor.empty() || !rest.empty())
        return fail<media_type>(error_code::media_type_error, "Invalid media type.", std::string(type));

    media_type mt;
    mt.value.reserve(type.length());
    for (char ch : type)
        mt.value += detail::ascii_tolower(ch);

    std::string_view params = semicolon == std::string_view::npos ? std::string_view() : text.substr(semicolon);
    while (true)
    {
        params = detail::trim_left_space(params);
        if (params.empty())
            break;
        if (params.front() != detail::PARAM_SEPARATOR)
            return fail<media_type>(error_code::media_type_error, "Missing parameter separator.", std::string(params));
        params.remove_prefix(1);
        params = detail::trim_left_space(params);
        // trailing semicolon
        if (params.empty())
            break;

        auto name = detail::consume_token(params);
        if (name.empty())
            return fail<media_type>(error_code::media_type_error, "Invalid media parameter.", std::string(params));
        params = detail::trim_left_space(params);
        if (params.empty() || params.front() != detail::PARAM_VALUE_SEPARATOR)
            return fail<media_type>(error_code::media_type_error, "Media parameter without value.", std::string(name));
        params.remove_prefix(1);
        params = detail::trim_left_space(params);

        std::string value;
        if (!detail::consume_value(params, value))
            return fail<media_type>(error_code::media_type_error, "Invalid media parameter value.", std::string(name));

        std::string key;
        key.reserve(name.length());
        for (char ch : name)
            key += detail::ascii_tolower(ch);
        if (!mt.params.emplace(std::move(key), std::move(value)).second)
            return fail<media_type>(error_code::media_type_error, "Duplicate media parameter.", std::string(name));
    }
    return mt;
}


} // namespace mimetree
