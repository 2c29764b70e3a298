/*

builder.hpp
-----------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Serialization of a message tree back to bytes.

*/


#pragma once

#include <format>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <mimetree/codec/codec.hpp>
#include <mimetree/codec/transfer_encoding.hpp>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/log.hpp>
#include <mimetree/mime/message.hpp>
#include <mimetree/textproto/header_key.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Writer of message trees.

A node whose header is unchanged is written with its original header bytes; other headers are generated from the fields, following the
original field order where known.
**/
class MIMETREE_EXPORT builder
{
public:

    /**
    Prefix of the multipart delimiters.
    **/
    static constexpr std::string_view DELIMITER_DASHES{"--"};

    /**
    Separator of a header name and its value.
    **/
    static constexpr std::string_view HEADER_SEPARATOR{": "};

    /**
    Line terminator of the generated lines.
    **/
    const std::string& newline() const
    {
        return newline_;
    }

    void newline(std::string terminator)
    {
        newline_ = std::move(terminator);
    }

    /**
    Writing a message: header, blank line and body.

    A missing boundary of a multipart node is generated and stored in the node.

    @param msg Message to write.
    @return    Message bytes.
    **/
    std::string build(message& msg) const;

    /**
    Writing the header of a message, without the final line terminator.

    @param msg Message whose header is written.
    @return    Header bytes.
    **/
    std::string build_header(const message& msg) const;

    /**
    Writing the body of a message: the nested message, the body bytes and the parts with their delimiters.

    @param msg Message whose body is written.
    @return    Body bytes.
    **/
    std::string build_body(message& msg) const;

    /**
    Setting a header field, patching the original header bytes in place.

    The first line of the original header holding `field` is replaced together with its continuation lines; when there is no such
    line, the field is appended. The rest of the original header is kept byte for byte.

    @param msg   Message to change.
    @param field Field name.
    @param value Field value.
    **/
    void set_header_field(message& msg, std::string_view field, std::string_view value) const;

private:

    std::string newline_{codec::END_OF_LINE};
};


inline std::string builder::build(message& msg) const
{
    std::string out = build_header(msg);
    out += newline_;
    out += newline_;

    std::string body = build_body(msg);
    // The nested message was decoded to be parsed, so it is encoded back.
    if (msg.is_decoded())
        body = encode_by_content_encoding(body, msg.header().get("Content-Transfer-Encoding"), newline_);
    out += body;
    return out;
}


inline std::string builder::build_header(const message& msg) const
{
    if (!msg.raw_original_header().empty() && !msg.header_changed())
        return std::string(detail::trim_right_crlf(msg.raw_original_header()));

    std::string out;
    auto add_line = [this, &out](std::string_view name, std::string_view value)
    {
        if (!out.empty())
            out += newline_;
        out += name;
        out += HEADER_SEPARATOR;
        out += value;
    };

    std::set<std::string> added;
    for (const auto& name : msg.header_order())
    {
        std::string key = textproto::canonical_mime_header_key(name);
        if (!msg.header().contains(key) || added.contains(key))
            continue;
        for (const auto& value : msg.header().values(key))
            add_line(name, value);
        added.insert(std::move(key));
    }

    for (const auto& [key, values] : msg.header())
    {
        if (added.contains(key))
            continue;
        for (const auto& value : values)
        {
            if (!value.empty())
                add_line(key, value);
        }
    }
    return out;
}


inline std::string builder::build_body(message& msg) const
{
    std::string out;
    if (msg.is_rfc822())
        out += build(*msg.body_message());
    else if (!msg.body().empty())
        out += msg.body();

    if (msg.is_multipart())
    {
        if (msg.boundary().empty())
        {
            msg.boundary(random_boundary());
            MIMETREE_DEBUG(std::format("Boundary generated for {}.", msg.idx()));
        }

        const std::string delimiter = std::string(DELIMITER_DASHES) + msg.boundary();
        bool first = true;
        for (const auto& part : msg.parts())
        {
            if (!first)
                out += newline_;
            first = false;
            out += newline_ + delimiter + newline_;
            out += build(*part);
        }
        out += newline_ + delimiter + std::string(DELIMITER_DASHES) + newline_;
    }
    return out;
}


void inline builder::set_header_field(message& msg, std::string_view field, std::string_view value) const
{
    msg.header().set(field, std::string(value));
    if (msg.raw_original_header().empty())
        return;

    const std::string& raw = msg.raw_original_header();
    const std::string pair = std::string(field) + std::string(HEADER_SEPARATOR) + std::string(value);

    std::string::size_type start = 0;
    while (start < raw.length())
    {
        auto eol = raw.find('\n', start);
        auto next = eol == std::string::npos ? raw.length() : eol + 1;
        std::string_view line(raw.data() + start, (eol == std::string::npos ? raw.length() : eol) - start);

        auto colon = line.find(':');
        if (!line.empty() && !detail::is_space_or_tab(line.front()) && colon != std::string_view::npos)
        {
            std::string_view name = line.substr(0, colon);
            while (!name.empty() && name.back() == ' ')
                name.remove_suffix(1);
            if (detail::iequals_ascii(name, field))
            {
                // The field spans its continuation lines.
                while (next < raw.length() && detail::is_space_or_tab(raw[next]))
                {
                    eol = raw.find('\n', next);
                    next = eol == std::string::npos ? raw.length() : eol + 1;
                }

                std::string patched = raw.substr(0, start);
                patched += pair;
                if (next < raw.length())
                {
                    patched += newline_;
                    patched += raw.substr(next);
                }
                msg.raw_original_header(std::move(patched));
                return;
            }
        }
        start = next;
    }

    std::string patched(detail::trim_right_crlf(raw));
    patched += newline_;
    patched += pair;
    msg.raw_original_header(std::move(patched));
    msg.append_header_order(std::string(field));
}


} // namespace mimetree
