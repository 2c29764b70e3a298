/*

multipart.hpp
-------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Splitting of a multipart body into its parts.

*/


#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/log.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/textproto/reader.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Part of a multipart body.
**/
struct part_t
{
    mime_header header;

    /**
    Header lines as read, without the blank separator line.
    **/
    std::string raw_header;

    /**
    Bytes between the header and the line terminator preceding the next delimiter.
    **/
    std::string body;
};


/**
Scanner of the parts delimited by a boundary.

Delimiters are recognized only at the beginning of a line. The preamble before the first delimiter and the epilogue after the close
delimiter are skipped.
**/
class MIMETREE_EXPORT multipart_reader
{
public:

    /**
    Prefix of every delimiter line, and suffix of the close delimiter.
    **/
    static constexpr std::string_view DASHES{"--"};

    /**
    Scanning the given body.

    @param body     Multipart body.
    @param boundary Boundary taken from the `Content-Type` header.
    **/
    multipart_reader(std::string body, std::string boundary) : body_(std::move(body)), delimiter_(std::string(DASHES) + boundary)
    {
    }

    multipart_reader(const multipart_reader&) = delete;

    multipart_reader& operator=(const multipart_reader&) = delete;

    /**
    Reading the next part.

    @return Part in document order; `error_code::end_of_stream` after the last one, `error_code::multipart_error` if the body holds
            no delimiter, or the error of a malformed part header.
    **/
    result<part_t> next_part();

private:

    /**
    Kind of line met while scanning.
    **/
    enum class line_kind_t {CONTENT, DELIMITER, CLOSE_DELIMITER};

    /**
    Classifying the line starting at the given position.

    @param start Position of the first byte of the line.
    @param next  Position after the line terminator.
    @return      Kind of the line.
    **/
    line_kind_t classify_line(std::string::size_type start, std::string::size_type& next) const;

    /**
    Parsing a part from its bytes.

    @param content Bytes between two delimiters, without the terminator preceding the second.
    @return        Part, or the header error.
    **/
    static result<part_t> parse_part(const std::string& content);

    std::string body_;

    std::string delimiter_;

    /**
    Position of the next unread byte.
    **/
    std::string::size_type pos_{0};

    bool started_{false};

    bool done_{false};
};


inline result<part_t> multipart_reader::next_part()
{
    if (done_)
        return fail<part_t>(error_code::end_of_stream);

    if (!started_)
    {
        // Skipping the preamble up to the first delimiter.
        std::string::size_type start = 0;
        while (true)
        {
            if (start >= body_.length())
            {
                done_ = true;
                return fail<part_t>(error_code::multipart_error, "Multipart body without delimiter.", delimiter_);
            }
            std::string::size_type next = 0;
            auto kind = classify_line(start, next);
            if (kind == line_kind_t::CLOSE_DELIMITER)
            {
                done_ = true;
                return fail<part_t>(error_code::end_of_stream);
            }
            if (kind == line_kind_t::DELIMITER)
            {
                pos_ = next;
                break;
            }
            start = next;
        }
        started_ = true;
    }

    std::string::size_type start = pos_;
    while (start < body_.length())
    {
        std::string::size_type next = 0;
        auto kind = classify_line(start, next);
        if (kind != line_kind_t::CONTENT)
        {
            // The line terminator before the delimiter belongs to the delimiter.
            std::string::size_type end = start;
            if (end > pos_ && body_[end - 1] == '\n')
            {
                end--;
                if (end > pos_ && body_[end - 1] == '\r')
                    end--;
            }
            std::string content = body_.substr(pos_, end - pos_);
            pos_ = next;
            done_ = kind == line_kind_t::CLOSE_DELIMITER;
            return parse_part(content);
        }
        start = next;
    }

    MIMETREE_DEBUG("Multipart body without close delimiter, the last part ends the body.");
    done_ = true;
    if (pos_ >= body_.length())
        return fail<part_t>(error_code::end_of_stream);
    return parse_part(body_.substr(pos_));
}


inline multipart_reader::line_kind_t multipart_reader::classify_line(std::string::size_type start, std::string::size_type& next) const
{
    auto eol = body_.find('\n', start);
    next = eol == std::string::npos ? body_.length() : eol + 1;
    std::string_view line(body_.data() + start, (eol == std::string::npos ? body_.length() : eol) - start);
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    if (!line.starts_with(delimiter_))
        return line_kind_t::CONTENT;
    line.remove_prefix(delimiter_.length());

    line_kind_t kind = line_kind_t::DELIMITER;
    if (line.starts_with(DASHES))
    {
        line.remove_prefix(DASHES.length());
        kind = line_kind_t::CLOSE_DELIMITER;
    }
    // only transport padding may follow
    return detail::trim_space_tab(line).empty() ? kind : line_kind_t::CONTENT;
}


inline result<part_t> multipart_reader::parse_part(const std::string& content)
{
    std::istringstream in(content);
    textproto::reader rd(in);
    auto header = rd.read_mime_header();
    if (!header)
        return fail<part_t>(header.error());
    auto body = rd.read_remaining();
    if (!body)
        return fail<part_t>(body.error());

    part_t part;
    part.header = std::move(header->header);
    part.raw_header = std::move(header->raw);
    part.body = std::move(*body);
    return part;
}


} // namespace mimetree
