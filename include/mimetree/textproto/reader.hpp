/*

reader.hpp
----------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Line oriented reader of text protocol data and MIME headers, keeping the original bytes next to the parsed values.

*/


#pragma once

#include <array>
#include <istream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/textproto/dot_reader.hpp>
#include <mimetree/textproto/header_key.hpp>
#include <mimetree/export.hpp>


namespace mimetree::textproto
{


/**
Line read from the stream.
**/
struct line_t
{
    /**
    Line content, without the line terminator.
    **/
    std::string line;

    /**
    Bytes consumed from the stream, line terminators included.
    **/
    std::string raw;
};


/**
Header block read from the stream.
**/
struct header_block_t
{
    /**
    Parsed fields.
    **/
    mime_header header;

    /**
    Header lines exactly as read, without the blank line closing the block.
    **/
    std::string raw;

    /**
    Flag if the block was closed by a blank line, false if the stream ended first.
    **/
    bool closed = false;
};


/**
Reader of lines, folded header lines, MIME headers and dot-encoded blocks.

The reader does not own the stream. To bound memory use with untrusted peers, the stream should be limited by the caller.
**/
class MIMETREE_EXPORT reader
{
public:

    /**
    Length of a malformed line above which the error detail is shortened.
    **/
    static constexpr std::string::size_type PREVIEW_LIMIT = 100;

    /**
    Number of bytes kept from each end of a shortened line.
    **/
    static constexpr std::string::size_type PREVIEW_EDGE = 50;

    /**
    Creating a reader over the given stream.

    @param in Stream to read from.
    **/
    explicit reader(std::istream& in) : in_(&in)
    {
    }

    reader(const reader&) = delete;

    reader& operator=(const reader&) = delete;

    /**
    Reading one line, terminated by LF or CRLF.

    @return Line without its terminator, together with the bytes consumed; `error_code::end_of_stream` if nothing is left,
            `error_code::stream_error` if the stream fails.
    **/
    result<line_t> read_line();

    /**
    Reading a header line with its continuation lines.

    Each physical line is trimmed of surrounding spaces and tabs and the pieces are joined by a single space; the raw bytes of all the
    physical lines are kept verbatim.

    @return Unfolded line with the consumed bytes, errors as in `read_line()`.
    **/
    result<line_t> read_continued_line();

    /**
    Reading a MIME header, a sequence of possibly folded `Key: Value` lines ending with a blank line or the end of the stream.

    Keys are canonicalized, values of a repeated key are kept in the order found. The stream is left at the first body byte.

    @return Header with its raw bytes, or `error_code::malformed_header` for a leading continuation line or a line without colon.
    **/
    result<header_block_t> read_mime_header();

    /**
    Starting to decode a dot-encoded block at the current position.

    The returned reader is valid until the next call on this reader; any other read first consumes the rest of the block.

    @return Decoder of the block.
    **/
    textproto::dot_reader& dot_block();

    /**
    Reading a complete dot-encoded block.

    @return Decoded block, or the decoder error.
    **/
    result<std::string> read_dot_bytes();

    /**
    Reading a dot-encoded block line by line.

    @return Lines without terminators and dot escapes, or `error_code::unexpected_eof` if the closing line is missing.
    **/
    result<std::vector<std::string>> read_dot_lines();

    /**
    Reading everything left in the stream.

    @return Remaining bytes.
    **/
    result<std::string> read_remaining();

    /**
    Shortening a line for error reports: lines above `PREVIEW_LIMIT` keep their first and last `PREVIEW_EDGE` bytes around `...`.

    @param line Offending line.
    @return     Preview of the line.
    **/
    static std::string error_preview(std::string_view line);

private:

    /**
    Skipping spaces and tabs at the current position.

    @return Bytes skipped.
    **/
    std::string skip_space();

    /**
    Draining the active dot reader, if any, up to its closing line.
    **/
    void close_dot();

    std::istream* in_;

    std::unique_ptr<textproto::dot_reader> dot_;
};


inline result<line_t> reader::read_line()
{
    close_dot();

    line_t l;
    if (!std::getline(*in_, l.line))
    {
        if (in_->bad())
            return fail<line_t>(error_code::stream_error, "Reading line failed.");
        return fail<line_t>(error_code::end_of_stream);
    }

    l.raw = l.line;
    if (!in_->eof())
    {
        l.raw += '\n';
        if (!l.line.empty() && l.line.back() == '\r')
            l.line.pop_back();
    }
    return l;
}


inline result<line_t> reader::read_continued_line()
{
    auto first = read_line();
    if (!first)
        return first;
    if (first->line.empty())
        return first;

    line_t folded;
    folded.line = std::string(detail::trim_space_tab(first->line));
    folded.raw = std::move(first->raw);

    // The next header key most likely starts with a letter, so there is no continuation to look for.
    const auto next = in_->peek();
    if (next != std::istream::traits_type::eof() && detail::is_ascii_alpha(static_cast<char>(next)))
        return folded;

    while (true)
    {
        std::string skipped = skip_space();
        if (skipped.empty())
            break;
        folded.raw += skipped;

        auto cont = read_line();
        if (!cont)
        {
            if (cont.error().is(error_code::stream_error))
                return cont;
            break;
        }
        folded.line += ' ';
        folded.line += detail::trim_space_tab(cont->line);
        folded.raw += cont->raw;
    }
    return folded;
}


inline result<header_block_t> reader::read_mime_header()
{
    close_dot();
    header_block_t block;

    // The first line cannot start with a leading space.
    const auto first = in_->peek();
    if (first == ' ' || first == '\t')
    {
        auto line = read_line();
        if (!line)
            return fail<header_block_t>(line.error());
        return fail<header_block_t>(error_code::malformed_header, "malformed MIME header initial line", error_preview(line->line));
    }

    while (true)
    {
        auto kv = read_continued_line();
        if (!kv)
        {
            if (kv.error().is(error_code::end_of_stream))
                return block;
            return fail<header_block_t>(kv.error());
        }
        if (kv->line.empty())
        {
            block.closed = true;
            return block;
        }
        block.raw += kv->raw;

        const std::string& text = kv->line;
        auto colon = text.find(':');
        if (colon == std::string::npos)
            return fail<header_block_t>(error_code::malformed_header, "malformed MIME header line", error_preview(text));

        // Key ends at the first colon; trailing spaces violate the grammar but appear in the wild.
        auto end_key = colon;
        while (end_key > 0 && text[end_key - 1] == ' ')
            end_key--;
        std::string key = text.substr(0, end_key);
        canonicalize_mime_header_key(key);
        if (key.empty())
            continue;

        auto value_start = colon + 1;
        while (value_start < text.length() && detail::is_space_or_tab(text[value_start]))
            value_start++;
        block.header.add(key, text.substr(value_start));
    }
}


inline textproto::dot_reader& reader::dot_block()
{
    close_dot();
    dot_ = std::make_unique<textproto::dot_reader>(*in_);
    return *dot_;
}


inline result<std::string> reader::read_dot_bytes()
{
    auto& dot = dot_block();
    std::string data;
    std::array<char, 512> buffer;
    while (true)
    {
        auto got = dot.read(buffer.data(), buffer.size());
        if (!got)
        {
            if (got.error().is(error_code::end_of_stream))
                break;
            return fail<std::string>(got.error());
        }
        data.append(buffer.data(), *got);
    }
    return data;
}


inline result<std::vector<std::string>> reader::read_dot_lines()
{
    std::vector<std::string> lines;
    while (true)
    {
        auto l = read_line();
        if (!l)
        {
            if (l.error().is(error_code::end_of_stream))
                return fail<std::vector<std::string>>(error_code::unexpected_eof, "Stream ended inside a dot block.");
            return fail<std::vector<std::string>>(l.error());
        }

        // A dot by itself marks the end, otherwise one leading dot is cut.
        std::string& line = l->line;
        if (!line.empty() && line.front() == '.')
        {
            if (line.length() == 1)
                break;
            line.erase(0, 1);
        }
        lines.push_back(std::move(line));
    }
    return lines;
}


inline result<std::string> reader::read_remaining()
{
    close_dot();
    std::string rest{std::istreambuf_iterator<char>(*in_), std::istreambuf_iterator<char>()};
    if (in_->bad())
        return fail<std::string>(error_code::stream_error, "Reading body failed.");
    return rest;
}


inline std::string reader::error_preview(std::string_view line)
{
    if (line.length() <= PREVIEW_LIMIT)
        return std::string(line);
    std::string preview(line.substr(0, PREVIEW_EDGE));
    preview += "...";
    preview += line.substr(line.length() - PREVIEW_EDGE);
    return preview;
}


inline std::string reader::skip_space()
{
    std::string skipped;
    while (true)
    {
        const auto next = in_->peek();
        if (next != ' ' && next != '\t')
            break;
        skipped += static_cast<char>(in_->get());
    }
    return skipped;
}


inline void reader::close_dot()
{
    if (!dot_)
        return;

    std::array<char, 128> buffer;
    while (!dot_->finished())
    {
        // The outcome only matters to the owner of the dot reader; here the block is just consumed.
        auto drained = dot_->read(buffer.data(), buffer.size());
        if (!drained && !dot_->finished())
            break;
    }
    dot_.reset();
}


} // namespace mimetree::textproto
