/*

dot_reader.hpp
--------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Decoder of dot-encoded blocks.

Dot encoding is the framing of data blocks in text protocols such as SMTP and NNTP: a sequence of lines, each ending in CRLF, closed by a
line holding a single dot. Lines starting with a dot are escaped with an additional dot.

*/


#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree::textproto
{


/**
Reader of the decoded content of a dot-encoded block.

Leading dot escapes are removed, CRLF line endings become LF, and reading stops after the closing dot line has been consumed.
**/
class MIMETREE_EXPORT dot_reader
{
public:

    /**
    Decoder states.
    **/
    enum class state_t : std::uint8_t
    {
        BEGIN_LINE, // beginning of line, initial state
        DOT,        // read `.` at beginning of line
        DOT_CR,     // read `.\r` at beginning of line
        CR,         // read `\r`, possibly at end of line
        DATA,       // reading data in the middle of a line
        END         // reached the `.\r\n` end marker line
    };

    /**
    Starting to decode at the current position of the stream.

    @param in Stream positioned at the first byte of the block.
    **/
    explicit dot_reader(std::istream& in) : in_(&in)
    {
    }

    dot_reader(const dot_reader&) = delete;

    dot_reader& operator=(const dot_reader&) = delete;

    /**
    Decoding the next bytes of the block.

    @param buffer Destination of the decoded bytes.
    @param size   Capacity of the destination.
    @return       Number of bytes stored, at least one; `error_code::end_of_stream` once the block is complete,
                  `error_code::unexpected_eof` when the stream ends before the closing line.
    **/
    result<std::size_t> read(char* buffer, std::size_t size)
    {
        if (pending_)
        {
            error err = std::move(*pending_);
            pending_.reset();
            finished_ = true;
            return fail<std::size_t>(std::move(err));
        }
        if (state_ == state_t::END)
        {
            finished_ = true;
            return fail<std::size_t>(error_code::end_of_stream);
        }

        std::size_t count = 0;
        while (count < size && state_ != state_t::END)
        {
            const auto got = in_->get();
            if (got == std::istream::traits_type::eof())
            {
                error err = in_->bad() ? error(error_code::stream_error, "Reading dot block failed.") :
                    error(error_code::unexpected_eof, "Stream ended inside a dot block.");
                if (count == 0)
                {
                    finished_ = true;
                    return fail<std::size_t>(std::move(err));
                }
                pending_ = std::move(err);
                return count;
            }

            char ch = static_cast<char>(got);
            switch (state_)
            {
                case state_t::BEGIN_LINE:
                    if (ch == '.')
                    {
                        state_ = state_t::DOT;
                        continue;
                    }
                    if (ch == '\r')
                    {
                        state_ = state_t::CR;
                        continue;
                    }
                    state_ = state_t::DATA;
                    break;

                case state_t::DOT:
                    if (ch == '\r')
                    {
                        state_ = state_t::DOT_CR;
                        continue;
                    }
                    if (ch == '\n')
                    {
                        state_ = state_t::END;
                        continue;
                    }
                    state_ = state_t::DATA;
                    break;

                case state_t::DOT_CR:
                    if (ch == '\n')
                    {
                        state_ = state_t::END;
                        continue;
                    }
                    // Not part of `.\r\n`: drop the leading dot and emit the saved `\r`.
                    in_->unget();
                    ch = '\r';
                    state_ = state_t::DATA;
                    break;

                case state_t::CR:
                    if (ch == '\n')
                    {
                        state_ = state_t::BEGIN_LINE;
                        break;
                    }
                    // Not part of `\r\n`: emit the saved `\r`.
                    in_->unget();
                    ch = '\r';
                    state_ = state_t::DATA;
                    break;

                case state_t::DATA:
                    if (ch == '\r')
                    {
                        state_ = state_t::CR;
                        continue;
                    }
                    if (ch == '\n')
                        state_ = state_t::BEGIN_LINE;
                    break;

                case state_t::END:
                    break;
            }
            buffer[count++] = ch;
        }

        if (count == 0 && state_ == state_t::END)
        {
            finished_ = true;
            return fail<std::size_t>(error_code::end_of_stream);
        }
        return count;
    }

    /**
    Checking whether the block has been consumed up to its end, or reading failed.

    @return True if no more reads are possible.
    **/
    bool finished() const
    {
        return finished_;
    }

    /**
    Current decoder state.
    **/
    state_t state() const
    {
        return state_;
    }

private:

    std::istream* in_;

    state_t state_{state_t::BEGIN_LINE};

    /**
    Error met after some bytes were already stored, reported by the next read.
    **/
    std::optional<error> pending_;

    bool finished_{false};
};


} // namespace mimetree::textproto
