/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Quoted Printable transfer encoding (RFC 2045, section 6.7).

*/


#pragma once

#include <string>
#include <string_view>
#include <mimetree/codec/codec.hpp>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Quoted Printable codec.

The encoder keeps CRLF pairs of the input as hard line breaks and escapes everything the decoder would otherwise alter (bare CR or LF,
whitespace in front of a line break), so decoding an encoded string gives the original bytes back.
**/
class MIMETREE_EXPORT quoted_printable : public codec
{
public:

    /**
    Setting the encoder line policies.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    quoted_printable(std::string::size_type line1_policy = LINE_LENGTH, std::string::size_type lines_policy = LINE_LENGTH)
        : codec(line1_policy, lines_policy)
    {
    }

    quoted_printable(const quoted_printable&) = delete;

    quoted_printable(quoted_printable&&) = delete;

    /**
    Default destructor.
    **/
    ~quoted_printable() = default;

    void operator=(const quoted_printable&) = delete;

    void operator=(quoted_printable&&) = delete;

    /**
    Encoding a string to quoted printable.

    Soft line breaks are inserted so that no encoded line exceeds the line policy, the soft break `=` included.

    @param text String to encode.
    @return     Encoded string, hard and soft line breaks as CRLF.
    **/
    std::string encode(std::string_view text) const
    {
        std::string enc_text;
        enc_text.reserve(text.length() + text.length() / 8);
        std::string::size_type line_len = 0;
        std::string::size_type policy = line1_policy_;

        auto at_line_end = [&text](std::string::size_type pos)
        {
            return pos + 1 == text.length() || (text[pos + 1] == CR_CHAR && pos + 2 < text.length() && text[pos + 2] == LF_CHAR);
        };

        for (std::string::size_type pos = 0; pos < text.length(); pos++)
        {
            const char ch = text[pos];
            if (ch == CR_CHAR && pos + 1 < text.length() && text[pos + 1] == LF_CHAR)
            {
                enc_text += END_OF_LINE;
                line_len = 0;
                policy = lines_policy_;
                pos++;
                continue;
            }

            const bool literal = (ch > SPACE_CHAR && ch <= TILDE_CHAR && ch != EQUAL_CHAR) ||
                ((ch == SPACE_CHAR || ch == TAB_CHAR) && !at_line_end(pos));
            const std::string::size_type token_len = literal ? 1 : 3;

            // Keep one column for the soft break character.
            if (line_len + token_len > policy - 1)
            {
                enc_text += EQUAL_CHAR;
                enc_text += END_OF_LINE;
                line_len = 0;
                policy = lines_policy_;
            }

            if (literal)
                enc_text += ch;
            else
            {
                const auto octet = static_cast<unsigned char>(ch);
                enc_text += EQUAL_CHAR;
                enc_text += HEX_DIGITS[(octet >> 4) & 0x0F];
                enc_text += HEX_DIGITS[octet & 0x0F];
            }
            line_len += token_len;
        }

        return enc_text;
    }

    /**
    Decoding a quoted printable string.

    Transport padding at the end of each line is dropped, soft line breaks are removed, hard line breaks are kept as found in the input.
    Hexadecimal digits are accepted in both cases; eight bit octets pass through.

    @param text Quoted printable string.
    @return     Decoded string, or `error_code::transfer_decode_error` for a bad escape sequence or an unescaped control character.
    **/
    result<std::string> decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.length());

        std::string::size_type start = 0;
        while (start < text.length())
        {
            auto end = text.find(LF_CHAR, start);
            std::string_view terminator;
            std::string_view line;
            if (end == std::string_view::npos)
            {
                line = text.substr(start);
                start = text.length();
            }
            else
            {
                line = text.substr(start, end - start);
                terminator = text.substr(end, 1);
                if (!line.empty() && line.back() == CR_CHAR)
                {
                    line.remove_suffix(1);
                    terminator = text.substr(end - 1, 2);
                }
                start = end + 1;
            }

            while (!line.empty() && detail::is_space_or_tab(line.back()))
                line.remove_suffix(1);

            bool soft_break = false;
            if (!line.empty() && line.back() == EQUAL_CHAR)
            {
                soft_break = true;
                line.remove_suffix(1);
            }

            for (std::string::size_type pos = 0; pos < line.length(); pos++)
            {
                const char ch = line[pos];
                if (ch == EQUAL_CHAR)
                {
                    const int high = pos + 1 < line.length() ? detail::hex_digit_value(line[pos + 1]) : -1;
                    const int low = pos + 2 < line.length() ? detail::hex_digit_value(line[pos + 2]) : -1;
                    if (high < 0 || low < 0)
                        return fail<std::string>(error_code::transfer_decode_error, "Bad quoted printable escape.",
                            std::string(line.substr(pos, 3)));
                    dec_text += static_cast<char>((high << 4) + low);
                    pos += 2;
                    continue;
                }

                const auto octet = static_cast<unsigned char>(ch);
                if ((octet < 32 && ch != TAB_CHAR && ch != CR_CHAR) || octet == 127)
                    return fail<std::string>(error_code::transfer_decode_error, "Bad quoted printable character.",
                        "Octet " + std::to_string(static_cast<int>(octet)) + ".");
                dec_text += ch;
            }

            if (!soft_break)
                dec_text.append(terminator);
        }

        return dec_text;
    }
};


} // namespace mimetree
