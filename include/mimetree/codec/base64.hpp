/*

base64.hpp
----------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Base64 transfer encoding (RFC 2045, section 6.8).

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <mimetree/codec/codec.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Base64 codec.
**/
class MIMETREE_EXPORT base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    static constexpr std::string_view CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Setting the encoder line policies.

    Since Base64 encodes three characters into four, the line policies are rounded down to a multiple of four so that no quantum is split
    over two lines. A zero policy disables wrapping.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    base64(std::string::size_type line1_policy = LINE_LENGTH, std::string::size_type lines_policy = LINE_LENGTH)
        : codec(line1_policy, lines_policy)
    {
        line1_policy_ -= line1_policy_ % SEXTETS_NO;
        lines_policy_ -= lines_policy_ % SEXTETS_NO;
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    /**
    Default destructor.
    **/
    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Encoding a string into vector of Base64 encoded lines by applying the line policy.

    @param text String to encode.
    @return     Base64 encoded lines, empty for an empty input.
    **/
    std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string> enc_text;
        std::string line;
        std::string::size_type policy = line1_policy_;

        auto add_char = [&](char ch)
        {
            if (policy > 0 && line.length() >= policy)
            {
                enc_text.push_back(std::move(line));
                line.clear();
                policy = lines_policy_;
            }
            line += ch;
        };

        unsigned char octets[OCTETS_NO];
        std::string::size_type cur_char = 0;
        while (cur_char < text.length())
        {
            const std::string::size_type remaining = text.length() - cur_char;
            const std::string::size_type count = remaining < OCTETS_NO ? remaining : OCTETS_NO;
            for (std::string::size_type i = 0; i < OCTETS_NO; i++)
                octets[i] = i < count ? static_cast<unsigned char>(text[cur_char + i]) : 0;

            const unsigned char sextets[SEXTETS_NO] = {
                static_cast<unsigned char>((octets[0] & 0xfc) >> 2),
                static_cast<unsigned char>(((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4)),
                static_cast<unsigned char>(((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6)),
                static_cast<unsigned char>(octets[2] & 0x3f)
            };

            for (std::string::size_type i = 0; i < SEXTETS_NO; i++)
                add_char(i <= count ? CHARSET[sextets[i]] : EQUAL_CHAR);
            cur_char += count;
        }

        if (!line.empty())
            enc_text.push_back(std::move(line));

        return enc_text;
    }

    /**
    Decoding a Base64 string, line breaks anywhere in the input are skipped.

    @param text Base64 encoded string.
    @return     Decoded string, or `error_code::transfer_decode_error` for a character out of the alphabet, a misplaced padding or a
                truncated quantum.
    **/
    result<std::string> decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.length() / SEXTETS_NO * OCTETS_NO);
        unsigned char sextets[SEXTETS_NO];
        std::string::size_type count_4_chars = 0;
        std::string::size_type padding = 0;

        for (std::string::size_type pos = 0; pos < text.length(); pos++)
        {
            const char ch = text[pos];
            if (ch == CR_CHAR || ch == LF_CHAR)
                continue;

            if (ch == EQUAL_CHAR)
            {
                // Padding can only fill the third and fourth sextet of the last quantum.
                if (count_4_chars < 2)
                    return fail<std::string>(error_code::transfer_decode_error, "Bad base64 padding.", "Offset " + std::to_string(pos) + ".");
                padding++;
                if (count_4_chars + padding == SEXTETS_NO)
                {
                    flush_quantum(sextets, count_4_chars, dec_text);
                    count_4_chars = 0;
                }
                continue;
            }

            if (padding > 0)
                return fail<std::string>(error_code::transfer_decode_error, "Data after base64 padding.", "Offset " + std::to_string(pos) + ".");

            const auto value = CHARSET.find(ch);
            if (value == std::string_view::npos)
                return fail<std::string>(error_code::transfer_decode_error, "Bad base64 character.",
                    "Character `" + std::string(1, ch) + "` at offset " + std::to_string(pos) + ".");

            sextets[count_4_chars++] = static_cast<unsigned char>(value);
            if (count_4_chars == SEXTETS_NO)
            {
                flush_quantum(sextets, count_4_chars, dec_text);
                count_4_chars = 0;
            }
        }

        if (count_4_chars > 0)
            return fail<std::string>(error_code::transfer_decode_error, "Truncated base64 input.");

        return dec_text;
    }

private:

    /**
    Appending the octets of a complete or padded quantum.

    @param sextets  Sextet values of the quantum.
    @param count    Number of meaningful sextets, two to four.
    @param dec_text Decoded text to append to.
    **/
    static void flush_quantum(unsigned char (&sextets)[4], std::string::size_type count, std::string& dec_text)
    {
        for (std::string::size_type i = count; i < SEXTETS_NO; i++)
            sextets[i] = 0;

        const unsigned char octets[OCTETS_NO] = {
            static_cast<unsigned char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4)),
            static_cast<unsigned char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2)),
            static_cast<unsigned char>(((sextets[2] & 0x3) << 6) + sextets[3])
        };

        for (std::string::size_type i = 0; i + 1 < count; i++)
            dec_text += static_cast<char>(octets[i]);
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr std::string::size_type SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr std::string::size_type OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace mimetree
