/*

transfer_encoding.hpp
---------------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Dispatching of bodies to the codec named by `Content-Transfer-Encoding`, and generation of multipart boundaries.

*/


#pragma once

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <openssl/rand.h>
#include <mimetree/codec/base64.hpp>
#include <mimetree/codec/codec.hpp>
#include <mimetree/codec/quoted_printable.hpp>
#include <mimetree/detail/log.hpp>
#include <mimetree/detail/result.hpp>


namespace mimetree
{


/**
Transfer encodings with a reversible transform.
**/
enum class transfer_encoding_t {NONE, BASE64, QUOTED_PRINTABLE};


/**
Base64 encoding label.
**/
inline constexpr std::string_view ENCODING_BASE64{"base64"};


/**
Quoted Printable encoding label.
**/
inline constexpr std::string_view ENCODING_QUOTED_PRINTABLE{"quoted-printable"};


/**
Number of random octets in a generated boundary.
**/
inline constexpr std::size_t BOUNDARY_OCTETS = 30;


/**
Result of decoding a body.
**/
struct decoded_body_t
{
    /**
    Decoded body.
    **/
    std::string body;

    /**
    True when a codec transformed the body, false when it was passed through.
    **/
    bool transformed = false;
};


/**
Error thrown when the system cannot provide random octets.
**/
class randomness_error : public std::runtime_error
{
public:

    explicit randomness_error(const std::string& msg) : std::runtime_error(msg)
    {
    }
};


/**
Mapping the value of a `Content-Transfer-Encoding` header to a codec, ignoring case and surrounding whitespace.

@param encoding Header value.
@return         Codec to apply, `NONE` for identity encodings and unknown labels.
**/
inline transfer_encoding_t parse_transfer_encoding(std::string_view encoding)
{
    const std::string label = boost::trim_copy(std::string(encoding));
    if (boost::iequals(label, ENCODING_BASE64))
        return transfer_encoding_t::BASE64;
    if (boost::iequals(label, ENCODING_QUOTED_PRINTABLE))
        return transfer_encoding_t::QUOTED_PRINTABLE;
    return transfer_encoding_t::NONE;
}


/**
Encoding a body by the given transfer encoding.

@param body     Body to encode.
@param encoding Value of the `Content-Transfer-Encoding` header.
@param newline  Line separator of the Base64 output.
@return         Encoded body; the body itself for other encodings.
**/
inline std::string encode_by_content_encoding(std::string_view body, std::string_view encoding,
    std::string_view newline = codec::END_OF_LINE)
{
    switch (parse_transfer_encoding(encoding))
    {
        case transfer_encoding_t::BASE64:
        {
            // One unwrapped line, hard wrapped afterwards with the requested separator.
            base64 b64(0, 0);
            return codec::break_lines(codec::join_lines(b64.encode(body), ""), codec::LINE_LENGTH, newline);
        }

        case transfer_encoding_t::QUOTED_PRINTABLE:
        {
            quoted_printable qp;
            return qp.encode(body);
        }

        case transfer_encoding_t::NONE:
            break;
    }
    return std::string(body);
}


/**
Decoding a body by the given transfer encoding.

@param body     Body to decode.
@param encoding Value of the `Content-Transfer-Encoding` header.
@return         Decoded body with the transform flag, or `error_code::transfer_decode_error`.
**/
inline result<decoded_body_t> decode_by_content_encoding(std::string_view body, std::string_view encoding)
{
    switch (parse_transfer_encoding(encoding))
    {
        case transfer_encoding_t::BASE64:
        {
            base64 b64;
            auto decoded = b64.decode(boost::trim_copy_if(std::string(body), boost::is_any_of("\r\n\t")));
            if (!decoded)
                return fail<decoded_body_t>(decoded.error());
            return decoded_body_t{std::move(*decoded), true};
        }

        case transfer_encoding_t::QUOTED_PRINTABLE:
        {
            quoted_printable qp;
            auto decoded = qp.decode(body);
            if (!decoded)
                return fail<decoded_body_t>(decoded.error());
            return decoded_body_t{std::move(*decoded), true};
        }

        case transfer_encoding_t::NONE:
            break;
    }
    return decoded_body_t{std::string(body), false};
}


/**
Generating a random multipart boundary.

@return                 Sixty lowercase hexadecimal characters.
@throw randomness_error The system random generator failed.
**/
inline std::string random_boundary()
{
    std::array<unsigned char, BOUNDARY_OCTETS> octets{};
    if (RAND_bytes(octets.data(), static_cast<int>(octets.size())) != 1)
    {
        MIMETREE_FATAL("Random generator failed while creating a boundary.");
        throw randomness_error("Cannot obtain random octets for a boundary.");
    }

    static constexpr std::string_view LOWER_HEX{"0123456789abcdef"};
    std::string boundary;
    boundary.reserve(octets.size() * 2);
    for (unsigned char octet : octets)
    {
        boundary += LOWER_HEX[octet >> 4];
        boundary += LOWER_HEX[octet & 0x0F];
    }
    return boundary;
}


} // namespace mimetree
