/*

codec.hpp
---------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Base of the transfer encoding codecs.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Base class for codecs, contains various constants and miscellaneous functions for encoding/decoding purposes.
**/
class MIMETREE_EXPORT codec
{
public:

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Tab character.
    **/
    static constexpr char TAB_CHAR = '\t';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Equal character.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Tilde character.
    **/
    static constexpr char TILDE_CHAR = '~';

    /**
    Hexadecimal alphabet.
    **/
    static constexpr std::string_view HEX_DIGITS{"0123456789ABCDEF"};

    /**
    Carriage return plus line feed string.
    **/
    static constexpr std::string_view END_OF_LINE{"\r\n"};

    /**
    Maximum length of an encoded body line, line terminator excluded (RFC 2045).
    **/
    static constexpr std::string::size_type LINE_LENGTH = 76;

    /**
    Setting the encoder and decoder line policies.

    @param line1_policy First line policy to set.
    @param lines_policy Other lines policy than the first one to set.
    **/
    codec(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : line1_policy_(line1_policy), lines_policy_(lines_policy)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    /**
    Default destructor.
    **/
    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

    /**
    Joining encoded lines with the given separator, without a trailing separator.

    @param lines     Lines produced by an encoder.
    @param separator Line separator to put between the lines.
    @return          Joined lines.
    **/
    static std::string join_lines(const std::vector<std::string>& lines, std::string_view separator)
    {
        std::string joined;
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (i != 0)
                joined.append(separator);
            joined.append(lines[i]);
        }
        return joined;
    }

    /**
    Hard wrapping of a string every `width` characters.

    @param data      String to wrap.
    @param width     Number of characters per line.
    @param separator Separator put between two lines.
    @return          Wrapped string.
    **/
    static std::string break_lines(std::string_view data, std::string::size_type width, std::string_view separator)
    {
        if (width == 0)
            return std::string(data);

        std::string wrapped;
        wrapped.reserve(data.size() + (data.size() / width) * separator.size());
        for (std::string::size_type start = 0; start < data.size(); start += width)
        {
            if (start > 0)
                wrapped.append(separator);
            wrapped.append(data.substr(start, width));
        }
        return wrapped;
    }

protected:

    /**
    Policy applied for encoding of the first line.
    **/
    std::string::size_type line1_policy_;

    /**
    Policy applied for encoding of the lines other than first one.
    **/
    std::string::size_type lines_policy_;
};


} // namespace mimetree
