#pragma once

#include <string>
#include <string_view>

namespace mimetree
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] constexpr char ascii_toupper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] constexpr bool is_space_or_tab(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }

    // Leading and trailing spaces and tabs only; header folding does not treat other whitespace as padding.
    [[nodiscard]] inline std::string_view trim_space_tab(std::string_view sv) noexcept
    {
        while (!sv.empty() && is_space_or_tab(sv.front()))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space_or_tab(sv.back()))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string_view trim_right_crlf(std::string_view sv) noexcept
    {
        while (!sv.empty() && (sv.back() == '\r' || sv.back() == '\n'))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    // RFC 7230 tchar punctuation (without the alphanumerics).
    inline constexpr std::string_view TCHAR_PUNCT = "!#$%&'*+-.^_`|~";

    [[nodiscard]] constexpr bool is_token_char(char c) noexcept
    {
        return is_ascii_alnum(c) || (TCHAR_PUNCT.find(c) != std::string_view::npos);
    }

    [[nodiscard]] constexpr int hex_digit_value(char c) noexcept
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        return -1;
    }
}
}
