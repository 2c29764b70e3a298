/*

result.hpp
----------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Parsing never throws in mimetree, all errors are returned via result<T>.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <format>
#include <utility>

namespace mimetree
{

/// Error categories for mimetree operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Stream errors (100-199)
    end_of_stream = 100,
    unexpected_eof = 101,
    stream_error = 102,

    // Header errors (200-299)
    malformed_header = 200,

    // Body errors (300-399)
    transfer_decode_error = 300,
    media_type_error = 301,
    multipart_error = 302,
    nesting_too_deep = 303,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::end_of_stream: return "End of stream";
        case error_code::unexpected_eof: return "Unexpected end of stream";
        case error_code::stream_error: return "Stream error";
        case error_code::malformed_header: return "Malformed header";
        case error_code::transfer_decode_error: return "Transfer decode error";
        case error_code::media_type_error: return "Media type error";
        case error_code::multipart_error: return "Multipart error";
        case error_code::nesting_too_deep: return "Nesting too deep";
    }
    return "Unknown error";
}

/// Error with code, message and the offending input when there is one
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string detail) noexcept
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// Offending input, truncated where the producer says so (diagnostics only)
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        if (detail_.empty())
            return std::format("[{}] {}", static_cast<int>(code_), message_);
        return std::format("[{}] {}: {}", static_cast<int>(code_), message_, detail_);
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

private:
    error_code code_;
    std::string message_;
    std::string detail_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message, std::string detail)
{
    return std::unexpected(error(code, std::move(message), std::move(detail)));
}

} // namespace mimetree
