/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The filter engine does not throw, all errors are returned via result<T>.

*/

#pragma once

#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <cstdint>
#include <utility>

namespace htmlfooter
{

/// Error categories for htmlfooter operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Codec errors (100-199)
    codec_invalid_input = 100,

    // MIME errors (200-299)
    mime_parse_error = 200,
    mime_missing_boundary = 201,
    mime_format_error = 202,

    // Body decoding errors (300-399)
    decode_failed = 300,
    charset_unsupported = 301,

    // Image resolution errors (400-499)
    image_unreadable = 400,
    image_unrecognized = 401,

    // Message structure errors (500-599)
    no_text_part = 500,

    // Input validation (700-799)
    invalid_argument = 700,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view to_string(errc ec) noexcept
{
    switch (ec)
    {
        case errc::ok: return "Success";
        case errc::codec_invalid_input: return "Invalid codec input";
        case errc::mime_parse_error: return "MIME parse error";
        case errc::mime_missing_boundary: return "MIME missing boundary";
        case errc::mime_format_error: return "MIME format error";
        case errc::decode_failed: return "Body decoding failed";
        case errc::charset_unsupported: return "Unsupported charset";
        case errc::image_unreadable: return "Image cannot be read";
        case errc::image_unrecognized: return "Image type not recognized";
        case errc::no_text_part: return "No text/plain part";
        case errc::invalid_argument: return "Invalid argument";
    }
    return "Unknown error";
}

/// Category of an error, matching the failure kinds callers branch on.
enum class error_kind : std::uint8_t
{
    decode,
    image_resolution,
    structural,
    other
};

[[nodiscard]] constexpr error_kind kind_of(errc ec) noexcept
{
    const auto c = static_cast<std::uint16_t>(ec);
    if (c >= 100 && c < 400 && ec != errc::mime_format_error)
        return error_kind::decode;
    if (c >= 400 && c < 500)
        return error_kind::image_resolution;
    if (c >= 500 && c < 600)
        return error_kind::structural;
    return error_kind::other;
}

/**
Error value carried by `result<T>`.

`detail` holds `key=value` lines built with `detail::error_detail`.
**/
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    [[nodiscard]] error_kind kind() const noexcept
    {
        return kind_of(code);
    }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = std::format("[{}] {}", static_cast<int>(code),
            message.empty() ? std::string(htmlfooter::to_string(code)) : message);
        if (sys)
            out += std::format(" ({})", sys.message());
        return out;
    }
};

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error_info>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error_info>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

} // namespace htmlfooter
