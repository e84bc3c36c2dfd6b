/*

charset.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Normalizing of text bodies to UTF-8.

*/


#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <htmlfooter/codec/codec.hpp>
#include <htmlfooter/detail/ascii.hpp>
#include <htmlfooter/detail/error_detail.hpp>
#include <htmlfooter/detail/result.hpp>


namespace htmlfooter
{


/**
Offset of the first byte which does not belong to a well formed UTF-8 sequence, or `npos`.
**/
[[nodiscard]] inline std::string_view::size_type find_invalid_utf8(std::string_view text) noexcept
{
    std::string_view::size_type i = 0;
    while (i < text.size())
    {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        if (c < 0x80)
            len = 1;
        else if (c >= 0xC2 && c <= 0xDF)
            len = 2;
        else if (c >= 0xE0 && c <= 0xEF)
            len = 3;
        else if (c >= 0xF0 && c <= 0xF4)
            len = 4;
        else
            return i;

        if (i + len > text.size())
            return i;
        for (std::size_t k = 1; k < len; k++)
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80)
                return i;

        // Overlong three byte forms, surrogates and code points above U+10FFFF.
        const auto c1 = static_cast<unsigned char>(len > 1 ? text[i + 1] : 0);
        if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 > 0x9F) || (c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F))
            return i;
        i += len;
    }
    return std::string_view::npos;
}


/**
Converting a decoded body to UTF-8.

Supported charsets are US-ASCII, UTF-8 and ISO-8859-1. US-ASCII bodies are accepted with eight bit content if it is valid UTF-8, since mail clients
commonly mislabel them.

@param bytes   Body after the transfer decoding.
@param charset Charset label of the body, empty for the RFC 2045 default.
@return        UTF-8 text, `errc::decode_failed` for malformed input, `errc::charset_unsupported` for another charset.
**/
[[nodiscard]] inline result<std::string> to_utf8(std::string_view bytes, std::string_view charset)
{
    const std::string label = detail::to_lower_ascii(detail::trim_view(charset));
    if (label.empty() || label == codec::CHARSET_ASCII || label == "ascii" || label == codec::CHARSET_UTF8 || label == "utf8")
    {
        const auto bad = find_invalid_utf8(bytes);
        if (bad != std::string_view::npos)
            return fail<std::string>(errc::decode_failed, "body is not valid " + (label.empty() ? codec::CHARSET_ASCII : label),
                detail::error_detail().add("charset", label).add_int("offset", bad).str());
        return ok(std::string(bytes));
    }

    if (label == "iso-8859-1" || label == "iso8859-1" || label == "latin1" || label == "latin-1")
    {
        std::string text;
        text.reserve(bytes.size() + bytes.size() / 4);
        for (char ch : bytes)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (c < 0x80)
                text += ch;
            else
            {
                text += static_cast<char>(0xC0 | (c >> 6));
                text += static_cast<char>(0x80 | (c & 0x3F));
            }
        }
        return ok(std::move(text));
    }

    return fail<std::string>(errc::charset_unsupported, "cannot decode body", detail::error_detail().add("charset", label).str());
}


} // namespace htmlfooter
