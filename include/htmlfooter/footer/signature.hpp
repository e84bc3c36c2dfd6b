/*

signature.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Splitting of a text body at the signature delimiter.

*/


#pragma once

#include <string>
#include <string_view>


namespace htmlfooter::footer
{


/**
Signature delimiter line, without its line ending.
**/
inline constexpr std::string_view SIGNATURE_DELIMITER{"-- "};


/**
Body split at the signature delimiter.
**/
struct signature_split
{
    /**
    Text before the delimiter line, including the line break ending the last content line.
    **/
    std::string content;

    /**
    Text after the delimiter line.
    **/
    std::string signature;

    /**
    Flag if the delimiter was found.
    **/
    bool found = false;
};


/**
Splitting a body into content and signature.

The delimiter is the first line, reading top-down, consisting exactly of `-- `; a CR ending the line is tolerated. The delimiter line itself belongs to
neither half. Without delimiter the whole body is the content and the signature is empty.

@param body Decoded body text.
@return     Content and signature.
**/
[[nodiscard]] inline signature_split split_signature(std::string_view body)
{
    std::string_view::size_type pos = 0;
    while (pos <= body.size())
    {
        auto eol = body.find('\n', pos);
        std::string_view line = body.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        if (line.ends_with('\r'))
            line.remove_suffix(1);

        if (line == SIGNATURE_DELIMITER)
        {
            const auto sig_begin = eol == std::string_view::npos ? body.size() : eol + 1;
            return signature_split{std::string(body.substr(0, pos)), std::string(body.substr(sig_begin)), true};
        }
        if (eol == std::string_view::npos)
            break;
        pos = eol + 1;
    }
    return signature_split{std::string(body), std::string(), false};
}


} // namespace htmlfooter::footer
