/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <htmlfooter/codec/codec.hpp>
#include <htmlfooter/detail/ascii.hpp>
#include <htmlfooter/detail/error_detail.hpp>
#include <htmlfooter/detail/result.hpp>


namespace htmlfooter
{


/**
Percent decoding of URI components as described in RFC 3986 section 2.1.
**/
class percent : public codec
{
public:

    percent() : codec(static_cast<std::string::size_type>(line_len_policy_t::NONE))
    {
    }

    percent(const percent&) = delete;

    percent(percent&&) = delete;

    /**
    Default destructor.
    **/
    ~percent() = default;

    void operator=(const percent&) = delete;

    void operator=(percent&&) = delete;

    /**
    Decoding a percent encoded string.

    @param txt String to decode.
    @return    Decoded string, `errc::codec_invalid_input` for a truncated or non hexadecimal escape.
    **/
    result<std::string> decode(std::string_view txt) const
    {
        std::string dec_text;
        for (std::string_view::size_type i = 0; i < txt.size(); i++)
        {
            if (txt[i] != PERCENT_HEX_FLAG)
            {
                dec_text += txt[i];
                continue;
            }
            if (i + 2 >= txt.size() || !is_hex_digit(txt[i + 1]) || !is_hex_digit(txt[i + 2]))
                return fail<std::string>(errc::codec_invalid_input, "invalid percent encoding",
                    detail::error_detail().add("input", txt).add_int("offset", i).str());

            const int nc_val = hex_digit_to_int(detail::ascii_toupper(txt[i + 1]));
            const int nnc_val = hex_digit_to_int(detail::ascii_toupper(txt[i + 2]));
            dec_text += static_cast<char>((nc_val << 4) + nnc_val);
            i += 2;
        }
        return ok(std::move(dec_text));
    }
};


} // namespace htmlfooter
