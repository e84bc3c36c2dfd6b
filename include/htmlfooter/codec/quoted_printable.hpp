/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <htmlfooter/codec/codec.hpp>
#include <htmlfooter/detail/ascii.hpp>


namespace htmlfooter
{


/**
Quoted Printable codec for bodies, as described in RFC 2045 section 6.7.
**/
class quoted_printable : public codec
{
public:

    /**
    Setting the encoder line policy.

    @param line_policy Line policy to set, soft line breaks included.
    **/
    explicit quoted_printable(std::string::size_type line_policy = static_cast<std::string::size_type>(line_len_policy_t::RECOMMENDED))
        : codec(line_policy)
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
    Encoding a text into vector of quoted printable lines by applying the line policy.

    Hard line breaks of the text (LF or CRLF) separate the resulting lines; a text ending with a line break yields a last empty line. Long lines are
    split with soft line breaks.

    @param text String to encode.
    @return     Vector of quoted printable strings.
    **/
    std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string_view> lines;
        detail::split_lines(text, lines);

        std::vector<std::string> enc_text;
        for (auto line : lines)
        {
            std::string enc_line;
            for (std::string_view::size_type i = 0; i < line.size(); i++)
            {
                const char ch = line[i];
                const bool last = i + 1 == line.size();
                std::string token;
                if (ch > SPACE_CHAR && ch <= TILDE_CHAR && ch != EQUAL_CHAR)
                    token = ch;
                else if ((ch == SPACE_CHAR || ch == TAB_CHAR) && !last)
                    token = ch;
                else
                    token = encode_char(ch);

                // One column is kept for the soft break character.
                if (enc_line.size() + token.size() > line_policy_ - 1)
                {
                    enc_line += EQUAL_CHAR;
                    enc_text.push_back(std::move(enc_line));
                    enc_line.clear();
                }
                enc_line += token;
            }
            enc_text.push_back(std::move(enc_line));
        }
        return enc_text;
    }

    /**
    Decoding a quoted printable text.

    Soft line breaks are removed, hard line breaks become LF. Malformed escape sequences are kept as they are.

    @param text Quoted printable encoded text.
    @return     Decoded string.
    **/
    std::string decode(std::string_view text) const
    {
        std::vector<std::string_view> lines;
        detail::split_lines(text, lines);

        std::string dec_text;
        for (std::size_t l = 0; l < lines.size(); l++)
        {
            std::string_view line = lines[l];
            while (!line.empty() && (line.back() == SPACE_CHAR || line.back() == TAB_CHAR))
                line.remove_suffix(1);

            bool soft_break = false;
            for (std::string_view::size_type i = 0; i < line.size(); i++)
            {
                if (line[i] != EQUAL_CHAR)
                {
                    dec_text += line[i];
                    continue;
                }
                if (i + 1 == line.size())
                {
                    soft_break = true;
                    break;
                }
                if (i + 2 < line.size() && is_hex_digit(line[i + 1]) && is_hex_digit(line[i + 2]))
                {
                    const int hi = hex_digit_to_int(detail::ascii_toupper(line[i + 1]));
                    const int lo = hex_digit_to_int(detail::ascii_toupper(line[i + 2]));
                    dec_text += static_cast<char>((hi << 4) + lo);
                    i += 2;
                }
                else
                    dec_text += line[i];
            }
            if (!soft_break && l + 1 < lines.size())
                dec_text += LF_CHAR;
        }
        return dec_text;
    }

private:

    static std::string encode_char(char ch)
    {
        const auto uch = static_cast<unsigned char>(ch);
        std::string enc;
        enc += EQUAL_CHAR;
        enc += HEX_DIGITS[(uch >> 4) & 0x0F];
        enc += HEX_DIGITS[uch & 0x0F];
        return enc;
    }
};


} // namespace htmlfooter
