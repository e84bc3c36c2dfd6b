/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cctype>
#include <htmlfooter/codec/codec.hpp>
#include <htmlfooter/detail/error_detail.hpp>
#include <htmlfooter/detail/result.hpp>


namespace htmlfooter
{


/**
Base64 codec.
**/
class base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Setting the encoder line policy.

    Since Base64 encodes three characters into four, the split is made after each fourth character. It seems that email clients do not merge properly
    many lines of encoded text if the split is not grouped by four characters. For that reason, the constructor sets the line policy to be divisible by
    the number four.

    @param line_policy Line policy to set.
    **/
    explicit base64(std::string::size_type line_policy = static_cast<std::string::size_type>(line_len_policy_t::RECOMMENDED))
        : codec(line_policy)
    {
        line_policy_ -= line_policy_ % SEXTETS_NO;
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
    Encoding a string into vector of Base64 encoded strings by applying the line policy.

    @param text String to encode.
    @return     Vector of Base64 encoded strings.
    **/
    std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string> enc_text;
        unsigned char octets[OCTETS_NO];
        unsigned char sextets[SEXTETS_NO];
        int octets_counter = 0;
        std::string line;

        auto flush_sextets = [&](int count)
        {
            sextets[0] = (octets[0] & 0xfc) >> 2;
            sextets[1] = ((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4);
            sextets[2] = ((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6);
            sextets[3] = octets[2] & 0x3f;
            for (int i = 0; i < SEXTETS_NO; i++)
                line += i <= count ? CHARSET[sextets[i]] : EQUAL_CHAR;
            if (line.length() >= line_policy_)
            {
                enc_text.push_back(line);
                line.clear();
            }
        };

        for (char ch : text)
        {
            octets[octets_counter++] = static_cast<unsigned char>(ch);
            if (octets_counter == OCTETS_NO)
            {
                flush_sextets(OCTETS_NO);
                octets_counter = 0;
            }
        }

        // encode remaining characters if any

        if (octets_counter > 0)
        {
            for (int i = octets_counter; i < OCTETS_NO; i++)
                octets[i] = '\0';
            flush_sextets(octets_counter);
        }

        if (!line.empty())
            enc_text.push_back(line);

        return enc_text;
    }

    /**
    Decoding a Base64 string, possibly split over several lines, to a string.

    Whitespace is skipped, decoding stops at the first padding character.

    @param text Base64 encoded string.
    @return     Decoded string or `errc::codec_invalid_input` on a bad character.
    **/
    result<std::string> decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size() / SEXTETS_NO * OCTETS_NO);
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;

        auto flush_octets = [&](int count)
        {
            const unsigned char octets[OCTETS_NO] = {
                static_cast<unsigned char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4)),
                static_cast<unsigned char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2)),
                static_cast<unsigned char>(((sextets[2] & 0x3) << 6) + sextets[3])};
            for (int i = 0; i < count; i++)
                dec_text += static_cast<char>(octets[i]);
        };

        for (std::string_view::size_type pos = 0; pos < text.size(); pos++)
        {
            const char ch = text[pos];
            if (ch == EQUAL_CHAR)
                break;
            if (std::isspace(static_cast<unsigned char>(ch)))
                continue;
            if (!is_allowed(ch))
            {
                return fail<std::string>(errc::codec_invalid_input, "invalid base64 input",
                    detail::error_detail().add("character", std::string(1, ch)).add_int("offset", pos).str());
            }

            sextets[count_4_chars++] = static_cast<unsigned char>(CHARSET.find(ch));
            if (count_4_chars == SEXTETS_NO)
            {
                flush_octets(OCTETS_NO);
                count_4_chars = 0;
            }
        }

        // decode remaining characters if any

        if (count_4_chars > 1)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            flush_octets(count_4_chars - 1);
        }

        return ok(std::move(dec_text));
    }

private:

    /**
    Checking if the given character is in the base64 character set.

    @param ch Character to check.
    @return   True if it is, false if not.
    **/
    bool is_allowed(char ch) const
    {
        return (std::isalnum(static_cast<unsigned char>(ch)) || ch == PLUS_CHAR || ch == SLASH_CHAR);
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace htmlfooter
