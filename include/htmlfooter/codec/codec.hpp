/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <climits>
#include <string>


namespace htmlfooter
{


/**
Base class for codecs, contains various constants and miscellaneous functions for encoding/decoding purposes.
**/
class codec
{
public:

    /**
    Calculating value of the given hex digit.
    **/
    static constexpr int hex_digit_to_int(char digit)
    {
        return digit >= ZERO_CHAR && digit <= NINE_CHAR ? digit - ZERO_CHAR : digit - A_CHAR + 10;
    }

    /**
    Checking if the given character is a hexadecimal digit, either case.
    **/
    static constexpr bool is_hex_digit(char ch)
    {
        return (ch >= ZERO_CHAR && ch <= NINE_CHAR) || (ch >= 'A' && ch <= 'F') || (ch >= 'a' && ch <= 'f');
    }

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Plus character.
    **/
    static constexpr char PLUS_CHAR = '+';

    /**
    Percent character.
    **/
    static constexpr char PERCENT_HEX_FLAG = '%';

    /**
    Slash character.
    **/
    static constexpr char SLASH_CHAR = '/';

    /**
    Equal character.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Tab character.
    **/
    static constexpr char TAB_CHAR = '\t';

    /**
    Zero number character.
    **/
    static constexpr char ZERO_CHAR = '0';

    /**
    Nine number character.
    **/
    static constexpr char NINE_CHAR = '9';

    /**
    Letter A character.
    **/
    static constexpr char A_CHAR = 'A';

    /**
    Tilde character.
    **/
    static constexpr char TILDE_CHAR = '~';

    /**
    Quote character.
    **/
    static constexpr char QUOTE_CHAR = '"';

    /**
    Hexadecimal alphabet.
    **/
    inline static const std::string HEX_DIGITS{"0123456789ABCDEF"};

    /**
    Carriage return plus line feed string.
    **/
    inline static const std::string END_OF_LINE{"\r\n"};

    /**
    ASCII charset label.
    **/
    inline static const std::string CHARSET_ASCII{"us-ascii"};

    /**
    UTF-8 charset label.
    **/
    inline static const std::string CHARSET_UTF8{"utf-8"};

    /**
    Line length policy.
    **/
    enum class line_len_policy_t : std::string::size_type {RECOMMENDED = 76, MANDATORY = 998, NONE = UINT_MAX};

    /**
    Setting the encoder and decoder line policies.

    @param line_policy Maximum length of an encoded line, without the line ending.
    **/
    explicit codec(std::string::size_type line_policy)
        : line_policy_(line_policy)
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

protected:

    /**
    Policy applied for encoding of the lines.
    **/
    std::string::size_type line_policy_;
};


} // namespace htmlfooter
