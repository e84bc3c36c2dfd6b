/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builder of the structured error_info::detail strings.

Each entry is formatted as key=value\n to ease parsing. Values are kept on
one line, CR and LF are replaced by spaces.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace htmlfooter::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        for (char ch : value)
            out_.push_back(ch == '\r' || ch == '\n' ? ' ' : ch);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
        out_.push_back('\n');
        return *this;
    }

    /// Append the entries of an existing detail string.
    error_detail& add_detail(std::string_view other)
    {
        out_.append(other.data(), other.size());
        if (!other.empty() && other.back() != '\n')
            out_.push_back('\n');
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }
};

} // namespace htmlfooter::detail
