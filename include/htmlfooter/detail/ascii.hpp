/*

ascii.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <vector>

namespace htmlfooter
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

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
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

    [[nodiscard]] inline bool istarts_with_ascii(std::string_view text, std::string_view prefix) noexcept
    {
        return text.size() >= prefix.size() && iequals_ascii(text.substr(0, prefix.size()), prefix);
    }

    [[nodiscard]] inline std::string to_lower_ascii(std::string_view sv)
    {
        std::string out;
        out.reserve(sv.size());
        for (char ch : sv)
            out.push_back(ascii_tolower(ch));
        return out;
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string trim_copy(std::string_view sv)
    {
        sv = trim_view(sv);
        return std::string(sv);
    }

    // RFC 5322: field-name = 1*ftext; ftext = %d33-57 / %d59-126 (printable US-ASCII except ":")
    [[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
    {
        if (name.empty())
            return false;

        for (char ch : name)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            const bool ok = ((c >= 33 && c <= 57) || (c >= 59 && c <= 126));
            if (!ok)
                return false;
        }
        return true;
    }

    /**
    Split text on LF into `n + 1` pieces for `n` line feeds, dropping the CR of CRLF.

    Joining the pieces with LF gives back the text with normalized line endings.
    **/
    template<typename Container>
    void split_lines(std::string_view text, Container& lines)
    {
        std::string_view::size_type pos = 0;
        while (true)
        {
            auto eol = text.find('\n', pos);
            std::string_view line = eol == std::string_view::npos ? text.substr(pos) : text.substr(pos, eol - pos);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            lines.emplace_back(line);
            if (eol == std::string_view::npos)
                break;
            pos = eol + 1;
        }
    }

    /**
    Calling a function for every line of the text, without line endings. A line feed ending the text does not start another line.
    **/
    template<typename F>
    void for_each_line(std::string_view text, F&& f)
    {
        std::vector<std::string_view> lines;
        split_lines(text, lines);
        if (!lines.empty() && lines.back().empty())
            lines.pop_back();
        for (auto line : lines)
            f(line);
    }

    /// Join lines with the given separator.
    template<typename Iterator>
    [[nodiscard]] std::string join_lines(Iterator first, Iterator last, std::string_view separator)
    {
        std::string out;
        for (auto it = first; it != last; ++it)
        {
            if (it != first)
                out.append(separator);
            out.append(it->data(), it->size());
        }
        return out;
    }
} // namespace detail
} // namespace htmlfooter
