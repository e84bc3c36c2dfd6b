/*

mime.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <htmlfooter/codec/base64.hpp>
#include <htmlfooter/codec/codec.hpp>
#include <htmlfooter/codec/quoted_printable.hpp>
#include <htmlfooter/detail/ascii.hpp>
#include <htmlfooter/detail/error_detail.hpp>
#include <htmlfooter/detail/result.hpp>
#include <htmlfooter/mime/charset.hpp>


namespace htmlfooter
{


/**
Top level media types of RFC 2046 the filter tells apart.
**/
enum class media_type_t {NONE, TEXT, IMAGE, APPLICATION, MULTIPART, MESSAGE};


/**
Content transfer encodings of RFC 2045 section 6.
**/
enum class content_transfer_encoding_t {NONE, BIT7, BIT8, BASE64, QUOTED_PRINTABLE, BINARY};


/**
Value of the `Content-Type` header: media type, subtype and parameters.

Type and subtype are kept lower case, parameter names are compared case insensitive and keep their order.
**/
class content_type_t
{
public:

    using params_t = std::vector<std::pair<std::string, std::string>>;

    /**
    Default content type of RFC 2045 section 5.2, `text/plain`.
    **/
    content_type_t() : type_("text"), subtype_("plain")
    {
    }

    content_type_t(std::string_view type, std::string_view subtype)
        : type_(detail::to_lower_ascii(type)), subtype_(detail::to_lower_ascii(subtype))
    {
    }

    content_type_t(std::string_view type, std::string_view subtype, std::string_view charset)
        : content_type_t(type, subtype)
    {
        param("charset", charset);
    }

    /**
    Parsing a header value.

    A value without a valid `type/subtype` yields the default `text/plain`, as RFC 2045 requires for a syntactically invalid header.

    @param value Header value, unfolded.
    @return      Parsed content type.
    **/
    static content_type_t parse(std::string_view value)
    {
        content_type_t ct;
        std::string_view::size_type pos = value.find(';');
        std::string_view mt = detail::trim_view(value.substr(0, pos));
        auto slash = mt.find('/');
        if (slash == std::string_view::npos || slash == 0 || slash + 1 == mt.size())
            return ct;
        ct.type_ = detail::to_lower_ascii(detail::trim_view(mt.substr(0, slash)));
        ct.subtype_ = detail::to_lower_ascii(detail::trim_view(mt.substr(slash + 1)));

        while (pos != std::string_view::npos)
        {
            ++pos;
            auto eq = value.find('=', pos);
            if (eq == std::string_view::npos)
                break;
            std::string name = detail::trim_copy(value.substr(pos, eq - pos));
            pos = eq + 1;
            while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t'))
                ++pos;

            std::string val;
            if (pos < value.size() && value[pos] == codec::QUOTE_CHAR)
            {
                ++pos;
                while (pos < value.size() && value[pos] != codec::QUOTE_CHAR)
                {
                    if (value[pos] == '\\' && pos + 1 < value.size())
                        ++pos;
                    val += value[pos++];
                }
                pos = value.find(';', pos);
            }
            else
            {
                auto semi = value.find(';', pos);
                val = detail::trim_copy(value.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
                pos = semi;
            }
            if (!name.empty())
                ct.params_.emplace_back(std::move(name), std::move(val));
        }
        return ct;
    }

    const std::string& type() const
    {
        return type_;
    }

    const std::string& subtype() const
    {
        return subtype_;
    }

    media_type_t media_type() const
    {
        if (type_ == "text")
            return media_type_t::TEXT;
        if (type_ == "image")
            return media_type_t::IMAGE;
        if (type_ == "application")
            return media_type_t::APPLICATION;
        if (type_ == "multipart")
            return media_type_t::MULTIPART;
        if (type_ == "message")
            return media_type_t::MESSAGE;
        return media_type_t::NONE;
    }

    /**
    Type and subtype joined, like `text/plain`.
    **/
    std::string mime_type() const
    {
        return type_ + "/" + subtype_;
    }

    /**
    Checking the type and subtype, case insensitive.

    @param type    Media type.
    @param subtype Media subtype.
    **/
    bool is(std::string_view type, std::string_view subtype) const
    {
        return detail::iequals_ascii(type_, type) && detail::iequals_ascii(subtype_, subtype);
    }

    std::optional<std::string> param(std::string_view name) const
    {
        for (const auto& [n, v] : params_)
            if (detail::iequals_ascii(n, name))
                return v;
        return std::nullopt;
    }

    /**
    Setting a parameter, replacing an existing one of the same name.
    **/
    void param(std::string_view name, std::string_view value)
    {
        for (auto& [n, v] : params_)
        {
            if (detail::iequals_ascii(n, name))
            {
                v = value;
                return;
            }
        }
        params_.emplace_back(std::string(name), std::string(value));
    }

    const params_t& params() const
    {
        return params_;
    }

    std::string charset() const
    {
        return param("charset").value_or("");
    }

    std::string boundary() const
    {
        return param("boundary").value_or("");
    }

    /**
    Formatting as header value, parameters quoted.
    **/
    std::string format() const
    {
        std::string value = mime_type();
        for (const auto& [n, v] : params_)
            value += "; " + n + "=" + quote(v);
        return value;
    }

    /**
    Quoting a parameter value.
    **/
    static std::string quote(std::string_view value)
    {
        std::string quoted(1, codec::QUOTE_CHAR);
        for (char ch : value)
        {
            if (ch == codec::QUOTE_CHAR || ch == '\\')
                quoted += '\\';
            quoted += ch;
        }
        quoted += codec::QUOTE_CHAR;
        return quoted;
    }

private:

    std::string type_;

    std::string subtype_;

    params_t params_;
};


/**
Options to customize the formatting of a MIME entity. Used by mime::format().
**/
struct mime_format_options_t
{
    /**
    Line ending written, CRLF for the wire or LF for local delivery pipes.
    **/
    bool crlf = true;
};


/**
MIME entity: a message or a body part, with its headers and either a leaf content or child parts.

Headers keep their order and duplicates. The content of a leaf is stored transfer decoded; formatting encodes it again as `Content-Transfer-Encoding`
tells. The type is a value type, copying a message copies the whole tree.
**/
class mime
{
public:

    /**
    Ordered list of header names and values. Folded values keep their line breaks as LF.
    **/
    using headers_t = std::vector<std::pair<std::string, std::string>>;

    inline static const std::string CONTENT_TYPE_HEADER{"Content-Type"};
    inline static const std::string CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};
    inline static const std::string CONTENT_DISPOSITION_HEADER{"Content-Disposition"};
    inline static const std::string CONTENT_ID_HEADER{"Content-ID"};
    inline static const std::string MIME_VERSION_HEADER{"MIME-Version"};
    inline static const std::string MESSAGE_ID_HEADER{"Message-ID"};

    /**
    Nesting limit of multipart entities accepted by the parser.
    **/
    static constexpr std::size_t MAX_DEPTH = 32;

    mime() = default;

    mime(const mime&) = default;

    mime(mime&&) = default;

    ~mime() = default;

    mime& operator=(const mime&) = default;

    mime& operator=(mime&&) = default;

    /**
    Parsing an entity from its wire format.

    A leading mbox `From ` line is kept aside. Header lines end at the first empty line; a line which is not a header ends them as well and starts
    the body. Multipart bodies are split on their boundary recursively, leaf bodies are transfer decoded.

    @param text Entity text, CRLF or LF line endings.
    @return     `errc::mime_missing_boundary`, `errc::mime_parse_error` or a codec error on failure.
    **/
    result_void parse(std::string_view text)
    {
        *this = mime();
        std::vector<std::string_view> lines;
        detail::split_lines(text, lines);
        auto first = lines.cbegin();
        if (first != lines.cend() && first->starts_with("From "))
        {
            unix_from_ = *first;
            ++first;
        }
        return parse_entity(first, lines.cend(), 0);
    }

    /**
    Formatting the entity to its wire format.

    @param out  String to append to.
    @param opts Formatting options.
    @return     `errc::mime_format_error` for an invalid header name or a multipart without boundary.
    **/
    result_void format(std::string& out, const mime_format_options_t& opts = mime_format_options_t{}) const
    {
        const std::string eol = opts.crlf ? codec::END_OF_LINE : std::string(1, codec::LF_CHAR);
        if (!unix_from_.empty())
            out += unix_from_ + eol;
        return format_entity(out, eol);
    }

    const headers_t& headers() const
    {
        return headers_;
    }

    /**
    Getting the first value of a header, unfolded.

    @param name Header name, case insensitive.
    @return     Value or nothing if the header is absent.
    **/
    std::optional<std::string> header(std::string_view name) const
    {
        for (const auto& [n, v] : headers_)
            if (detail::iequals_ascii(n, name))
                return unfold(v);
        return std::nullopt;
    }

    /**
    Appending a header, existing ones of the same name are kept.
    **/
    void add_header(std::string name, std::string value)
    {
        headers_.emplace_back(std::move(name), std::move(value));
    }

    /**
    Setting a header: the first occurrence is replaced in place, further ones are removed. Appended if absent.
    **/
    void set_header(std::string_view name, std::string value)
    {
        bool found = false;
        for (auto it = headers_.begin(); it != headers_.end();)
        {
            if (!detail::iequals_ascii(it->first, name))
            {
                ++it;
                continue;
            }
            if (found)
            {
                it = headers_.erase(it);
                continue;
            }
            it->second = std::move(value);
            found = true;
            ++it;
        }
        if (!found)
            headers_.emplace_back(std::string(name), std::move(value));
    }

    void remove_header(std::string_view name)
    {
        std::erase_if(headers_, [name](const auto& h) { return detail::iequals_ascii(h.first, name); });
    }

    content_type_t content_type() const
    {
        auto value = header(CONTENT_TYPE_HEADER);
        return value ? content_type_t::parse(*value) : content_type_t();
    }

    void content_type(const content_type_t& ct)
    {
        set_header(CONTENT_TYPE_HEADER, ct.format());
    }

    content_transfer_encoding_t content_transfer_encoding() const
    {
        auto value = header(CONTENT_TRANSFER_ENCODING_HEADER);
        if (!value)
            return content_transfer_encoding_t::NONE;
        const std::string enc = detail::to_lower_ascii(detail::trim_view(*value));
        if (enc == "7bit")
            return content_transfer_encoding_t::BIT7;
        if (enc == "8bit")
            return content_transfer_encoding_t::BIT8;
        if (enc == "base64")
            return content_transfer_encoding_t::BASE64;
        if (enc == "quoted-printable")
            return content_transfer_encoding_t::QUOTED_PRINTABLE;
        if (enc == "binary")
            return content_transfer_encoding_t::BINARY;
        return content_transfer_encoding_t::NONE;
    }

    void content_transfer_encoding(content_transfer_encoding_t encoding)
    {
        switch (encoding)
        {
            case content_transfer_encoding_t::NONE: remove_header(CONTENT_TRANSFER_ENCODING_HEADER); break;
            case content_transfer_encoding_t::BIT7: set_header(CONTENT_TRANSFER_ENCODING_HEADER, "7bit"); break;
            case content_transfer_encoding_t::BIT8: set_header(CONTENT_TRANSFER_ENCODING_HEADER, "8bit"); break;
            case content_transfer_encoding_t::BASE64: set_header(CONTENT_TRANSFER_ENCODING_HEADER, "base64"); break;
            case content_transfer_encoding_t::QUOTED_PRINTABLE: set_header(CONTENT_TRANSFER_ENCODING_HEADER, "quoted-printable"); break;
            case content_transfer_encoding_t::BINARY: set_header(CONTENT_TRANSFER_ENCODING_HEADER, "binary"); break;
        }
    }

    /**
    Setting the content disposition with a file name parameter.

    @param disposition Disposition type, like `attachment` or `inline`.
    @param filename    File name, omitted if empty.
    **/
    void content_disposition(std::string_view disposition, std::string_view filename)
    {
        std::string value(disposition);
        if (!filename.empty())
            value += "; filename=" + content_type_t::quote(filename);
        set_header(CONTENT_DISPOSITION_HEADER, std::move(value));
    }

    std::string content_id() const
    {
        return header(CONTENT_ID_HEADER).value_or("");
    }

    void content_id(std::string id)
    {
        set_header(CONTENT_ID_HEADER, std::move(id));
    }

    /**
    Checking if the entity is a multipart container.
    **/
    bool is_multipart() const
    {
        return content_type().media_type() == media_type_t::MULTIPART;
    }

    /**
    Transfer decoded content of a leaf.
    **/
    const std::string& content() const
    {
        return content_;
    }

    void content(std::string content)
    {
        content_ = std::move(content);
    }

    /**
    Content of a leaf converted to UTF-8 from the charset of its content type.

    @return Text, or the error of `to_utf8()`.
    **/
    result<std::string> text() const
    {
        return to_utf8(content_, content_type().charset());
    }

    const std::vector<mime>& parts() const
    {
        return parts_;
    }

    void add_part(mime part)
    {
        parts_.push_back(std::move(part));
    }

    /**
    Replacing the child part at the given index.

    @return `errc::invalid_argument` for an index out of range.
    **/
    result_void replace_part(std::size_t index, mime part)
    {
        if (index >= parts_.size())
            return fail(errc::invalid_argument, "part index out of range",
                detail::error_detail().add_int("index", index).add_int("parts", parts_.size()).str());
        parts_[index] = std::move(part);
        return ok();
    }

    const std::string& preamble() const
    {
        return preamble_;
    }

    void preamble(std::string text)
    {
        preamble_ = std::move(text);
    }

    const std::string& epilogue() const
    {
        return epilogue_;
    }

    void epilogue(std::string text)
    {
        epilogue_ = std::move(text);
    }

    /**
    Mbox `From ` line preceding the headers, empty if none.
    **/
    const std::string& unix_from() const
    {
        return unix_from_;
    }

    void unix_from(std::string line)
    {
        unix_from_ = std::move(line);
    }

private:

    using line_iterator = std::vector<std::string_view>::const_iterator;

    static std::string unfold(std::string_view value)
    {
        std::string unfolded;
        unfolded.reserve(value.size());
        for (char ch : value)
            if (ch != codec::LF_CHAR)
                unfolded += ch;
        return unfolded;
    }

    /**
    Replacing the LF line breaks of a stored text by the output line ending.
    **/
    static void append_text(std::string& out, std::string_view text, const std::string& eol)
    {
        for (char ch : text)
        {
            if (ch == codec::LF_CHAR)
                out += eol;
            else
                out += ch;
        }
    }

    static bool is_boundary_line(std::string_view line, const std::string& delimiter, bool& closing)
    {
        if (!line.starts_with(delimiter))
            return false;
        std::string_view rest = line.substr(delimiter.size());
        closing = rest.starts_with("--");
        if (closing)
            rest.remove_prefix(2);
        return detail::trim_view(rest).empty();
    }

    result_void parse_entity(line_iterator begin, line_iterator end, std::size_t depth)
    {
        if (depth > MAX_DEPTH)
            return fail(errc::mime_parse_error, "multipart nesting too deep", detail::error_detail().add_int("depth", depth).str());

        auto line = begin;
        for (; line != end; ++line)
        {
            if (line->empty())
            {
                ++line;
                break;
            }
            if ((line->front() == codec::SPACE_CHAR || line->front() == codec::TAB_CHAR) && !headers_.empty())
            {
                headers_.back().second += codec::LF_CHAR;
                headers_.back().second.append(line->data(), line->size());
                continue;
            }
            auto colon = line->find(':');
            if (colon == std::string_view::npos || !detail::is_valid_header_name(detail::trim_view(line->substr(0, colon))))
                break;
            std::string_view value = line->substr(colon + 1);
            while (!value.empty() && (value.front() == codec::SPACE_CHAR || value.front() == codec::TAB_CHAR))
                value.remove_prefix(1);
            headers_.emplace_back(detail::trim_copy(line->substr(0, colon)), std::string(value));
        }

        if (is_multipart())
            return parse_multipart(line, end, depth);
        return parse_leaf(line, end);
    }

    result_void parse_multipart(line_iterator begin, line_iterator end, std::size_t depth)
    {
        const std::string boundary = content_type().boundary();
        if (boundary.empty())
            return fail(errc::mime_missing_boundary, "multipart entity without boundary",
                detail::error_detail().add("content_type", header(CONTENT_TYPE_HEADER).value_or("")).str());
        const std::string delimiter = "--" + boundary;

        std::optional<line_iterator> part_begin;
        bool closed = false;
        for (auto line = begin; line != end; ++line)
        {
            bool closing = false;
            if (!is_boundary_line(*line, delimiter, closing))
                continue;

            if (part_begin)
            {
                mime part;
                auto res = part.parse_entity(*part_begin, line, depth + 1);
                if (!res)
                    return res;
                parts_.push_back(std::move(part));
            }
            else
                preamble_ = detail::join_lines(begin, line, "\n");

            if (closing)
            {
                epilogue_ = detail::join_lines(line + 1, end, "\n");
                closed = true;
                break;
            }
            part_begin = line + 1;
        }

        if (!part_begin)
            return fail(errc::mime_parse_error, "multipart boundary not found", detail::error_detail().add("boundary", boundary).str());

        // Unterminated multipart, the last part runs to the end.
        if (!closed)
        {
            mime part;
            auto res = part.parse_entity(*part_begin, end, depth + 1);
            if (!res)
                return res;
            parts_.push_back(std::move(part));
        }
        return ok();
    }

    result_void parse_leaf(line_iterator begin, line_iterator end)
    {
        std::string raw = detail::join_lines(begin, end, "\n");
        switch (content_transfer_encoding())
        {
            case content_transfer_encoding_t::BASE64:
            {
                auto dec = base64().decode(raw);
                if (!dec)
                    return fail(errc::decode_failed, "cannot decode base64 body", dec.error().detail);
                content_ = std::move(*dec);
                break;
            }
            case content_transfer_encoding_t::QUOTED_PRINTABLE:
                content_ = quoted_printable().decode(raw);
                break;
            default:
                content_ = std::move(raw);
        }
        return ok();
    }

    result_void format_entity(std::string& out, const std::string& eol) const
    {
        for (const auto& [name, value] : headers_)
        {
            if (!detail::is_valid_header_name(name))
                return fail(errc::mime_format_error, "invalid header name", detail::error_detail().add("header", name).str());
            out += name + ": ";
            append_text(out, value, eol);
            out += eol;
        }
        out += eol;

        if (is_multipart())
        {
            const std::string boundary = content_type().boundary();
            if (boundary.empty())
                return fail(errc::mime_format_error, "multipart entity without boundary");

            if (!preamble_.empty())
            {
                append_text(out, preamble_, eol);
                out += eol;
            }
            for (const auto& part : parts_)
            {
                out += "--" + boundary + eol;
                auto res = part.format_entity(out, eol);
                if (!res)
                    return res;
                out += eol;
            }
            out += "--" + boundary + "--" + eol;
            append_text(out, epilogue_, eol);
            return ok();
        }

        switch (content_transfer_encoding())
        {
            case content_transfer_encoding_t::BASE64:
                for (const auto& line : base64().encode(content_))
                    out += line + eol;
                break;
            case content_transfer_encoding_t::QUOTED_PRINTABLE:
            {
                const auto lines = quoted_printable().encode(content_);
                out += detail::join_lines(lines.begin(), lines.end(), eol);
                break;
            }
            default:
                append_text(out, content_, eol);
        }
        return ok();
    }

    headers_t headers_;

    std::string content_;

    std::vector<mime> parts_;

    std::string preamble_;

    std::string epilogue_;

    std::string unix_from_;
};


} // namespace htmlfooter
