/*

image_resolver.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Resolving of image references of an HTML document into inline attachments.

*/


#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <htmlfooter/codec/base64.hpp>
#include <htmlfooter/codec/percent.hpp>
#include <htmlfooter/detail/ascii.hpp>
#include <htmlfooter/detail/error_detail.hpp>
#include <htmlfooter/detail/log.hpp>
#include <htmlfooter/detail/regex.hpp>
#include <htmlfooter/detail/result.hpp>
#include <htmlfooter/footer/content_id.hpp>


namespace htmlfooter::footer
{


/**
Components of a URI reference as far as image lookup needs them.
**/
struct uri_parts
{
    std::string scheme;

    std::string netloc;

    std::string path;
};


/**
Splitting a URI reference into scheme, network location and path; query and fragment are dropped.

The scheme is recognized only if it is followed by a colon and made of RFC 3986 scheme characters, so a bare file name stays a path. The scheme is
returned lower case. For opaque URIs like `data:` the path is the whole text after the colon.
**/
[[nodiscard]] inline uri_parts parse_uri(std::string_view uri)
{
    uri_parts parts;
    auto colon = uri.find(':');
    if (colon != std::string_view::npos && colon > 0 && detail::is_ascii_alpha(uri[0]))
    {
        bool valid = true;
        for (std::size_t i = 1; i < colon && valid; i++)
        {
            const char ch = uri[i];
            valid = detail::is_ascii_alpha(ch) || (ch >= '0' && ch <= '9') || ch == '+' || ch == '-' || ch == '.';
        }
        if (valid)
        {
            parts.scheme = detail::to_lower_ascii(uri.substr(0, colon));
            uri.remove_prefix(colon + 1);
        }
    }

    if (parts.scheme == "data")
    {
        parts.path = uri;
        return parts;
    }

    if (uri.starts_with("//"))
    {
        uri.remove_prefix(2);
        auto end = uri.find_first_of("/?#");
        parts.netloc = uri.substr(0, end);
        uri = end == std::string_view::npos ? std::string_view{} : uri.substr(end);
    }
    parts.path = uri.substr(0, uri.find_first_of("?#"));
    return parts;
}


/**
Occurrence of an `<img>` tag in an HTML document.
**/
struct image_reference
{
    /**
    Byte offset of the tag.
    **/
    std::size_t offset = 0;

    /**
    Byte length of the tag.
    **/
    std::size_t length = 0;

    /**
    Tag text up to the opening quote of the `src` value.
    **/
    std::string prefix;

    /**
    The `src` value.
    **/
    std::string src;

    /**
    Tag text from the closing quote of the `src` value.
    **/
    std::string suffix;

    /**
    Tag text with another `src` value.
    **/
    std::string rebuild(std::string_view new_src) const
    {
        return prefix + std::string(new_src) + suffix;
    }
};


/**
How an image reference can be turned into an inline attachment.
**/
enum class reference_kind_t
{
    /// Bare path or `file:` URI, looked up in the image directory.
    LOCAL_FILE,
    /// `data:` URI with base64 payload.
    EMBEDDED_DATA,
    /// Anything else, left as it is.
    OTHER
};


/**
Image turned into an inline attachment.
**/
struct resolved_attachment
{
    /**
    Image bytes.
    **/
    std::string content;

    /**
    Content identifier with angle brackets.
    **/
    std::string content_id;

    /**
    File name shown for the attachment.
    **/
    std::string filename;

    /**
    Image subtype, like `png`.
    **/
    std::string subtype;
};


/**
HTML document with its image references replaced by `cid:` references.
**/
struct resolved_html
{
    std::string html;

    std::vector<resolved_attachment> attachments;
};


namespace image_detail
{

inline const detail::regex& img_tag_regex()
{
    // Single line only, a tag split by a line break is not recognized.
    static const detail::regex rx(R"((<img[ \t][^>\n]*src=")([^"\n]+)("[^>\n]*>))");
    return rx;
}

inline std::string_view basename(std::string_view path)
{
    auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

inline result<std::string> read_file(const std::filesystem::path& file)
{
    std::ifstream in(file, std::ios::in | std::ios::binary);
    if (!in)
        return fail<std::string>(errc::image_unreadable, "cannot open image file",
            detail::error_detail().add("path", file.string()).str(), std::error_code(errno, std::generic_category()));

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        return fail<std::string>(errc::image_unreadable, "cannot read image file",
            detail::error_detail().add("path", file.string()).str(), std::error_code(errno, std::generic_category()));
    return ok(std::move(data));
}

/**
Checking the file header and the DIB header size of a Windows bitmap.
**/
inline bool is_bmp(std::string_view data)
{
    constexpr std::size_t DIB_SIZE_OFFSET = 14;
    if (data.size() < DIB_SIZE_OFFSET + 4 || !data.starts_with("BM"))
        return false;
    std::uint32_t dib_size = 0;
    for (std::size_t i = 0; i < 4; i++)
        dib_size |= static_cast<std::uint32_t>(static_cast<unsigned char>(data[DIB_SIZE_OFFSET + i])) << (8 * i);
    switch (dib_size)
    {
        case 12: case 16: case 40: case 52: case 56: case 64: case 108: case 124:
            return true;
        default:
            return false;
    }
}

} // namespace image_detail


/**
Guessing the image subtype from the leading bytes.

@param data Image bytes.
@return     Subtype like `png`, nothing if the format is not recognized.
**/
[[nodiscard]] inline std::optional<std::string> sniff_image_subtype(std::string_view data)
{
    if (data.starts_with("\xFF\xD8\xFF") || (data.size() >= 10 && (data.substr(6, 4) == "JFIF" || data.substr(6, 4) == "Exif")))
        return "jpeg";
    if (data.starts_with("\x89PNG\r\n\x1A\n"))
        return "png";
    if (data.starts_with("GIF87a") || data.starts_with("GIF89a"))
        return "gif";
    if (data.starts_with(std::string_view("MM\x00\x2A", 4)) || data.starts_with(std::string_view("II\x2A\x00", 4)))
        return "tiff";
    if (image_detail::is_bmp(data))
        return "bmp";
    if (data.size() >= 12 && data.starts_with("RIFF") && data.substr(8, 4) == "WEBP")
        return "webp";
    if (data.starts_with(std::string_view("\x00\x00\x01\x00", 4)))
        return "x-icon";
    return std::nullopt;
}


/**
Finding the `<img>` tags of an HTML document which have a double quoted `src` attribute.

@param html HTML document.
@return     References in document order.
**/
[[nodiscard]] inline std::vector<image_reference> find_image_references(const std::string& html)
{
    std::vector<image_reference> refs;
    const detail::sregex_iterator end;
    for (detail::sregex_iterator it(html.begin(), html.end(), image_detail::img_tag_regex()); it != end; ++it)
    {
        const auto& m = *it;
        refs.push_back(image_reference{static_cast<std::size_t>(m.position()), static_cast<std::size_t>(m.length()),
            m.str(1), m.str(2), m.str(3)});
    }
    return refs;
}


/**
Kind of an image reference.
**/
[[nodiscard]] inline reference_kind_t reference_kind(std::string_view src)
{
    const uri_parts uri = parse_uri(src);
    if (uri.scheme.empty() || uri.scheme == "file")
        return uri.path.empty() ? reference_kind_t::OTHER : reference_kind_t::LOCAL_FILE;
    if (uri.scheme == "data")
    {
        auto comma = uri.path.find(',');
        if (comma != std::string::npos && detail::to_lower_ascii(std::string_view(uri.path).substr(0, comma)).ends_with(";base64"))
            return reference_kind_t::EMBEDDED_DATA;
    }
    return reference_kind_t::OTHER;
}


/**
Checking if an HTML document references images which `resolve_images()` turns into attachments.
**/
[[nodiscard]] inline bool has_resolvable_images(const std::string& html)
{
    for (const auto& ref : find_image_references(html))
        if (reference_kind(ref.src) != reference_kind_t::OTHER)
            return true;
    return false;
}


/**
Loading the image of a single reference.

@param src       The `src` value.
@param image_dir Directory of local images.
@return          Attachment without content identifier.
**/
[[nodiscard]] inline result<resolved_attachment> load_image(std::string_view src, const std::filesystem::path& image_dir)
{
    const uri_parts uri = parse_uri(src);
    resolved_attachment att;
    std::optional<std::string> declared_subtype;

    if (reference_kind(src) == reference_kind_t::EMBEDDED_DATA)
    {
        const auto comma = uri.path.find(',');
        const std::string media_type = detail::to_lower_ascii(std::string_view(uri.path).substr(0, uri.path.find_first_of(";,")));
        if (media_type.starts_with("image/") && media_type.size() > 6)
            declared_subtype = media_type.substr(6);

        auto data = base64().decode(std::string_view(uri.path).substr(comma + 1));
        if (!data)
            return fail<resolved_attachment>(errc::image_unreadable, "cannot decode embedded image",
                detail::error_detail().add("reference", src.substr(0, 64)).add_detail(data.error().detail).str());
        att.content = std::move(*data);
    }
    else
    {
        // A malformed escape is taken literally.
        auto decoded = percent().decode(uri.path);
        const std::string path = decoded ? std::move(*decoded) : uri.path;
        const std::string name(image_detail::basename(path));
        if (name.empty() || name == "." || name == "..")
            return fail<resolved_attachment>(errc::image_unreadable, "image reference has no file name",
                detail::error_detail().add("reference", src).str());

        auto data = image_detail::read_file(image_dir / name);
        if (!data)
        {
            auto err = std::move(data.error());
            err.detail = detail::error_detail().add("reference", src).add_detail(err.detail).str();
            return fail<resolved_attachment>(std::move(err));
        }
        att.content = std::move(*data);
        att.filename = name;
    }

    auto subtype = sniff_image_subtype(att.content);
    if (!subtype)
        subtype = declared_subtype;
    if (!subtype)
        return fail<resolved_attachment>(errc::image_unrecognized, "cannot guess image subtype",
            detail::error_detail().add("reference", src.substr(0, 64)).add_int("size", att.content.size()).str());
    att.subtype = std::move(*subtype);
    return ok(std::move(att));
}


/**
Replacing the image references of an HTML document by content identifiers.

Local files and embedded data become attachments, each with a fresh content identifier, and the `src` value of the tag becomes
`cid:<identifier>`. The rest of the tag and other references are left as they are. A reference which cannot be loaded fails the whole operation.

@param html      HTML document.
@param image_dir Directory of local images; only the base name of a reference is looked up there.
@param ids       Generator of content identifiers.
@return          Rewritten document and attachments in document order, `errc::image_unreadable` or `errc::image_unrecognized` on failure.
**/
[[nodiscard]] inline result<resolved_html> resolve_images(const std::string& html, const std::filesystem::path& image_dir, content_id_generator& ids)
{
    resolved_html out;
    std::size_t copied = 0;
    for (const auto& ref : find_image_references(html))
    {
        if (reference_kind(ref.src) == reference_kind_t::OTHER)
            continue;

        auto att = load_image(ref.src, image_dir);
        if (!att)
            return fail<resolved_html>(std::move(att.error()));

        att->content_id = ids.next_content_id();
        const std::string cid = att->content_id.substr(1, att->content_id.size() - 2);
        if (att->filename.empty())
            att->filename = std::format("{}.{}", cid.substr(0, cid.find('.')), att->subtype);
        HTMLFOOTER_DEBUG(std::format("image `{}` attached as cid:{}", ref.src.substr(0, 64), cid));

        out.html.append(html, copied, ref.offset - copied);
        out.html += ref.rebuild("cid:" + cid);
        copied = ref.offset + ref.length;
        out.attachments.push_back(std::move(*att));
    }
    out.html.append(html, copied, std::string::npos);
    return ok(std::move(out));
}


} // namespace htmlfooter::footer
