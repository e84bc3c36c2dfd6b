/*

body_assembler.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Assembling of the plain and HTML alternatives of a body with a signature.

*/


#pragma once

#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <vector>
#include <htmlfooter/codec/codec.hpp>
#include <htmlfooter/detail/error_detail.hpp>
#include <htmlfooter/detail/log.hpp>
#include <htmlfooter/detail/result.hpp>
#include <htmlfooter/footer/classifier.hpp>
#include <htmlfooter/footer/content_id.hpp>
#include <htmlfooter/footer/html_document.hpp>
#include <htmlfooter/footer/image_resolver.hpp>
#include <htmlfooter/footer/rewrite_options.hpp>
#include <htmlfooter/footer/signature.hpp>
#include <htmlfooter/mime/mime.hpp>


namespace htmlfooter::footer
{


/**
Creating a text leaf in UTF-8, quoted printable encoded.

@param text    UTF-8 text.
@param subtype Text subtype, like `plain` or `html`.
@return        Leaf entity.
**/
[[nodiscard]] inline mime make_text_part(std::string text, std::string_view subtype)
{
    mime part;
    part.content_type(content_type_t("text", subtype, codec::CHARSET_UTF8));
    part.content_transfer_encoding(content_transfer_encoding_t::QUOTED_PRINTABLE);
    part.content(std::move(text));
    return part;
}


/**
Creating an inline image leaf, base64 encoded.
**/
[[nodiscard]] inline mime make_image_part(const resolved_attachment& attachment)
{
    mime part;
    part.content_type(content_type_t("image", attachment.subtype));
    part.content_transfer_encoding(content_transfer_encoding_t::BASE64);
    part.content_id(attachment.content_id);
    part.content_disposition("attachment", attachment.filename);
    part.content(attachment.content);
    return part;
}


/**
Creating an empty multipart container with a fresh boundary.
**/
[[nodiscard]] inline mime make_multipart(std::string_view subtype, content_id_generator& ids)
{
    content_type_t ct("multipart", subtype);
    ct.param("boundary", ids.next_boundary());
    mime container;
    container.content_type(ct);
    return container;
}


/**
Plain text alternative: the content, the signature delimiter and the plain segments of the signature.

Lines of literal HTML regions are left out.
**/
[[nodiscard]] inline std::string plain_alternative(std::string_view content, const std::vector<text_segment>& segments)
{
    std::string text(content);
    text += SIGNATURE_DELIMITER;
    text += codec::LF_CHAR;
    text += join_segments(segments, segment_kind_t::PLAIN);
    return text;
}


/**
HTML alternative: the content as preformatted text followed by the segments in signature order, literal HTML regions as they are.

@param content     Text before the signature.
@param segments    Classified signature.
@param html_header Custom document header, the default one if empty.
@return            Complete HTML document.
**/
[[nodiscard]] inline std::string html_alternative(std::string_view content, const std::vector<text_segment>& segments,
    std::string_view html_header = {})
{
    html_document doc(html_header);
    doc.add_text(content);
    for (const auto& seg : segments)
    {
        if (seg.kind == segment_kind_t::HTML)
            doc.add_html(seg.text);
        else
            doc.add_text(seg.text);
    }
    return doc.str();
}


/**
Assembling the `multipart/alternative` replacement of a text body.

The first child is the plain alternative, the second one the HTML alternative. If the HTML references local or embedded images, the HTML branch is
a `multipart/related` entity holding the HTML leaf followed by one image leaf per reference.

@param content     Text before the signature.
@param signature   Text after the signature delimiter.
@param image_dir   Directory of local images.
@param ids         Generator of boundaries and content identifiers.
@param html_header Custom HTML document header, the default one if empty.
@return            Assembled entity or the error of `resolve_images()`.
**/
[[nodiscard]] inline result<mime> assemble(std::string_view content, std::string_view signature, const std::filesystem::path& image_dir,
    content_id_generator& ids, std::string_view html_header = {})
{
    const auto segments = classify(signature);
    std::string html = html_alternative(content, segments, html_header);

    mime html_branch;
    if (has_resolvable_images(html))
    {
        auto resolved = resolve_images(html, image_dir, ids);
        if (!resolved)
            return fail<mime>(std::move(resolved.error()));

        html_branch = make_multipart("related", ids);
        html_branch.add_part(make_text_part(std::move(resolved->html), "html"));
        for (const auto& att : resolved->attachments)
            html_branch.add_part(make_image_part(att));
        HTMLFOOTER_DEBUG(std::format("html alternative with {} inline image(s)", resolved->attachments.size()));
    }
    else
        html_branch = make_text_part(std::move(html), "html");

    mime alternative = make_multipart("alternative", ids);
    alternative.add_part(make_text_part(plain_alternative(content, segments), "plain"));
    alternative.add_part(std::move(html_branch));
    return ok(std::move(alternative));
}


/**
Assembling the `multipart/alternative` replacement of a `text/plain` leaf.

@param text_part Leaf to replace.
@param options   Image directory and HTML header.
@param ids       Generator of boundaries and content identifiers.
@return          Assembled entity, `errc::no_text_part` if the entity is not a text leaf, or a decoding or image error.
**/
[[nodiscard]] inline result<mime> assemble_part(const mime& text_part, const rewrite_options& options, content_id_generator& ids)
{
    const content_type_t ct = text_part.content_type();
    if (!ct.is("text", "plain"))
        return fail<mime>(errc::no_text_part, "entity is not plain text", detail::error_detail().add("content_type", ct.mime_type()).str());

    auto body = text_part.text();
    if (!body)
        return fail<mime>(std::move(body.error()));

    const signature_split split = split_signature(*body);
    return assemble(split.content, split.signature, options.image_dir, ids, options.html_header);
}


} // namespace htmlfooter::footer
