/*

rewriter.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Rewriting of messages whose signature carries literal HTML.

*/


#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <htmlfooter/detail/ascii.hpp>
#include <htmlfooter/detail/error_detail.hpp>
#include <htmlfooter/detail/log.hpp>
#include <htmlfooter/detail/result.hpp>
#include <htmlfooter/footer/body_assembler.hpp>
#include <htmlfooter/footer/classifier.hpp>
#include <htmlfooter/footer/content_id.hpp>
#include <htmlfooter/footer/rewrite_options.hpp>
#include <htmlfooter/footer/signature.hpp>
#include <htmlfooter/mime/mime.hpp>


namespace htmlfooter::footer
{


/**
Preamble of a multipart root created for a single part message without one.
**/
inline const std::string DEFAULT_PREAMBLE{"This is a multi-part message in MIME format..."};


/**
Result of the eligibility check.
**/
struct eligibility
{
    /**
    Flag if the signature opens a literal HTML region.
    **/
    bool eligible = false;

    /**
    Signature of the first plain text part, empty if there is none.
    **/
    std::string signature;
};


/**
Result of a conditional rewrite.
**/
struct rewrite_outcome
{
    bool altered = false;

    mime message;
};


/**
Locating the plain text part which carries the signature.

@param message Message to search.
@return        Nothing for the message itself if it is a `text/plain` leaf, the index of the first `text/plain` child of a multipart message, or
               `errc::no_text_part`.
**/
[[nodiscard]] inline result<std::optional<std::size_t>> find_text_part(const mime& message)
{
    if (!message.is_multipart())
    {
        if (message.content_type().is("text", "plain"))
            return ok(std::optional<std::size_t>{});
    }
    else
    {
        const auto& parts = message.parts();
        for (std::size_t i = 0; i < parts.size(); i++)
            if (!parts[i].is_multipart() && parts[i].content_type().is("text", "plain"))
                return ok(std::optional<std::size_t>{i});
    }
    return fail<std::optional<std::size_t>>(errc::no_text_part, "message has no plain text part",
        detail::error_detail().add("content_type", message.content_type().mime_type()).str());
}


/**
Checking if a message is to be rewritten: the signature of its first plain text part has a line `<html>`.

A message without plain text part is not eligible.

@param message Message to check.
@return        Eligibility, or the decoding error of the plain text part.
**/
[[nodiscard]] inline result<eligibility> check_eligibility(const mime& message)
{
    auto index = find_text_part(message);
    if (!index)
        return ok(eligibility{});

    const mime& part = index->has_value() ? message.parts()[**index] : message;
    auto body = part.text();
    if (!body)
        return fail<eligibility>(std::move(body.error()));

    signature_split split = split_signature(*body);
    const bool eligible = has_html_marker(split.signature);
    return ok(eligibility{eligible, std::move(split.signature)});
}


[[nodiscard]] inline result<bool> is_eligible(const mime& message)
{
    auto elig = check_eligibility(message);
    if (!elig)
        return fail<bool>(std::move(elig.error()));
    return ok(elig->eligible);
}


namespace rewriter_detail
{

inline std::string message_id(const mime& message)
{
    return message.header(mime::MESSAGE_ID_HEADER).value_or("<none>");
}

/**
New `multipart/alternative` root taking over the headers of a single part message, except its `Content-` headers.
**/
inline mime copy_root(const mime& message, const mime& alternative)
{
    mime root;
    for (const auto& [name, value] : message.headers())
        if (!detail::istarts_with_ascii(name, "Content-"))
            root.add_header(name, value);
    root.unix_from(message.unix_from());
    root.preamble(message.preamble().empty() ? DEFAULT_PREAMBLE : message.preamble());
    root.epilogue(message.epilogue());

    root.content_type(alternative.content_type());
    if (!root.header(mime::MIME_VERSION_HEADER))
        root.add_header(mime::MIME_VERSION_HEADER, "1.0");
    for (const auto& part : alternative.parts())
        root.add_part(part);
    return root;
}

} // namespace rewriter_detail


/**
Rewriting a message into plain and HTML alternatives.

A single part message gets a new `multipart/alternative` root, a multipart message gets its first plain text child replaced. A message whose
signature has no `<html>` line is returned as it is. The given message is not modified.

@param message Message to rewrite.
@param options Rewrite configuration.
@param ids     Generator of boundaries and content identifiers.
@return        New message or a copy of an ineligible one, `errc::no_text_part`, or a decoding or image error.
**/
[[nodiscard]] inline result<mime> rewrite(const mime& message, const rewrite_options& options, content_id_generator& ids)
{
    auto index = find_text_part(message);
    if (!index)
        return fail<mime>(std::move(index.error()));

    auto elig = check_eligibility(message);
    if (!elig)
        return fail<mime>(std::move(elig.error()));
    if (!elig->eligible)
    {
        HTMLFOOTER_DEBUG("no html marker in signature, message left as it is");
        return ok(mime(message));
    }

    mime rewritten;
    if (!index->has_value())
    {
        HTMLFOOTER_DEBUG("plain message");
        auto alternative = assemble_part(message, options, ids);
        if (!alternative)
            return fail<mime>(std::move(alternative.error()));
        rewritten = rewriter_detail::copy_root(message, *alternative);
    }
    else
    {
        HTMLFOOTER_DEBUG("multipart message");
        auto alternative = assemble_part(message.parts()[**index], options, ids);
        if (!alternative)
            return fail<mime>(std::move(alternative.error()));
        rewritten = message;
        auto res = rewritten.replace_part(**index, std::move(*alternative));
        if (!res)
            return fail<mime>(std::move(res.error()));
    }

    if (options.add_audit_header)
    {
        HTMLFOOTER_DEBUG(std::format("add {} header", options.audit_header_name));
        rewritten.add_header(options.audit_header_name, options.audit_header_value);
    }
    return ok(std::move(rewritten));
}


[[nodiscard]] inline result<mime> rewrite(const mime& message, const rewrite_options& options)
{
    content_id_generator ids;
    return rewrite(message, options, ids);
}


/**
Rewriting a message if it is eligible, returning a copy of it otherwise.

@param message Message to rewrite.
@param options Rewrite configuration.
@return        Outcome with the flag if the message was altered, or the first error.
**/
[[nodiscard]] inline result<rewrite_outcome> rewrite_if_eligible(const mime& message, const rewrite_options& options)
{
    auto elig = is_eligible(message);
    if (!elig)
        return fail<rewrite_outcome>(std::move(elig.error()));
    if (!*elig)
    {
        HTMLFOOTER_INFO(std::format("nothing to alter in message {}", rewriter_detail::message_id(message)));
        return ok(rewrite_outcome{false, message});
    }

    auto rewritten = rewrite(message, options);
    if (!rewritten)
        return fail<rewrite_outcome>(std::move(rewritten.error()));
    HTMLFOOTER_INFO(std::format("message {} altered", rewriter_detail::message_id(message)));
    return ok(rewrite_outcome{true, std::move(*rewritten)});
}


} // namespace htmlfooter::footer
