/*

test_body_assembler.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE body_assembler_test

#include <filesystem>
#include <fstream>
#include <string>
#include <boost/test/unit_test.hpp>
#include <htmlfooter/footer/body_assembler.hpp>


using std::string;
using htmlfooter::content_transfer_encoding_t;
using htmlfooter::content_type_t;
using htmlfooter::errc;
using htmlfooter::mime;
using htmlfooter::footer::assemble;
using htmlfooter::footer::assemble_part;
using htmlfooter::footer::classify;
using htmlfooter::footer::content_id_generator;
using htmlfooter::footer::html_alternative;
using htmlfooter::footer::html_document;
using htmlfooter::footer::plain_alternative;
using htmlfooter::footer::rewrite_options;
namespace fs = std::filesystem;


namespace
{

const string PNG_BYTES = string("\x89PNG\r\n\x1A\n", 8) + string("\x00\x00\x00\x0DIHDR", 8);

struct assembler_fixture
{
    assembler_fixture() : dir(fs::temp_directory_path() / "htmlfooter_test_assembler")
    {
        fs::remove_all(dir);
        fs::create_directories(dir);
        std::ofstream out(dir / "logo.png", std::ios::binary);
        out << PNG_BYTES;
    }

    ~assembler_fixture()
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    content_id_generator ids{"example.org", 7};
};

} // namespace


/**
Escaping markup characters of plain text in a preformatted block.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(document_text_escaped)
{
    html_document doc("<body>\n");
    doc.add_text("a < b && c > d\n");
    doc.add_html("<hr/>\n");
    BOOST_TEST(doc.str() == "<body>\n<pre id=\"plaintext\">\na &lt; b &amp;&amp; c &gt; d\n</pre>\n<hr/>\n</body>\n</html>");
}


/**
A document without custom header starts with the default header.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(document_default_header)
{
    html_document doc;
    const string text = doc.str();
    BOOST_TEST(text.starts_with(html_document::DEFAULT_HEADER));
    BOOST_TEST(text.ends_with("<body>\n</body>\n</html>"));
    BOOST_TEST(text.find("charset=UTF-8") != string::npos);
}


/**
The plain alternative keeps the plain segments of the signature only.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(plain_keeps_plain_segments)
{
    const auto segs = classify("Alice\n<html>\n<b>Alice</b>\n</html>\nPhone 123\n");
    BOOST_TEST(plain_alternative("Hi Bob\n", segs) == "Hi Bob\n-- \nAlice\nPhone 123\n");
}


/**
The HTML alternative keeps content and segments in order.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(html_keeps_order)
{
    const auto segs = classify("Alice\n<html>\n<b>Alice</b>\n</html>\nPhone 123\n");
    BOOST_TEST(html_alternative("Hi <Bob>\n", segs, "<body>\n") == "<body>\n"
        "<pre id=\"plaintext\">\nHi &lt;Bob&gt;\n</pre>\n"
        "<pre id=\"plaintext\">\nAlice\n</pre>\n"
        "<b>Alice</b>\n"
        "<pre id=\"plaintext\">\nPhone 123\n</pre>\n"
        "</body>\n</html>");
}


/**
Assembling a body without images gives two text leaves.

@pre  None.
@post None.
**/
BOOST_FIXTURE_TEST_CASE(assemble_without_images, assembler_fixture)
{
    auto res = assemble("Hi Bob\n", "<html>\n<b>Alice</b>\n</html>\n", dir, ids);
    BOOST_REQUIRE(res);
    BOOST_TEST(res->content_type().mime_type() == "multipart/alternative");
    BOOST_TEST(!res->content_type().boundary().empty());
    BOOST_REQUIRE(res->parts().size() == 2u);

    const mime& plain = res->parts()[0];
    BOOST_TEST(plain.content_type().mime_type() == "text/plain");
    BOOST_TEST(plain.content_type().charset() == "utf-8");
    BOOST_CHECK(plain.content_transfer_encoding() == content_transfer_encoding_t::QUOTED_PRINTABLE);
    BOOST_TEST(plain.content() == "Hi Bob\n-- \n");

    const mime& html = res->parts()[1];
    BOOST_TEST(html.content_type().mime_type() == "text/html");
    BOOST_TEST(html.content().find("<b>Alice</b>\n") != string::npos);
    BOOST_TEST(html.content().find("<pre id=\"plaintext\">\nHi Bob\n</pre>\n") != string::npos);
}


/**
Assembling a body with an image gives a related HTML branch.

@pre  Image directory with `logo.png`.
@post None.
**/
BOOST_FIXTURE_TEST_CASE(assemble_with_image, assembler_fixture)
{
    auto res = assemble("Hi Bob\n", "<html>\n<img src=\"logo.png\">\n</html>\n", dir, ids);
    BOOST_REQUIRE(res);
    BOOST_REQUIRE(res->parts().size() == 2u);

    const mime& related = res->parts()[1];
    BOOST_TEST(related.content_type().mime_type() == "multipart/related");
    BOOST_TEST(related.content_type().boundary() != res->content_type().boundary());
    BOOST_REQUIRE(related.parts().size() == 2u);

    const mime& image = related.parts()[1];
    BOOST_TEST(image.content_type().mime_type() == "image/png");
    BOOST_CHECK(image.content_transfer_encoding() == content_transfer_encoding_t::BASE64);
    BOOST_TEST(image.content() == PNG_BYTES);
    BOOST_TEST(*image.header("Content-Disposition") == "attachment; filename=\"logo.png\"");

    const string cid = image.content_id();
    BOOST_REQUIRE(cid.size() > 2u);
    const mime& html = related.parts()[0];
    BOOST_TEST(html.content_type().mime_type() == "text/html");
    BOOST_TEST(html.content().find("<img src=\"cid:" + cid.substr(1, cid.size() - 2) + "\">") != string::npos);
}


/**
A missing image fails the assembly.

@pre  Image directory without `nothere.png`.
@post None.
**/
BOOST_FIXTURE_TEST_CASE(assemble_missing_image, assembler_fixture)
{
    auto res = assemble("Hi\n", "<html>\n<img src=\"nothere.png\">\n</html>\n", dir, ids);
    BOOST_REQUIRE(!res);
    BOOST_CHECK(res.error().code == errc::image_unreadable);
}


/**
Assembling from a latin1 text leaf.

@pre  None.
@post None.
**/
BOOST_FIXTURE_TEST_CASE(assemble_from_part, assembler_fixture)
{
    mime part;
    part.content_type(content_type_t("text", "plain", "iso-8859-1"));
    part.content("Gr\xFC\xDF" "e\n-- \n<html>\n<i>Alice</i>\n</html>\n");

    rewrite_options options = rewrite_options::with_image_dir(dir);
    options.html_header = "<body>\n";
    auto res = assemble_part(part, options, ids);
    BOOST_REQUIRE(res);
    BOOST_REQUIRE(res->parts().size() == 2u);
    BOOST_TEST(res->parts()[0].content() == "Gr\xC3\xBC\xC3\x9F" "e\n-- \n");
    BOOST_TEST(res->parts()[1].content() == "<body>\n<pre id=\"plaintext\">\nGr\xC3\xBC\xC3\x9F" "e\n</pre>\n<i>Alice</i>\n</body>\n</html>");
}


/**
Assembling from a leaf which is not plain text or has an unsupported charset.

@pre  None.
@post None.
**/
BOOST_FIXTURE_TEST_CASE(assemble_from_bad_part, assembler_fixture)
{
    mime html;
    html.content_type(content_type_t("text", "html"));
    auto res = assemble_part(html, rewrite_options::with_image_dir(dir), ids);
    BOOST_REQUIRE(!res);
    BOOST_CHECK(res.error().code == errc::no_text_part);

    mime koi8;
    koi8.content_type(content_type_t("text", "plain", "koi8-r"));
    koi8.content("text\n");
    res = assemble_part(koi8, rewrite_options::with_image_dir(dir), ids);
    BOOST_REQUIRE(!res);
    BOOST_CHECK(res.error().code == errc::charset_unsupported);
}
