/*

test_codec.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE codec_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <htmlfooter/codec/base64.hpp>
#include <htmlfooter/codec/percent.hpp>
#include <htmlfooter/codec/quoted_printable.hpp>
#include <htmlfooter/mime/charset.hpp>


using std::string;
using std::vector;
using htmlfooter::base64;
using htmlfooter::errc;
using htmlfooter::percent;
using htmlfooter::quoted_printable;
using htmlfooter::to_utf8;


/**
Encoding a short text in Base64.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(encode_base64)
{
    base64 b64;
    vector<string> enc = b64.encode("Hello, World!");
    BOOST_TEST(enc.size() == 1u);
    BOOST_TEST(enc[0] == "SGVsbG8sIFdvcmxkIQ==");
}


/**
Encoding a text longer than a Base64 line.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(encode_base64_line_policy)
{
    base64 b64;
    vector<string> enc = b64.encode(string(60, 'a'));
    BOOST_TEST(enc.size() == 2u);
    BOOST_TEST(enc[0].size() == 76u);
    BOOST_TEST(enc[1] == "YWFh");
}


/**
Decoding Base64 split over lines with padding.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_base64_multiline)
{
    base64 b64;
    auto dec = b64.decode("SGVs\r\nbG8s\nIFdvcmxkIQ==\r\n");
    BOOST_REQUIRE(dec);
    BOOST_TEST(*dec == "Hello, World!");
}


/**
Decoding Base64 with a character outside of the alphabet.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_base64_invalid)
{
    base64 b64;
    auto dec = b64.decode("SGV*bG8=");
    BOOST_REQUIRE(!dec);
    BOOST_CHECK(dec.error().code == errc::codec_invalid_input);
    BOOST_TEST(dec.error().detail == "character=*\noffset=3\n");
}


/**
Encoding quoted printable with an equal sign and a trailing space.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(encode_qp_special_chars)
{
    quoted_printable qp;
    vector<string> enc = qp.encode("a=b \nnext\tline\n");
    BOOST_TEST(enc.size() == 3u);
    BOOST_TEST(enc[0] == "a=3Db=20");
    BOOST_TEST(enc[1] == "next\tline");
    BOOST_TEST(enc[2] == "");
}


/**
Encoding quoted printable with a line longer than the policy.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(encode_qp_soft_break)
{
    quoted_printable qp;
    vector<string> enc = qp.encode(string(80, 'x'));
    BOOST_TEST(enc.size() == 2u);
    BOOST_TEST(enc[0] == string(75, 'x') + "=");
    BOOST_TEST(enc[1] == string(5, 'x'));
}


/**
Encoding quoted printable UTF-8 text.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(encode_qp_utf8)
{
    quoted_printable qp;
    vector<string> enc = qp.encode("caf\xC3\xA9");
    BOOST_TEST(enc.size() == 1u);
    BOOST_TEST(enc[0] == "caf=C3=A9");
}


/**
Decoding quoted printable with soft breaks and hard breaks.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_qp)
{
    quoted_printable qp;
    BOOST_TEST(qp.decode("caf=C3=A9 =\r\nau lait\r\nsecond line") == "caf\xC3\xA9 au lait\nsecond line");
    BOOST_TEST(qp.decode("lower=c3=a9") == "lower\xC3\xA9");
    BOOST_TEST(qp.decode("trailing   \nend\n") == "trailing\nend\n");
}


/**
Decoding quoted printable with malformed escapes.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_qp_malformed)
{
    quoted_printable qp;
    BOOST_TEST(qp.decode("a=ZZb") == "a=ZZb");
}


/**
Decoding percent escapes.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(decode_percent)
{
    percent pct;
    auto dec = pct.decode("my%20logo%2Epng");
    BOOST_REQUIRE(dec);
    BOOST_TEST(*dec == "my logo.png");

    auto bad = pct.decode("logo%2");
    BOOST_REQUIRE(!bad);
    BOOST_CHECK(bad.error().code == errc::codec_invalid_input);
}


/**
Converting the supported charsets to UTF-8.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(charset_to_utf8)
{
    auto ascii = to_utf8("plain", "us-ascii");
    BOOST_REQUIRE(ascii);
    BOOST_TEST(*ascii == "plain");

    auto latin1 = to_utf8("caf\xE9", "ISO-8859-1");
    BOOST_REQUIRE(latin1);
    BOOST_TEST(*latin1 == "caf\xC3\xA9");

    auto utf8 = to_utf8("caf\xC3\xA9", "UTF-8");
    BOOST_REQUIRE(utf8);
    BOOST_TEST(*utf8 == "caf\xC3\xA9");
}


/**
Converting invalid UTF-8 and an unsupported charset.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(charset_errors)
{
    auto invalid = to_utf8("caf\xC3", "utf-8");
    BOOST_REQUIRE(!invalid);
    BOOST_CHECK(invalid.error().code == errc::decode_failed);
    BOOST_CHECK(invalid.error().kind() == htmlfooter::error_kind::decode);

    auto unsupported = to_utf8("text", "koi8-r");
    BOOST_REQUIRE(!unsupported);
    BOOST_CHECK(unsupported.error().code == errc::charset_unsupported);
}
