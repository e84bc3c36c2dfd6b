/*

test_signature.cpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE signature_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <htmlfooter/footer/signature.hpp>


using std::string;
using htmlfooter::footer::signature_split;
using htmlfooter::footer::split_signature;


/**
Splitting a body at the delimiter line.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_body)
{
    signature_split split = split_signature("Hi Bob\n\nregards\n-- \nAlice\n<html>\n<b>Alice</b>\n</html>\n");
    BOOST_TEST(split.found);
    BOOST_TEST(split.content == "Hi Bob\n\nregards\n");
    BOOST_TEST(split.signature == "Alice\n<html>\n<b>Alice</b>\n</html>\n");
}


/**
A body without delimiter is all content.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_no_delimiter)
{
    signature_split split = split_signature("Hi Bob\n--\nno delimiter\n");
    BOOST_TEST(!split.found);
    BOOST_TEST(split.content == "Hi Bob\n--\nno delimiter\n");
    BOOST_TEST(split.signature.empty());
}


/**
Only the first delimiter line counts, the rest belongs to the signature.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_first_delimiter)
{
    signature_split split = split_signature("text\n-- \nfirst\n-- \nsecond\n");
    BOOST_TEST(split.content == "text\n");
    BOOST_TEST(split.signature == "first\n-- \nsecond\n");
}


/**
A delimiter on the first line gives empty content, a delimiter on the last line an empty signature.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_edges)
{
    signature_split first = split_signature("-- \nsig\n");
    BOOST_TEST(first.found);
    BOOST_TEST(first.content.empty());
    BOOST_TEST(first.signature == "sig\n");

    signature_split last = split_signature("text\n-- ");
    BOOST_TEST(last.found);
    BOOST_TEST(last.content == "text\n");
    BOOST_TEST(last.signature.empty());
}


/**
A delimiter followed by CR is recognized, lines with other trailing text are not.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(split_crlf_and_near_misses)
{
    signature_split crlf = split_signature("text\r\n-- \r\nsig\r\n");
    BOOST_TEST(crlf.found);
    BOOST_TEST(crlf.content == "text\r\n");
    BOOST_TEST(crlf.signature == "sig\r\n");

    BOOST_TEST(!split_signature("text\n--  \nsig\n").found);
    BOOST_TEST(!split_signature("text\n -- \nsig\n").found);
}
