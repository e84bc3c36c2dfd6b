/*

test_classifier.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE classifier_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <htmlfooter/footer/classifier.hpp>


using std::string;
using std::vector;
using htmlfooter::footer::classify;
using htmlfooter::footer::has_html_marker;
using htmlfooter::footer::join_segments;
using htmlfooter::footer::segment_kind_t;
using htmlfooter::footer::signature_classifier;
using htmlfooter::footer::text_segment;


/**
Classifying a signature with plain text around a literal HTML region.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(classify_mixed)
{
    vector<text_segment> segs = classify("Alice\n<html>\n<b>Alice</b>\n<hr/>\n</html>\nPhone 123\n");
    BOOST_REQUIRE(segs.size() == 3u);
    BOOST_CHECK(segs[0] == (text_segment{segment_kind_t::PLAIN, "Alice\n"}));
    BOOST_CHECK(segs[1] == (text_segment{segment_kind_t::HTML, "<b>Alice</b>\n<hr/>\n"}));
    BOOST_CHECK(segs[2] == (text_segment{segment_kind_t::PLAIN, "Phone 123\n"}));
}


/**
An HTML region without closing marker runs to the end of the signature.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(classify_unclosed)
{
    vector<text_segment> segs = classify("<html>\n<p>x</p>\n<p>y</p>");
    BOOST_REQUIRE(segs.size() == 1u);
    BOOST_CHECK(segs[0].kind == segment_kind_t::HTML);
    BOOST_TEST(segs[0].text == "<p>x</p>\n<p>y</p>\n");
}


/**
Empty regions are not emitted, marker lines never.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(classify_empty_regions)
{
    BOOST_TEST(classify("").empty());
    BOOST_TEST(classify("<html>\n</html>\n").empty());

    vector<text_segment> segs = classify("<html>\n</html>\n<html>\n<i>a</i>\n</html>\n");
    BOOST_REQUIRE(segs.size() == 1u);
    BOOST_CHECK(segs[0] == (text_segment{segment_kind_t::HTML, "<i>a</i>\n"}));
}


/**
Marker lines must match exactly, case and surrounding spaces included.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(classify_exact_markers)
{
    vector<text_segment> segs = classify("<HTML>\n <html>\n<html> \n");
    BOOST_REQUIRE(segs.size() == 1u);
    BOOST_CHECK(segs[0].kind == segment_kind_t::PLAIN);
    BOOST_TEST(segs[0].text == "<HTML>\n <html>\n<html> \n");
    BOOST_TEST(!has_html_marker("<HTML>\n <html>\n"));
}


/**
Classifying a signature with CRLF line endings.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(classify_crlf)
{
    vector<text_segment> segs = classify("sig\r\n<html>\r\n<b>x</b>\r\n</html>\r\n");
    BOOST_REQUIRE(segs.size() == 2u);
    BOOST_TEST(segs[0].text == "sig\n");
    BOOST_TEST(segs[1].text == "<b>x</b>\n");
    BOOST_TEST(has_html_marker("sig\r\n<html>\r\n"));
}


/**
Feeding the automaton line by line.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(automaton_transitions)
{
    using state_t = signature_classifier::state_t;
    using line_kind_t = signature_classifier::line_kind_t;

    static_assert(signature_classifier::transition(state_t::PLAIN, line_kind_t::BEGIN_MARKER) == state_t::HTML);
    static_assert(signature_classifier::transition(state_t::HTML, line_kind_t::END_MARKER) == state_t::PLAIN);
    static_assert(signature_classifier::transition(state_t::HTML, line_kind_t::TEXT) == state_t::HTML);
    static_assert(signature_classifier::transition(state_t::PLAIN, line_kind_t::END_MARKER) == state_t::PLAIN);

    signature_classifier classifier;
    classifier.feed("a");
    BOOST_CHECK(classifier.state() == state_t::PLAIN);
    classifier.feed("<html>");
    BOOST_CHECK(classifier.state() == state_t::HTML);
    classifier.feed("b");
    vector<text_segment> segs = classifier.finish();
    BOOST_REQUIRE(segs.size() == 2u);
    BOOST_CHECK(classifier.state() == state_t::PLAIN);
    BOOST_TEST(classifier.finish().empty());
}


/**
Joining the segments of a kind.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(join_by_kind)
{
    vector<text_segment> segs = classify("one\n<html>\n<b/>\n</html>\ntwo\n");
    BOOST_TEST(join_segments(segs, segment_kind_t::PLAIN) == "one\ntwo\n");
    BOOST_TEST(join_segments(segs, segment_kind_t::HTML) == "<b/>\n");
}
