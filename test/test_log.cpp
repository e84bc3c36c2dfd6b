/*

test_log.cpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE log_test

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <htmlfooter/detail/log.hpp>


using std::string;
using std::vector;
using htmlfooter::log::level;
using htmlfooter::log::logger;


/**
Parsing the level names of the command line.

@pre  None.
@post None.
**/
BOOST_AUTO_TEST_CASE(parse_level_names)
{
    BOOST_CHECK(htmlfooter::log::parse_level("critical") == level::fatal);
    BOOST_CHECK(htmlfooter::log::parse_level("error") == level::error);
    BOOST_CHECK(htmlfooter::log::parse_level("Warning") == level::warn);
    BOOST_CHECK(htmlfooter::log::parse_level("INFO") == level::info);
    BOOST_CHECK(htmlfooter::log::parse_level("debug") == level::debug);
    BOOST_CHECK(!htmlfooter::log::parse_level("verbose"));
}


/**
Messages below the level are not dispatched to the callback.

@pre  None.
@post Default output restored, level info.
**/
BOOST_AUTO_TEST_CASE(callback_level_filter)
{
    vector<string> messages;
    auto& log = logger::instance();
    log.set_level(level::info);
    log.set_callback([&messages](const htmlfooter::log::entry& e) {
        messages.push_back(string(htmlfooter::log::level_to_string(e.lvl)) + " " + e.message);
    });

    HTMLFOOTER_DEBUG("hidden");
    HTMLFOOTER_INFO("shown");
    HTMLFOOTER_ERROR("failure");
    log.clear_callback();

    BOOST_REQUIRE(messages.size() == 2u);
    BOOST_TEST(messages[0] == "INFO shown");
    BOOST_TEST(messages[1] == "ERROR failure");
    BOOST_TEST(!log.is_enabled(level::debug));
    BOOST_TEST(!log.is_enabled(level::off));
}


/**
Callback entries carry the source location.

@pre  None.
@post Default output restored, level info.
**/
BOOST_AUTO_TEST_CASE(callback_source_location)
{
    string file;
    auto& log = logger::instance();
    log.set_level(level::trace);
    log.set_callback([&file](const htmlfooter::log::entry& e) { file = e.location.file_name(); });
    HTMLFOOTER_TRACE("where");
    log.clear_callback();
    log.set_level(level::info);
    BOOST_TEST(file.find("test_log.cpp") != string::npos);
}


/**
Default output appended to a log file.

@pre  None.
@post Default output restored to stderr.
**/
BOOST_AUTO_TEST_CASE(file_output)
{
    const auto path = std::filesystem::temp_directory_path() / "htmlfooter_test_log.log";
    std::filesystem::remove(path);

    auto& log = logger::instance();
    log.set_level(level::info);
    BOOST_REQUIRE(log.set_file(path.string()));
    HTMLFOOTER_WARN("written to file");
    BOOST_REQUIRE(log.set_file(""));

    std::ifstream in(path);
    const string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    BOOST_TEST(content.find("[WARN] written to file\n") != string::npos);
    std::filesystem::remove(path);

    BOOST_TEST(!log.set_file("/nonexistent/directory/file.log"));
    BOOST_REQUIRE(log.set_file(""));
}
