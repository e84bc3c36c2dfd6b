/*

regex.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Regular expression backend, Boost.Regex unless HTMLFOOTER_USE_STD_REGEX.

*/

#pragma once

#include <htmlfooter/config.hpp>

#if HTMLFOOTER_USE_STD_REGEX
#include <regex>
#else
#include <boost/regex.hpp>
#endif

namespace htmlfooter::detail
{
#if HTMLFOOTER_USE_STD_REGEX
using regex = std::regex;
using sregex_iterator = std::sregex_iterator;
#else
using regex = boost::regex;
using sregex_iterator = boost::sregex_iterator;
#endif
} // namespace htmlfooter::detail
