/*

config.hpp
----------

Global build configuration for htmlfooter.

Define HTMLFOOTER_USE_STD_REGEX to use std::regex instead of Boost.Regex.

*/

#pragma once

#if defined(HTMLFOOTER_USE_STD_REGEX)
#undef HTMLFOOTER_USE_STD_REGEX
#define HTMLFOOTER_USE_STD_REGEX 1
#else
#define HTMLFOOTER_USE_STD_REGEX 0
#endif

/// Version string reported by the audit header and the pipe filter.
#define HTMLFOOTER_VERSION "20120227"
