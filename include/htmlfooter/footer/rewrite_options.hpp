/*

footer/rewrite_options.hpp
--------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <filesystem>
#include <string>
#include <htmlfooter/config.hpp>

namespace htmlfooter::footer
{

/**
 * Configuration of a message rewrite.
 */
struct rewrite_options
{
    /// Directory where local image references are looked up by base name
    std::filesystem::path image_dir{"/var/lib/html_footer"};

    /// Append the audit header to rewritten messages
    bool add_audit_header = true;

    /// Audit header name
    std::string audit_header_name{"X-Modified-By"};

    /// Audit header value
    std::string audit_header_value{"Html Footer " HTMLFOOTER_VERSION};

    /// HTML document header up to the opening body tag (empty = built in)
    std::string html_header;

    // ==================== Factory Methods ====================

    /// Options for the given image directory, everything else default
    static rewrite_options with_image_dir(std::filesystem::path dir)
    {
        rewrite_options opts;
        opts.image_dir = std::move(dir);
        return opts;
    }
};

} // namespace htmlfooter::footer
