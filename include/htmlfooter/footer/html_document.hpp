/*

html_document.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

HTML alternative of a plain text body.

*/


#pragma once

#include <string>
#include <string_view>


namespace htmlfooter::footer
{


/**
Builder of the HTML alternative: a document header, preformatted plain text blocks and raw markup, then the document footer.
**/
class html_document
{
public:

    inline static const std::string DEFAULT_HEADER{
        "<!DOCTYPE HTML PUBLIC \"-//W3C//DTD HTML 4.01 Transitional//EN\"\n"
        "    \"http://www.w3.org/TR/html4/loose.dtd\">\n"
        "<html>\n"
        "<head>\n"
        "<meta http-equiv=\"content-type\" content=\"text/html; charset=UTF-8\">\n"
        "<style type=\"text/css\">\n"
        "#plaintext      {\n"
        "    font-family:Fixedsys,Courier,monospace;\n"
        "    padding:10px;\n"
        "    white-space:pre-wrap;\n"
        "}\n"
        "</style>\n"
        "</head>\n"
        "<body>\n"};

    inline static const std::string FOOTER{"</body>\n</html>"};

    /**
    Starting a document with the default header.
    **/
    html_document() : html_document(std::string_view{})
    {
    }

    /**
    Starting a document with a custom header.

    @param header Markup up to and including the opening `<body>` tag, the default header if empty.
    **/
    explicit html_document(std::string_view header) : text_(header.empty() ? DEFAULT_HEADER : std::string(header))
    {
    }

    /**
    Appending plain text as a preformatted block, the markup characters of the text are escaped.
    **/
    void add_text(std::string_view text)
    {
        text_ += "<pre id=\"plaintext\">\n";
        text_ += escape(text);
        text_ += "</pre>\n";
    }

    /**
    Appending markup as it is.
    **/
    void add_html(std::string_view html)
    {
        text_ += html;
    }

    /**
    Document text with the footer.
    **/
    std::string str() const
    {
        return text_ + FOOTER;
    }

    /**
    Escaping the characters `&`, `<` and `>`.
    **/
    static std::string escape(std::string_view text)
    {
        std::string escaped;
        escaped.reserve(text.size());
        for (char ch : text)
        {
            switch (ch)
            {
                case '&': escaped += "&amp;"; break;
                case '<': escaped += "&lt;"; break;
                case '>': escaped += "&gt;"; break;
                default: escaped += ch;
            }
        }
        return escaped;
    }

private:

    std::string text_;
};


} // namespace htmlfooter::footer
