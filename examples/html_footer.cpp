/*

html_footer.cpp
---------------

Mail filter reading a message from the standard input and writing it to the standard output, with plain and HTML alternatives if the signature of
its plain text carries literal HTML. Any other message, and any message failing to rewrite, is written out unchanged.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdio>
#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <getopt.h>
#include <htmlfooter/htmlfooter.hpp>


using std::cerr;
using std::cin;
using std::cout;
using std::string;
using htmlfooter::error_info;
using htmlfooter::mime;
using htmlfooter::footer::rewrite_options;


namespace
{

constexpr int NO_X_HEADER_OPTION = 256;

[[noreturn]] void usage(const char* name, int code, const string& msg = {})
{
    cerr << "Usage: " << name << " [OPTION...]\n\n"
        << "    -h, --help             show this help message\n"
        << "    -V, --version          shows version information\n"
        << "    -p, --pipemode         read/write message from/to stdin/stdout (always on)\n"
        << "    -d, --debuglevel=LEVEL default level = info\n"
        << "                           valid levels: critical, error, warning,\n"
        << "                                         info, debug\n"
        << "    -i, --imagepath=PATH   path for attachments (default: /var/lib/html_footer)\n"
        << "    -f, --logfile=FILENAME\n"
        << "        --no-x-header      do not add the X-Modified-By header\n";
    if (!msg.empty())
        cerr << msg << '\n';
    std::exit(code);
}

string describe(const error_info& err)
{
    string text = std::format("{} ({}): {}", htmlfooter::to_string(err.code), static_cast<unsigned>(err.code), err.message);
    if (!err.detail.empty())
        text += " [" + err.detail + "]";
    if (err.sys)
        text += " " + err.sys.message();
    text += std::format(" at {}:{}", err.where.file_name(), err.where.line());
    return text;
}

/**
Rewriting the message text, empty result if the message is to be passed through.
**/
std::optional<string> modify_data(const string& msg_in, const rewrite_options& options)
{
    mime msg;
    if (auto res = msg.parse(msg_in); !res)
    {
        HTMLFOOTER_ERROR("cannot parse message: " + describe(res.error()));
        return std::nullopt;
    }

    auto outcome = htmlfooter::footer::rewrite_if_eligible(msg, options);
    if (!outcome)
    {
        HTMLFOOTER_ERROR("cannot rewrite message: " + describe(outcome.error()));
        return std::nullopt;
    }
    if (!outcome->altered)
        return std::nullopt;

    htmlfooter::mime_format_options_t fmt;
    fmt.crlf = msg_in.find("\r\n") != string::npos;
    string msg_out;
    if (auto res = outcome->message.format(msg_out, fmt); !res)
    {
        HTMLFOOTER_ERROR("cannot format message: " + describe(res.error()));
        return std::nullopt;
    }
    return msg_out;
}

} // namespace


int main(int argc, char* argv[])
{
    rewrite_options options;
    htmlfooter::log::level level = htmlfooter::log::level::info;
    string logfile;

    static const option long_options[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {"pipemode", no_argument, nullptr, 'p'},
        {"debuglevel", required_argument, nullptr, 'd'},
        {"imagepath", required_argument, nullptr, 'i'},
        {"logfile", required_argument, nullptr, 'f'},
        {"no-x-header", no_argument, nullptr, NO_X_HEADER_OPTION},
        {nullptr, 0, nullptr, 0}};

    int c;
    while ((c = getopt_long(argc, argv, "hVpd:i:f:", long_options, nullptr)) != -1)
    {
        switch (c)
        {
            case 'h':
                usage(argv[0], EXIT_SUCCESS);
            case 'V':
                cerr << HTMLFOOTER_VERSION << '\n';
                return EXIT_SUCCESS;
            case 'p':
                break;
            case 'd':
            {
                auto parsed = htmlfooter::log::parse_level(optarg);
                if (!parsed)
                    usage(argv[0], EXIT_FAILURE, std::format("Unknown debuglevel {}", optarg));
                level = *parsed;
                break;
            }
            case 'i':
                options.image_dir = optarg;
                break;
            case 'f':
                logfile = optarg;
                break;
            case NO_X_HEADER_OPTION:
                options.add_audit_header = false;
                break;
            default:
                usage(argv[0], EXIT_FAILURE);
        }
    }
    if (optind < argc)
        usage(argv[0], EXIT_FAILURE, std::format("unknown arguments {}", argv[optind]));

    auto& logger = htmlfooter::log::logger::instance();
    logger.set_level(level);
    if (!logger.set_file(logfile))
        cerr << argv[0] << ": cannot open log file " << logfile << ", logging to stderr\n";

    const string msg_in((std::istreambuf_iterator<char>(cin)), std::istreambuf_iterator<char>());
    HTMLFOOTER_DEBUG("Msg in:\n" + msg_in);

    const auto msg_out = modify_data(msg_in, options);
    if (msg_out)
        HTMLFOOTER_DEBUG("Msg out:\n" + *msg_out);
    cout << msg_out.value_or(msg_in) << std::flush;
    return cout ? EXIT_SUCCESS : EXIT_FAILURE;
}
