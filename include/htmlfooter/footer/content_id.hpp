/*

content_id.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <random>
#include <string>
#include <utility>
#include <unistd.h>


namespace htmlfooter::footer
{


/**
Generator of content identifiers and multipart boundaries for one assembled message.

Each generator is seeded independently, so concurrent rewrites do not share state. Identifiers carry a per-generator counter, which keeps them
unique within a message even if two generators happen to draw the same random number.
**/
class content_id_generator
{
public:

    /**
    Seeding from `std::random_device`, the domain is the host name.
    **/
    content_id_generator() : content_id_generator(local_domain(), std::random_device{}())
    {
    }

    content_id_generator(std::string domain, std::uint64_t seed)
        : domain_(std::move(domain)), engine_(seed)
    {
    }

    /**
    Next content identifier, with angle brackets, like `<part1.1700000000.4242.1234567890@host>`.
    **/
    std::string next_content_id()
    {
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return std::format("<part{}.{}.{}.{}@{}>", ++counter_, now, static_cast<long>(::getpid()), engine_() % 10000000000ULL, domain_);
    }

    /**
    Next multipart boundary.
    **/
    std::string next_boundary()
    {
        return std::format("==============={:019}==", engine_() % 10000000000000000000ULL);
    }

    /**
    Host name of the machine, `localhost` if it cannot be read.
    **/
    static std::string local_domain()
    {
        char name[256]{};
        if (::gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0')
            return "localhost";
        return name;
    }

private:

    std::string domain_;

    std::mt19937_64 engine_;

    unsigned int counter_ = 0;
};


} // namespace htmlfooter::footer
