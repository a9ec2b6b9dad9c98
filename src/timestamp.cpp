//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <string>

using namespace chatstore;
namespace chrono = std::chrono;

std::string chatstore::format_timestamp(timestamp_t input)
{
    // Split into calendar date and time of day
    auto ms = chrono::floor<chrono::milliseconds>(input);
    auto day = chrono::floor<chrono::days>(ms);
    chrono::year_month_day ymd{day};
    chrono::hh_mm_ss<chrono::milliseconds> tod{ms - day};

    // YYYY-MM-DDTHH:MM:SS.mmmZ is 24 characters long
    char buff[32]{};
    std::snprintf(
        buff,
        sizeof(buff),
        "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<int>(tod.hours().count()),
        static_cast<int>(tod.minutes().count()),
        static_cast<int>(tod.seconds().count()),
        static_cast<int>(tod.subseconds().count())
    );
    return buff;
}
