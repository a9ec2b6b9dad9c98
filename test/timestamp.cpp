//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "timestamp.hpp"

#include <boost/test/unit_test.hpp>

#include <chrono>

using namespace chatstore;
namespace chrono = std::chrono;

BOOST_AUTO_TEST_SUITE(timestamp_)

BOOST_AUTO_TEST_CASE(format_timestamp_epoch)
{
    BOOST_TEST(format_timestamp(timestamp_t()) == "1970-01-01T00:00:00.000Z");
}

BOOST_AUTO_TEST_CASE(format_timestamp_fields)
{
    timestamp_t ts = chrono::sys_days(chrono::year(2024) / 1 / 5) + chrono::hours(9) + chrono::minutes(7) +
                     chrono::seconds(3) + chrono::milliseconds(42);
    BOOST_TEST(format_timestamp(ts) == "2024-01-05T09:07:03.042Z");
}

BOOST_AUTO_TEST_CASE(format_timestamp_truncates)
{
    // Sub-millisecond precision is discarded
    timestamp_t ts = chrono::sys_days(chrono::year(2023) / 12 / 31) + chrono::hours(23) + chrono::minutes(59) +
                     chrono::seconds(59) + chrono::microseconds(999999);
    BOOST_TEST(format_timestamp(ts) == "2023-12-31T23:59:59.999Z");
}

BOOST_AUTO_TEST_CASE(format_timestamp_sorts_chronologically)
{
    // Stored timestamps are compared as strings
    timestamp_t t1 = chrono::sys_days(chrono::year(2024) / 2 / 9) + chrono::hours(10);
    timestamp_t t2 = chrono::sys_days(chrono::year(2024) / 10 / 1);
    BOOST_TEST(format_timestamp(t1) < format_timestamp(t2));
}

BOOST_AUTO_TEST_CASE(now_timestamp_format)
{
    auto ts = now_timestamp();
    BOOST_TEST_REQUIRE(ts.size() == 24u);
    BOOST_TEST(ts[4] == '-');
    BOOST_TEST(ts[10] == 'T');
    BOOST_TEST(ts[19] == '.');
    BOOST_TEST(ts[23] == 'Z');
}

BOOST_AUTO_TEST_SUITE_END()
