//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_TIMESTAMP_HPP
#define CHATSTORE_INCLUDE_TIMESTAMP_HPP

#include <chrono>
#include <string>

// Helpers to work with timestamps.
// The stored representation of a timestamp is an ISO-8601 UTC string with
// millisecond precision, e.g. 2023-09-14T08:30:00.125Z. Strings in this
// format sort lexicographically in chronological order.

namespace chatstore {

// Timestamps are eventually shown to the user, so we need them to match the system clock
using timestamp_t = std::chrono::system_clock::time_point;

// Converts a timestamp to its stored representation
std::string format_timestamp(timestamp_t input);

// The stored representation of the current time
inline std::string now_timestamp() { return format_timestamp(std::chrono::system_clock::now()); }

}  // namespace chatstore

#endif
