//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_CLI_HPP
#define CHATSTORE_INCLUDE_CLI_HPP

#include <boost/asio/awaitable.hpp>

#include <charconv>
#include <cstddef>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/chat_store.hpp"

// Argument parsing and command dispatching for the chatstore tool.
// Arguments are passed without the program name: args[0] is the command name.

namespace chatstore {

struct command_def
{
    std::string_view name;
    std::string_view args;
    std::size_t min_args;
    std::size_t max_args;
};

// All the commands supported by the tool
std::span<const command_def> get_commands() noexcept;

// Returns whether args names a known command with a valid number of arguments
bool check_command_line(std::span<const std::string_view> args) noexcept;

// Writes the usage text
void print_usage(std::ostream& os, std::string_view program);

// Parses a positive integer, as used by IDs and limits
template <class T>
result_with_message<T> parse_positive(std::string_view from, std::string_view what)
{
    T res{};
    auto [ptr, ec] = std::from_chars(from.data(), from.data() + from.size(), res);
    if (ec != std::errc() || ptr != from.data() + from.size() || !(res > T{}))
        return error_with_message{errc::invalid_argument, "Invalid " + std::string(what) + ": " + std::string(from)};
    return res;
}

// Parses the arguments of the timeline command:
// timeline <room-id> [limit] [asc|desc] [<cursor-timestamp> <cursor-id>]
result_with_message<timeline_query> parse_timeline_query(std::span<const std::string_view> args);

// Runs a single command against the store. args must have passed check_command_line.
// Returns the JSON to print, or an empty string if the command has no output
boost::asio::awaitable<result_with_message<std::string>> run_command(
    chat_store& store,
    std::vector<std::string_view> args
);

}  // namespace chatstore

#endif
