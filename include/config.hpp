//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_CONFIG_HPP
#define CHATSTORE_INCLUDE_CONFIG_HPP

#include <boost/system/result.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

// Store configuration. Values come from environment variables,
// falling back to defaults suitable for development.

namespace chatstore {

// The storage engine to use
enum class backend_type
{
    sqlite,
    mysql,
};

struct sqlite_config
{
    // Path to the database file. ":memory:" creates a private in-memory database
    std::string path;

    // How long to wait for locks held by other processes before failing
    std::chrono::milliseconds busy_timeout{5000};
};

struct mysql_config
{
    std::string hostname{"localhost"};
    unsigned short port{3306};
    std::string username{"chatstore_user"};
    std::string password;
    std::string database{"chatstore"};

    // Connection pool sizing
    std::size_t initial_size{1};
    std::size_t max_size{16};

    // How long to wait for a connection to become available, and for each
    // connect attempt. Operations fail after this time if the server is unreachable
    std::chrono::milliseconds connection_timeout{10000};
};

struct store_config
{
    backend_type backend{backend_type::sqlite};
    sqlite_config sqlite;
    mysql_config mysql;
};

// Returns the value of an environment variable, or nullptr if it's not defined
using env_lookup = std::function<const char*(const char*)>;

// Parses "sqlite" or "mysql", case-insensitively
boost::system::result<backend_type> parse_backend_type(std::string_view from);

// The directory where the store keeps its files by default:
// CHATSTORE_DATA_DIR or $HOME/.chatstore. Doesn't create it.
std::string get_data_dir(const env_lookup& getenv_fn);

// Builds the configuration from environment variables. Fails with
// errc::invalid_argument if any of them is malformed
boost::system::result<store_config> load_store_config(const env_lookup& getenv_fn);

// Same, using the process environment
boost::system::result<store_config> load_store_config();

}  // namespace chatstore

#endif
