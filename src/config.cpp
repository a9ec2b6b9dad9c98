//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/system/result.hpp>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <string>
#include <string_view>

#include "error.hpp"

using namespace chatstore;
using boost::system::result;

namespace {

// Returns the value of an environment variable, or default_value if it's not defined
std::string getenv_or(const env_lookup& getenv_fn, const char* name, const char* default_value)
{
    const char* res = getenv_fn(name);
    return res == nullptr ? default_value : res;
}

// Parses an integer >= min_value, rejecting trailing characters and out of range values
template <class T>
result<T> parse_number(std::string_view from, T min_value)
{
    T res{};
    auto [ptr, ec] = std::from_chars(from.data(), from.data() + from.size(), res);
    if (ec != std::errc() || ptr != from.data() + from.size() || res < min_value)
        CHATSTORE_RETURN_ERROR(errc::invalid_argument)
    return res;
}

// Overwrites output with the parsed variable, if it's defined
template <class T>
error_code load_number(const env_lookup& getenv_fn, const char* name, T& output, T min_value)
{
    const char* value = getenv_fn(name);
    if (value == nullptr)
        return error_code();
    auto res = parse_number<T>(value, min_value);
    if (res.has_error())
        return res.error();
    output = *res;
    return error_code();
}

}  // namespace

result<backend_type> chatstore::parse_backend_type(std::string_view from)
{
    if (boost::algorithm::iequals(from, "sqlite"))
        return backend_type::sqlite;
    else if (boost::algorithm::iequals(from, "mysql"))
        return backend_type::mysql;
    else
        CHATSTORE_RETURN_ERROR(errc::invalid_argument)
}

std::string chatstore::get_data_dir(const env_lookup& getenv_fn)
{
    const char* dir = getenv_fn("CHATSTORE_DATA_DIR");
    if (dir != nullptr)
        return dir;
    return getenv_or(getenv_fn, "HOME", ".") + "/.chatstore";
}

result<store_config> chatstore::load_store_config(const env_lookup& getenv_fn)
{
    store_config res;

    // Backend
    auto backend = parse_backend_type(getenv_or(getenv_fn, "CHATSTORE_BACKEND", "sqlite"));
    if (backend.has_error())
        return backend.error();
    res.backend = *backend;

    // SQLite
    const char* sqlite_path = getenv_fn("CHATSTORE_SQLITE_PATH");
    res.sqlite.path = sqlite_path ? sqlite_path : get_data_dir(getenv_fn) + "/database.sqlite3";
    // Zero disables waiting for locks
    using ms_rep = std::chrono::milliseconds::rep;
    ms_rep busy_timeout_ms = res.sqlite.busy_timeout.count();
    if (auto ec = load_number(getenv_fn, "CHATSTORE_SQLITE_BUSY_TIMEOUT_MS", busy_timeout_ms, ms_rep(0)))
        return ec;
    res.sqlite.busy_timeout = std::chrono::milliseconds(busy_timeout_ms);

    // MySQL
    res.mysql.hostname = getenv_or(getenv_fn, "MYSQL_HOST", "localhost");
    res.mysql.username = getenv_or(getenv_fn, "MYSQL_USERNAME", "chatstore_user");
    res.mysql.password = getenv_or(getenv_fn, "MYSQL_PASSWORD", "");
    res.mysql.database = getenv_or(getenv_fn, "MYSQL_DATABASE", "chatstore");
    if (auto ec = load_number(getenv_fn, "MYSQL_PORT", res.mysql.port, static_cast<unsigned short>(1)))
        return ec;
    ms_rep connection_timeout_ms = res.mysql.connection_timeout.count();
    if (auto ec = load_number(getenv_fn, "MYSQL_CONNECT_TIMEOUT_MS", connection_timeout_ms, ms_rep(1)))
        return ec;
    res.mysql.connection_timeout = std::chrono::milliseconds(connection_timeout_ms);

    return res;
}

result<store_config> chatstore::load_store_config()
{
    return load_store_config([](const char* name) -> const char* { return std::getenv(name); });
}
