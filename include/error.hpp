//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_ERROR_HPP
#define CHATSTORE_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio and Boost.MySQL.

namespace chatstore {

using boost::system::error_code;

// Error code enum for errors originated within the store
enum class errc
{
    constraint_violation = 1,  // uniqueness, primary key, NOT NULL or CHECK constraint failed
    referential_error,         // a foreign key references a row that doesn't exist
    not_found,                 // couldn't retrieve a certain resource, it doesn't exist
    invalid_argument,          // the request can't be expressed by the store (e.g. bad page size)
    foreign_keys_disabled,     // the engine refused to enforce referential integrity
};

// The error category for errc
const boost::system::error_category& get_chatstore_category() noexcept;

// The error category for raw SQLite result codes
const boost::system::error_category& get_sqlite_category() noexcept;

// Allows constructing error_code from errc
inline error_code make_error_code(errc v) noexcept
{
    return error_code(static_cast<int>(v), get_chatstore_category());
}

// An error code plus the diagnostic text the storage engine produced, if any
struct error_with_message
{
    error_code ec;
    std::string msg;
};

// Required by boost::system::result to throw on value() when an error is present
[[noreturn]] void throw_exception_from_error(const error_with_message& e, const boost::source_location& loc);

// The return type of fallible store operations
template <class T>
using result_with_message = boost::system::result<T, error_with_message>;

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");

// Same, for an error_with_message
inline void log_error(const error_with_message& err, std::string_view what)
{
    log_error(err.ec, what, err.msg);
}

}  // namespace chatstore

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<chatstore::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define CHATSTORE_RETURN_ERROR(e)                                                 \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

#endif
