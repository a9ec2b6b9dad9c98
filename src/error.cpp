//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/system/system_error.hpp>

#include <sqlite3.h>

#include <iostream>
#include <string_view>

namespace chatstore {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    constraint_violation,
    referential_error,
    not_found,
    invalid_argument,
    foreign_keys_disabled
)

}  // namespace chatstore

namespace {

static const char* to_string(chatstore::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown chatstore error>");
}

// Custom category for chatstore::errc. Exposed by get_chatstore_category
class chatstore_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "chatstore"; }
    std::string message(int ev) const final override { return to_string(static_cast<chatstore::errc>(ev)); }
};

// Wraps SQLite result codes (including extended ones). Exposed by get_sqlite_category
class sqlite_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "sqlite"; }
    std::string message(int ev) const final override { return sqlite3_errstr(ev); }
};

static chatstore_category cat;
static sqlite_category sqlite_cat;

}  // namespace

const boost::system::error_category& chatstore::get_chatstore_category() noexcept { return cat; }

const boost::system::error_category& chatstore::get_sqlite_category() noexcept { return sqlite_cat; }

[[noreturn]] void chatstore::throw_exception_from_error(const error_with_message& e, const boost::source_location&)
{
    throw boost::system::system_error(e.ec, e.msg);
}

void chatstore::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}
