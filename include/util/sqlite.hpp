//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_UTIL_SQLITE_HPP
#define CHATSTORE_INCLUDE_UTIL_SQLITE_HPP

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "config.hpp"
#include "error.hpp"

// Thin RAII wrappers over the SQLite C API. Errors are reported
// as error_with_message, carrying sqlite3_errmsg as diagnostics.

namespace chatstore {

// Maps an (extended) SQLite result code to an error_code.
// Constraint failures map to errc::constraint_violation or
// errc::referential_error. Anything else uses the sqlite category.
error_code to_error_code(int sqlite_code) noexcept;

namespace detail {

struct connection_deleter
{
    void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
};

struct statement_deleter
{
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

template <class T>
struct is_optional : std::false_type
{
};

template <class T>
struct is_optional<std::optional<T>> : std::true_type
{
};

// Binds a parameter. Integers bind as INTEGER, empty optionals as NULL
// and anything convertible to string_view as TEXT
template <class T>
int bind_param(sqlite3_stmt* stmt, int index, const T& value)
{
    if constexpr (std::is_integral_v<T>)
    {
        return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value));
    }
    else if constexpr (is_optional<T>::value)
    {
        return value.has_value() ? bind_param(stmt, index, *value) : sqlite3_bind_null(stmt, index);
    }
    else
    {
        // A null data pointer would bind NULL instead of an empty string
        std::string_view sv(value);
        return sqlite3_bind_text(
            stmt,
            index,
            sv.data() ? sv.data() : "",
            static_cast<int>(sv.size()),
            SQLITE_TRANSIENT
        );
    }
}

}  // namespace detail

// A prepared statement
class sqlite_statement
{
    std::unique_ptr<sqlite3_stmt, detail::statement_deleter> stmt_;
    sqlite3* db_{};

public:
    sqlite_statement(sqlite3_stmt* stmt, sqlite3* db) noexcept : stmt_(stmt), db_(db) {}

    // Binds a value to the parameter at index (1-based)
    template <class T>
    result_with_message<void> bind(int index, const T& value)
    {
        int code = detail::bind_param(stmt_.get(), index, value);
        if (code != SQLITE_OK)
            return make_error(code);
        return {};
    }

    // Advances to the next row. Returns true if a row is available,
    // false once the statement has run to completion
    result_with_message<bool> step();

    // Column accessors, valid after step() returned true
    std::int64_t get_int64(int col) const noexcept { return sqlite3_column_int64(stmt_.get(), col); }
    std::string get_text(int col) const;
    std::optional<std::string> get_optional_text(int col) const;

    // Builds an error from a result code and the connection's current message
    error_with_message make_error(int code) const;
};

// A connection to a database file. Referential integrity is always enforced
class sqlite_connection
{
    std::unique_ptr<sqlite3, detail::connection_deleter> db_;

    explicit sqlite_connection(sqlite3* db) noexcept : db_(db) {}

public:
    // Opens (creating if required) the database at cfg.path. Enables foreign
    // keys and verifies they are active, failing with errc::foreign_keys_disabled
    // otherwise. File databases use WAL journaling.
    static result_with_message<sqlite_connection> open(const sqlite_config& cfg);

    // Runs one or more statements that don't return rows
    result_with_message<void> execute_script(std::string_view sql);

    // Prepares a statement without binding anything
    result_with_message<sqlite_statement> prepare(std::string_view sql);

    // Prepares a statement, binding params to ?1, ?2...
    template <class... Params>
    result_with_message<sqlite_statement> prepare(std::string_view sql, const Params&... params)
    {
        auto stmt = prepare(sql);
        if (stmt.has_error())
            return stmt.error();

        // Stop at the first failure
        int index = 0;
        error_with_message err;
        auto bind_one = [&](const auto& value) {
            auto res = stmt->bind(++index, value);
            if (res.has_error())
                err = std::move(res.error());
            return res.has_value();
        };
        if (!(bind_one(params) && ...))
            return err;

        return stmt;
    }

    // Prepares and runs a statement that doesn't return rows.
    // Returns the number of affected rows
    template <class... Params>
    result_with_message<std::int64_t> execute(std::string_view sql, const Params&... params)
    {
        auto stmt = prepare(sql, params...);
        if (stmt.has_error())
            return stmt.error();
        auto step_result = stmt->step();
        if (step_result.has_error())
            return step_result.error();
        return static_cast<std::int64_t>(sqlite3_changes(db_.get()));
    }

    // The rowid of the last successful INSERT on this connection
    std::int64_t last_insert_rowid() const noexcept { return sqlite3_last_insert_rowid(db_.get()); }

    sqlite3* native_handle() noexcept { return db_.get(); }
};

// Scoped transaction. If begin() succeeded, the transaction is rolled back
// on destruction unless commit() succeeded too
class sqlite_transaction
{
    sqlite_connection* conn_{};
    bool active_{false};

public:
    explicit sqlite_transaction(sqlite_connection& conn) noexcept : conn_(&conn) {}
    sqlite_transaction(const sqlite_transaction&) = delete;
    sqlite_transaction& operator=(const sqlite_transaction&) = delete;
    ~sqlite_transaction();

    // DEFERRED begin: read transactions don't block other readers
    result_with_message<void> begin();
    result_with_message<void> commit();
};

}  // namespace chatstore

#endif
