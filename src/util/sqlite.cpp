//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/sqlite.hpp"

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"

using namespace chatstore;

namespace {

error_with_message error_from_handle(sqlite3* db, int code)
{
    return error_with_message{to_error_code(code), db ? sqlite3_errmsg(db) : sqlite3_errstr(code)};
}

}  // namespace

error_code chatstore::to_error_code(int sqlite_code) noexcept
{
    if (sqlite_code == SQLITE_CONSTRAINT_FOREIGNKEY)
        return errc::referential_error;
    else if ((sqlite_code & 0xff) == SQLITE_CONSTRAINT)
        return errc::constraint_violation;
    else
        return error_code(sqlite_code, get_sqlite_category());
}

//
// sqlite_statement
//

result_with_message<bool> sqlite_statement::step()
{
    int code = sqlite3_step(stmt_.get());
    if (code == SQLITE_ROW)
        return true;
    else if (code == SQLITE_DONE)
        return false;
    else
        return error_from_handle(db_, code);
}

std::string sqlite_statement::get_text(int col) const
{
    // Must be called before sqlite3_column_bytes
    const auto* data = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), col));
    if (data == nullptr)
        return std::string();
    return std::string(data, static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), col)));
}

std::optional<std::string> sqlite_statement::get_optional_text(int col) const
{
    if (sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL)
        return std::nullopt;
    return get_text(col);
}

error_with_message sqlite_statement::make_error(int code) const { return error_from_handle(db_, code); }

//
// sqlite_connection
//

result_with_message<sqlite_connection> sqlite_connection::open(const sqlite_config& cfg)
{
    // sqlite3_open_v2 may allocate a handle even on failure
    sqlite3* raw_db = nullptr;
    int code = sqlite3_open_v2(
        cfg.path.c_str(),
        &raw_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
        nullptr
    );
    sqlite_connection res(raw_db);
    if (code != SQLITE_OK)
        return error_from_handle(raw_db, code);

    // Report constraint failures with their extended codes, so we can tell
    // foreign key failures from uniqueness ones
    sqlite3_extended_result_codes(raw_db, 1);
    sqlite3_busy_timeout(raw_db, static_cast<int>(cfg.busy_timeout.count()));

    // Cascading deletes rely on foreign keys, which SQLite disables by default.
    // The setting is per connection, and silently ignored if SQLite was built
    // without foreign key support, so read it back
    auto fk_result = res.execute_script("PRAGMA foreign_keys = ON");
    if (fk_result.has_error())
        return fk_result.error();
    {
        // Scoped so the statement is finalized before changing the journal mode
        auto stmt = res.prepare("PRAGMA foreign_keys");
        if (stmt.has_error())
            return stmt.error();
        auto has_row = stmt->step();
        if (has_row.has_error())
            return has_row.error();
        if (!*has_row || stmt->get_int64(0) != 1)
            return error_with_message{errc::foreign_keys_disabled, "PRAGMA foreign_keys could not be enabled"};
    }

    // WAL lets readers proceed while a writer is active. Not available for in-memory databases
    if (cfg.path != ":memory:" && !cfg.path.empty())
    {
        auto wal_result = res.execute_script("PRAGMA journal_mode = WAL");
        if (wal_result.has_error())
            return wal_result.error();
    }

    return res;
}

result_with_message<void> sqlite_connection::execute_script(std::string_view sql)
{
    // sqlite3_exec requires a NULL-terminated string
    std::string sql_str(sql);
    char* err = nullptr;
    int code = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err);
    if (code != SQLITE_OK)
    {
        error_with_message res{to_error_code(code), err ? err : sqlite3_errstr(code)};
        sqlite3_free(err);
        return res;
    }
    return {};
}

result_with_message<sqlite_statement> sqlite_connection::prepare(std::string_view sql)
{
    sqlite3_stmt* stmt = nullptr;
    int code = sqlite3_prepare_v2(db_.get(), sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (code != SQLITE_OK)
        return error_from_handle(db_.get(), code);
    return sqlite_statement(stmt, db_.get());
}

//
// sqlite_transaction
//

sqlite_transaction::~sqlite_transaction()
{
    if (active_)
    {
        // Destructors can't report errors to the caller
        auto res = conn_->execute_script("ROLLBACK");
        if (res.has_error())
            log_error(res.error(), "Rolling back SQLite transaction");
    }
}

result_with_message<void> sqlite_transaction::begin()
{
    auto res = conn_->execute_script("BEGIN");
    if (res.has_value())
        active_ = true;
    return res;
}

result_with_message<void> sqlite_transaction::commit()
{
    auto res = conn_->execute_script("COMMIT");
    if (res.has_value())
        active_ = false;
    return res;
}
