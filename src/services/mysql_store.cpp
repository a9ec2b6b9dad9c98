//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_address.hpp>
#include <boost/mysql/common_server_errc.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/constant_string_view.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/mysql_server_errc.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/static_results.hpp>
#include <boost/mysql/with_params.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "business_types_metadata.hpp"  // Required by static_results
#include "config.hpp"
#include "error.hpp"
#include "schema.hpp"
#include "services/chat_store.hpp"
#include "timestamp.hpp"

using namespace chatstore;
namespace mysql = boost::mysql;
namespace asio = boost::asio;

namespace {

// Extracts the diagnostic string from a diagnostics object
std::string get_message(const mysql::diagnostics& diag)
{
    return diag.client_message().empty() ? diag.server_message() : diag.client_message();
}

// Translates constraint failures reported by the server into our taxonomy.
// Other errors are returned as they are
error_with_message to_store_error(error_code ec, const mysql::diagnostics& diag)
{
    static const error_code check_violated(
        mysql::mysql_server_errc::er_check_constraint_violated,
        mysql::get_mysql_server_category()
    );

    if (ec == mysql::common_server_errc::er_dup_entry || ec == mysql::common_server_errc::er_bad_null_error ||
        ec == check_violated)
        return error_with_message{errc::constraint_violation, diag.server_message()};
    else if (ec == mysql::common_server_errc::er_no_referenced_row_2 ||
             ec == mysql::common_server_errc::er_no_referenced_row)
        return error_with_message{errc::referential_error, diag.server_message()};
    else
        return error_with_message{ec, get_message(diag)};
}

// Returns the pool params to use
mysql::pool_params get_pool_params(const mysql_config& cfg)
{
    mysql::pool_params res;
    res.server_address.emplace_host_and_port(cfg.hostname, cfg.port);
    res.username = cfg.username;
    res.password = cfg.password;
    res.database = cfg.database;
    res.initial_size = cfg.initial_size;
    res.max_size = cfg.max_size;
    res.connect_timeout = cfg.connection_timeout;
    return res;
}

class mysql_store final : public chat_store
{
    mysql::connection_pool pool_;
    std::chrono::milliseconds connection_timeout_;

    // Gets a connection from the pool. While the server is unreachable, the pool
    // keeps retrying in the background, so we must bound the wait
    asio::awaitable<mysql::pooled_connection> get_connection(mysql::diagnostics& diag, error_code& ec)
    {
        co_return co_await pool_.async_get_connection(
            diag,
            asio::cancel_after(connection_timeout_, asio::redirect_error(ec))
        );
    }

    // Gets a connection from the pool and runs a single query on it
    template <class Query, class Results>
    asio::awaitable<error_with_message> execute(Query query, Results& result)
    {
        error_code ec;
        mysql::diagnostics diag;

        // Get a connection
        mysql::pooled_connection conn = co_await get_connection(diag, ec);
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // Run the query. The connection is returned to the pool automatically.
        co_await conn->async_execute(std::move(query), result, diag, asio::redirect_error(ec));
        if (ec)
            co_return to_store_error(ec, diag);

        co_return error_with_message{};
    }

    // Runs an INSERT and returns the generated ID
    template <class Query>
    asio::awaitable<result_with_message<std::int64_t>> insert(Query query)
    {
        mysql::results result;
        auto err = co_await execute(std::move(query), result);
        if (err.ec)
            co_return err;

        // MySQL reports last_insert_id as an uint64_t to be able to handle
        // any column type, but our id fields are defined as BIGINT (int64).
        co_return static_cast<std::int64_t>(result.last_insert_id());
    }

    // Retrieves a single object, failing with errc::not_found if there is none
    template <class T, class Query>
    asio::awaitable<result_with_message<T>> select_one(Query query)
    {
        // static_results requires that SQL field names
        // match with C++ struct field names
        mysql::static_results<T> result;
        auto err = co_await execute(std::move(query), result);
        if (err.ec)
            co_return err;
        if (result.rows().empty())
            co_return error_with_message{errc::not_found, ""};
        co_return std::move(result.rows()[0]);
    }

    // Runs an UPDATE identified by ID. MySQL only counts rows that actually
    // changed as affected, so a zero count requires checking whether the row
    // exists before reporting errc::not_found
    template <class Query>
    asio::awaitable<result_with_message<void>> update_one(Query query, std::string_view table, std::int64_t id)
    {
        mysql::results result;
        auto err = co_await execute(std::move(query), result);
        if (err.ec)
            co_return err;
        if (result.affected_rows() > 0u)
            co_return result_with_message<void>();

        mysql::results exists;
        err = co_await execute(mysql::with_params("SELECT 1 FROM {:i} WHERE id = {}", table, id), exists);
        if (err.ec)
            co_return err;
        if (exists.rows().empty())
            co_return error_with_message{errc::not_found, ""};
        co_return result_with_message<void>();
    }

    // Runs a DELETE identified by ID. Foreign key actions are part of the
    // statement, so the cascade is atomic
    template <class Query>
    asio::awaitable<result_with_message<void>> delete_one(Query query)
    {
        mysql::results result;
        auto err = co_await execute(std::move(query), result);
        if (err.ec)
            co_return err;
        if (result.affected_rows() == 0u)
            co_return error_with_message{errc::not_found, ""};
        co_return result_with_message<void>();
    }

    // Checks that a parent row exists and then lists its children, in a single
    // read-only transaction so that both queries see the same snapshot
    template <class T, class Query>
    asio::awaitable<result_with_message<std::vector<T>>> select_children(
        std::string_view parent_table,
        std::int64_t parent_id,
        Query query
    )
    {
        error_code ec;
        mysql::diagnostics diag;

        // Get a connection
        auto conn = co_await get_connection(diag, ec);
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // Begin. If we exit early, the connection is reset when returned to the pool,
        // which rolls back the transaction
        mysql::results tx_result;
        co_await conn->async_execute(
            "START TRANSACTION WITH CONSISTENT SNAPSHOT, READ ONLY",
            tx_result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // Existence check
        mysql::results exists;
        co_await conn->async_execute(
            mysql::with_params("SELECT 1 FROM {:i} WHERE id = {}", parent_table, parent_id),
            exists,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
            co_return error_with_message{ec, get_message(diag)};
        if (exists.rows().empty())
            co_return error_with_message{errc::not_found, ""};

        // Children
        mysql::static_results<T> result;
        co_await conn->async_execute(std::move(query), result, diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // Commit
        co_await conn->async_execute("COMMIT", tx_result, diag, asio::redirect_error(ec));
        if (ec)
            co_return error_with_message{ec, get_message(diag)};

        // We left the session as we found it, so no reset is required
        conn.return_without_reset();

        auto rows = result.rows();
        co_return std::vector<T>(rows.begin(), rows.end());
    }

public:
    mysql_store(const mysql_config& cfg, asio::any_io_executor ex)
        : pool_(std::move(ex), get_pool_params(cfg)), connection_timeout_(cfg.connection_timeout)
    {
    }

    void start_run() override final
    {
        asio::co_spawn(
            pool_.get_executor(),
            [pool = &pool_]() { return pool->async_run(asio::use_awaitable); },
            [](std::exception_ptr exc) {
                if (exc)
                    std::rethrow_exception(exc);
            }
        );
    }

    void cancel() override final { pool_.cancel(); }

    asio::awaitable<result_with_message<void>> apply_schema() override final
    {
        // DDL statements commit implicitly, so there is no point in a transaction.
        // Statements are idempotent, so a failure can be fixed by re-running
        for (std::string_view stmt : mysql_schema())
        {
            mysql::results result;
            auto err = co_await execute(stmt, result);
            if (err.ec)
                co_return err;
        }
        co_return result_with_message<void>();
    }

    asio::awaitable<result_with_message<std::int64_t>> create_user(
        std::string_view username,
        std::string_view password_hash,
        std::optional<std::string_view> avatar_hash
    ) override final
    {
        auto created_at = now_timestamp();
        co_return co_await insert(mysql::with_params(
            "INSERT INTO users (username, password_hash, created_at, avatar_hash) VALUES ({}, {}, {}, {})",
            username,
            password_hash,
            created_at,
            avatar_hash
        ));
    }

    asio::awaitable<result_with_message<user>> get_user(std::int64_t user_id) override final
    {
        co_return co_await select_one<user>(mysql::with_params(
            "SELECT id, username, password_hash, created_at, avatar_hash FROM users WHERE id = {}",
            user_id
        ));
    }

    asio::awaitable<result_with_message<user>> get_user_by_username(std::string_view username
    ) override final
    {
        // The column's collation applies to the comparison
        co_return co_await select_one<user>(mysql::with_params(
            "SELECT id, username, password_hash, created_at, avatar_hash FROM users WHERE username = {}",
            username
        ));
    }

    asio::awaitable<result_with_message<username_map>> get_usernames(std::span<const std::int64_t> user_ids
    ) override final
    {
        // Check that we have one user ID, at least.
        // Otherwise, the generated query may not be valid.
        if (user_ids.empty())
            co_return username_map{};

        // Execute the query.
        // We can safely do this because we checked that user_ids is not empty.
        using row_t = std::tuple<std::int64_t, std::string>;
        mysql::static_results<row_t> result;
        auto err = co_await execute(
            mysql::with_params("SELECT id, username FROM users WHERE id IN ({})", user_ids),
            result
        );
        if (err.ec)
            co_return err;

        // Result
        username_map res;
        for (auto& elm : result.rows())
            res.insert({std::get<0>(elm), std::move(std::get<1>(elm))});
        co_return res;
    }

    asio::awaitable<result_with_message<void>> set_user_avatar(
        std::int64_t user_id,
        std::optional<std::string_view> avatar_hash
    ) override final
    {
        co_return co_await update_one(
            mysql::with_params("UPDATE users SET avatar_hash = {} WHERE id = {}", avatar_hash, user_id),
            "users",
            user_id
        );
    }

    asio::awaitable<result_with_message<void>> delete_user(std::int64_t user_id) override final
    {
        co_return co_await delete_one(mysql::with_params("DELETE FROM users WHERE id = {}", user_id));
    }

    asio::awaitable<result_with_message<std::int64_t>> create_room(
        std::string_view name,
        std::int64_t owner_id,
        std::optional<std::string_view> icon_hash,
        std::optional<std::string_view> password_hash
    ) override final
    {
        auto created_at = now_timestamp();
        co_return co_await insert(mysql::with_params(
            "INSERT INTO rooms (name, owner_id, created_at, icon_hash, password_hash) VALUES ({}, {}, {}, {}, {})",
            name,
            owner_id,
            created_at,
            icon_hash,
            password_hash
        ));
    }

    asio::awaitable<result_with_message<room>> get_room(std::int64_t room_id) override final
    {
        co_return co_await select_one<room>(mysql::with_params(
            "SELECT id, name, owner_id, created_at, icon_hash, password_hash FROM rooms WHERE id = {}",
            room_id
        ));
    }

    asio::awaitable<result_with_message<room>> get_room_by_name(std::string_view name) override final
    {
        co_return co_await select_one<room>(mysql::with_params(
            "SELECT id, name, owner_id, created_at, icon_hash, password_hash FROM rooms WHERE name = {}",
            name
        ));
    }

    asio::awaitable<result_with_message<void>> set_room_password(
        std::int64_t room_id,
        std::optional<std::string_view> password_hash
    ) override final
    {
        co_return co_await update_one(
            mysql::with_params("UPDATE rooms SET password_hash = {} WHERE id = {}", password_hash, room_id),
            "rooms",
            room_id
        );
    }

    asio::awaitable<result_with_message<void>> delete_room(std::int64_t room_id) override final
    {
        co_return co_await delete_one(mysql::with_params("DELETE FROM rooms WHERE id = {}", room_id));
    }

    asio::awaitable<result_with_message<void>> add_membership(std::int64_t room_id, std::int64_t user_id)
        override final
    {
        mysql::results result;
        auto err = co_await execute(
            mysql::with_params("INSERT INTO rooms_users (room_id, user_id) VALUES ({}, {})", room_id, user_id),
            result
        );
        if (err.ec)
            co_return err;
        co_return result_with_message<void>();
    }

    asio::awaitable<result_with_message<bool>> remove_membership(std::int64_t room_id, std::int64_t user_id)
        override final
    {
        mysql::results result;
        auto err = co_await execute(
            mysql::with_params("DELETE FROM rooms_users WHERE room_id = {} AND user_id = {}", room_id, user_id),
            result
        );
        if (err.ec)
            co_return err;
        co_return result.affected_rows() > 0u;
    }

    asio::awaitable<result_with_message<bool>> is_member(std::int64_t room_id, std::int64_t user_id)
        override final
    {
        mysql::results result;
        auto err = co_await execute(
            mysql::with_params("SELECT 1 FROM rooms_users WHERE room_id = {} AND user_id = {}", room_id, user_id),
            result
        );
        if (err.ec)
            co_return err;
        co_return !result.rows().empty();
    }

    asio::awaitable<result_with_message<std::vector<user>>> fetch_room_members(std::int64_t room_id
    ) override final
    {
        co_return co_await select_children<user>(
            "rooms",
            room_id,
            mysql::with_params(
                "SELECT u.id, u.username, u.password_hash, u.created_at, u.avatar_hash "
                "FROM rooms_users ru JOIN users u ON u.id = ru.user_id "
                "WHERE ru.room_id = {} ORDER BY u.id",
                room_id
            )
        );
    }

    asio::awaitable<result_with_message<std::vector<room>>> fetch_user_rooms(std::int64_t user_id
    ) override final
    {
        // Served by idx_rooms_users_user
        co_return co_await select_children<room>(
            "users",
            user_id,
            mysql::with_params(
                "SELECT r.id, r.name, r.owner_id, r.created_at, r.icon_hash, r.password_hash "
                "FROM rooms_users ru JOIN rooms r ON r.id = ru.room_id "
                "WHERE ru.user_id = {} ORDER BY r.id",
                user_id
            )
        );
    }

    asio::awaitable<result_with_message<std::int64_t>> post_message(
        std::int64_t room_id,
        std::int64_t user_id,
        std::string_view content,
        std::string_view timestamp
    ) override final
    {
        co_return co_await insert(mysql::with_params(
            "INSERT INTO messages (room_id, user_id, content, timestamp) VALUES ({}, {}, {}, {})",
            room_id,
            user_id,
            content,
            timestamp
        ));
    }

    asio::awaitable<result_with_message<message_batch>> fetch_room_timeline(
        std::int64_t room_id,
        const timeline_query& query
    ) override final
    {
        if (auto ec = validate_timeline_query(query))
            co_return error_with_message{ec, ""};

        // Retrieve an extra message, to know whether there are more messages to load.
        // Served by idx_messages_room_ts. {0} is the room, {1} the limit,
        // {2} and {3} the cursor's timestamp and message ID
        const bool asc = query.order == sort_order::ascending;
        std::string_view sql;
        if (query.cursor)
        {
            sql = asc ? "SELECT id, room_id, user_id, content, timestamp FROM messages "
                        "WHERE room_id = {0} AND (timestamp > {2} OR (timestamp = {2} AND id > {3})) "
                        "ORDER BY timestamp ASC, id ASC LIMIT {1}"
                      : "SELECT id, room_id, user_id, content, timestamp FROM messages "
                        "WHERE room_id = {0} AND (timestamp < {2} OR (timestamp = {2} AND id < {3})) "
                        "ORDER BY timestamp DESC, id DESC LIMIT {1}";
        }
        else
        {
            sql = asc ? "SELECT id, room_id, user_id, content, timestamp FROM messages "
                        "WHERE room_id = {0} ORDER BY timestamp ASC, id ASC LIMIT {1}"
                      : "SELECT id, room_id, user_id, content, timestamp FROM messages "
                        "WHERE room_id = {0} ORDER BY timestamp DESC, id DESC LIMIT {1}";
        }

        auto limit = static_cast<std::int64_t>(query.limit) + 1;
        result_with_message<std::vector<message>> messages;
        if (query.cursor)
        {
            messages = co_await select_children<message>(
                "rooms",
                room_id,
                mysql::with_params(
                    mysql::runtime(sql),
                    room_id,
                    limit,
                    query.cursor->timestamp,
                    query.cursor->message_id
                )
            );
        }
        else
        {
            messages = co_await select_children<message>(
                "rooms",
                room_id,
                mysql::with_params(mysql::runtime(sql), room_id, limit)
            );
        }
        if (messages.has_error())
            co_return messages.error();

        // Compose the batch
        message_batch res{std::move(*messages), false};
        if (res.messages.size() > query.limit)
        {
            res.messages.pop_back();
            res.has_more = true;
        }
        co_return res;
    }
};

}  // namespace

std::unique_ptr<chat_store> chatstore::create_mysql_store(const mysql_config& cfg, asio::any_io_executor ex)
{
    return std::unique_ptr<chat_store>{new mysql_store(cfg, std::move(ex))};
}
