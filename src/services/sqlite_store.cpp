//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"
#include "schema.hpp"
#include "services/chat_store.hpp"
#include "timestamp.hpp"
#include "util/sqlite.hpp"

using namespace chatstore;
namespace asio = boost::asio;

namespace {

// Each statement's column list matches the order expected by these functions
user read_user(const sqlite_statement& stmt)
{
    return user{
        stmt.get_int64(0),
        stmt.get_text(1),
        stmt.get_text(2),
        stmt.get_text(3),
        stmt.get_optional_text(4),
    };
}

room read_room(const sqlite_statement& stmt)
{
    return room{
        stmt.get_int64(0),
        stmt.get_text(1),
        stmt.get_int64(2),
        stmt.get_text(3),
        stmt.get_optional_text(4),
        stmt.get_optional_text(5),
    };
}

message read_message(const sqlite_statement& stmt)
{
    return message{
        stmt.get_int64(0),
        stmt.get_int64(1),
        stmt.get_int64(2),
        stmt.get_text(3),
        stmt.get_text(4),
    };
}

// Reads all the rows produced by stmt
template <class T, class Reader>
result_with_message<std::vector<T>> read_all(sqlite_statement& stmt, Reader reader)
{
    std::vector<T> res;
    while (true)
    {
        auto has_row = stmt.step();
        if (has_row.has_error())
            return has_row.error();
        if (!*has_row)
            return res;
        res.push_back(reader(stmt));
    }
}

// Reads a single row, failing with errc::not_found if there is none
template <class T, class Reader>
result_with_message<T> read_one(sqlite_statement& stmt, Reader reader)
{
    auto has_row = stmt.step();
    if (has_row.has_error())
        return has_row.error();
    if (!*has_row)
        return error_with_message{errc::not_found, ""};
    return reader(stmt);
}

// Maximum number of parameters bound in a single IN list. SQLite builds
// older than 3.32 don't allow more than 999 parameters per statement
constexpr std::size_t in_list_batch_size = 500;

// Timeline queries. The cursor is the last message the caller already has,
// with ?3 being its timestamp and ?4 its ID. ?2 is the limit
constexpr std::string_view timeline_asc =
    "SELECT id, room_id, user_id, content, timestamp FROM messages "
    "WHERE room_id = ?1 "
    "ORDER BY timestamp ASC, id ASC LIMIT ?2";
constexpr std::string_view timeline_asc_cursor =
    "SELECT id, room_id, user_id, content, timestamp FROM messages "
    "WHERE room_id = ?1 AND (timestamp > ?3 OR (timestamp = ?3 AND id > ?4)) "
    "ORDER BY timestamp ASC, id ASC LIMIT ?2";
constexpr std::string_view timeline_desc =
    "SELECT id, room_id, user_id, content, timestamp FROM messages "
    "WHERE room_id = ?1 "
    "ORDER BY timestamp DESC, id DESC LIMIT ?2";
constexpr std::string_view timeline_desc_cursor =
    "SELECT id, room_id, user_id, content, timestamp FROM messages "
    "WHERE room_id = ?1 AND (timestamp < ?3 OR (timestamp = ?3 AND id < ?4)) "
    "ORDER BY timestamp DESC, id DESC LIMIT ?2";

class sqlite_store final : public chat_store
{
    // A single connection, shared by all operations. Operations don't suspend
    // while holding the mutex, so a regular mutex suffices
    sqlite_connection conn_;
    std::mutex mtx_;

    using lock_t = std::lock_guard<std::mutex>;

    // Checks that a row with the given ID exists, using a statement selecting by ID
    result_with_message<void> check_exists(std::string_view sql, std::int64_t id)
    {
        auto stmt = conn_.prepare(sql, id);
        if (stmt.has_error())
            return stmt.error();
        auto has_row = stmt->step();
        if (has_row.has_error())
            return has_row.error();
        if (!*has_row)
            return error_with_message{errc::not_found, ""};
        return {};
    }

    // Runs a statement that should affect a single row, identified by its ID.
    // Fails with errc::not_found if no row was affected
    template <class... Params>
    result_with_message<void> execute_one(std::string_view sql, const Params&... params)
    {
        auto affected = conn_.execute(sql, params...);
        if (affected.has_error())
            return affected.error();
        if (*affected == 0)
            return error_with_message{errc::not_found, ""};
        return {};
    }

    // Runs an INSERT and returns the generated ID
    template <class... Params>
    result_with_message<std::int64_t> insert(std::string_view sql, const Params&... params)
    {
        auto affected = conn_.execute(sql, params...);
        if (affected.has_error())
            return affected.error();
        return conn_.last_insert_rowid();
    }

    result_with_message<void> apply_schema_impl()
    {
        lock_t lock(mtx_);
        sqlite_transaction tx(conn_);
        auto res = tx.begin();
        if (res.has_error())
            return res;
        for (std::string_view stmt : sqlite_schema())
        {
            res = conn_.execute_script(stmt);
            if (res.has_error())
                return res;
        }
        return tx.commit();
    }

    result_with_message<username_map> get_usernames_impl(std::span<const std::int64_t> user_ids)
    {
        lock_t lock(mtx_);
        username_map res;

        for (std::size_t offset = 0; offset < user_ids.size(); offset += in_list_batch_size)
        {
            auto batch = user_ids.subspan(offset, std::min(in_list_batch_size, user_ids.size() - offset));

            // Compose the query. We checked that batch is not empty,
            // so the generated IN list is valid
            std::string sql = "SELECT id, username FROM users WHERE id IN (?";
            for (std::size_t i = 1; i < batch.size(); ++i)
                sql += ", ?";
            sql += ')';

            // Bind the IDs
            auto stmt = conn_.prepare(sql);
            if (stmt.has_error())
                return stmt.error();
            for (std::size_t i = 0; i < batch.size(); ++i)
            {
                auto bind_result = stmt->bind(static_cast<int>(i + 1), batch[i]);
                if (bind_result.has_error())
                    return bind_result.error();
            }

            // Read
            while (true)
            {
                auto has_row = stmt->step();
                if (has_row.has_error())
                    return has_row.error();
                if (!*has_row)
                    break;
                res.insert({stmt->get_int64(0), stmt->get_text(1)});
            }
        }

        return res;
    }

    result_with_message<std::vector<user>> fetch_room_members_impl(std::int64_t room_id)
    {
        lock_t lock(mtx_);

        // Use a transaction, so the existence check and the query see the same data
        sqlite_transaction tx(conn_);
        auto tx_result = tx.begin();
        if (tx_result.has_error())
            return tx_result.error();

        auto exists = check_exists("SELECT 1 FROM rooms WHERE id = ?1", room_id);
        if (exists.has_error())
            return exists.error();

        auto stmt = conn_.prepare(
            "SELECT u.id, u.username, u.password_hash, u.created_at, u.avatar_hash "
            "FROM rooms_users ru JOIN users u ON u.id = ru.user_id "
            "WHERE ru.room_id = ?1 ORDER BY u.id",
            room_id
        );
        if (stmt.has_error())
            return stmt.error();
        auto res = read_all<user>(*stmt, read_user);
        if (res.has_error())
            return res;

        tx_result = tx.commit();
        if (tx_result.has_error())
            return tx_result.error();
        return res;
    }

    result_with_message<std::vector<room>> fetch_user_rooms_impl(std::int64_t user_id)
    {
        lock_t lock(mtx_);

        sqlite_transaction tx(conn_);
        auto tx_result = tx.begin();
        if (tx_result.has_error())
            return tx_result.error();

        auto exists = check_exists("SELECT 1 FROM users WHERE id = ?1", user_id);
        if (exists.has_error())
            return exists.error();

        // Served by idx_rooms_users_user
        auto stmt = conn_.prepare(
            "SELECT r.id, r.name, r.owner_id, r.created_at, r.icon_hash, r.password_hash "
            "FROM rooms_users ru JOIN rooms r ON r.id = ru.room_id "
            "WHERE ru.user_id = ?1 ORDER BY r.id",
            user_id
        );
        if (stmt.has_error())
            return stmt.error();
        auto res = read_all<room>(*stmt, read_room);
        if (res.has_error())
            return res;

        tx_result = tx.commit();
        if (tx_result.has_error())
            return tx_result.error();
        return res;
    }

    result_with_message<message_batch> fetch_room_timeline_impl(std::int64_t room_id, const timeline_query& query)
    {
        if (auto ec = validate_timeline_query(query))
            return error_with_message{ec, ""};

        lock_t lock(mtx_);

        sqlite_transaction tx(conn_);
        auto tx_result = tx.begin();
        if (tx_result.has_error())
            return tx_result.error();

        auto exists = check_exists("SELECT 1 FROM rooms WHERE id = ?1", room_id);
        if (exists.has_error())
            return exists.error();

        // Retrieve an extra message, to know whether there are more messages to load.
        // Served by idx_messages_room_ts
        const bool asc = query.order == sort_order::ascending;
        auto limit = static_cast<std::int64_t>(query.limit) + 1;
        auto stmt = query.cursor
                        ? conn_.prepare(
                              asc ? timeline_asc_cursor : timeline_desc_cursor,
                              room_id,
                              limit,
                              query.cursor->timestamp,
                              query.cursor->message_id
                          )
                        : conn_.prepare(asc ? timeline_asc : timeline_desc, room_id, limit);
        if (stmt.has_error())
            return stmt.error();
        auto messages = read_all<message>(*stmt, read_message);
        if (messages.has_error())
            return messages.error();

        tx_result = tx.commit();
        if (tx_result.has_error())
            return tx_result.error();

        // Compose the batch
        message_batch res{std::move(*messages), false};
        if (res.messages.size() > query.limit)
        {
            res.messages.pop_back();
            res.has_more = true;
        }
        return res;
    }

public:
    explicit sqlite_store(sqlite_connection conn) noexcept : conn_(std::move(conn)) {}

    // There are no background tasks
    void start_run() override final {}
    void cancel() override final {}

    asio::awaitable<result_with_message<void>> apply_schema() override final
    {
        co_return apply_schema_impl();
    }

    asio::awaitable<result_with_message<std::int64_t>> create_user(
        std::string_view username,
        std::string_view password_hash,
        std::optional<std::string_view> avatar_hash
    ) override final
    {
        lock_t lock(mtx_);
        co_return insert(
            "INSERT INTO users (username, password_hash, created_at, avatar_hash) VALUES (?1, ?2, ?3, ?4)",
            username,
            password_hash,
            now_timestamp(),
            avatar_hash
        );
    }

    asio::awaitable<result_with_message<user>> get_user(std::int64_t user_id) override final
    {
        lock_t lock(mtx_);
        auto stmt = conn_.prepare(
            "SELECT id, username, password_hash, created_at, avatar_hash FROM users WHERE id = ?1",
            user_id
        );
        if (stmt.has_error())
            co_return stmt.error();
        co_return read_one<user>(*stmt, read_user);
    }

    asio::awaitable<result_with_message<user>> get_user_by_username(std::string_view username
    ) override final
    {
        // The column's NOCASE collation applies to the comparison
        lock_t lock(mtx_);
        auto stmt = conn_.prepare(
            "SELECT id, username, password_hash, created_at, avatar_hash FROM users WHERE username = ?1",
            username
        );
        if (stmt.has_error())
            co_return stmt.error();
        co_return read_one<user>(*stmt, read_user);
    }

    asio::awaitable<result_with_message<username_map>> get_usernames(std::span<const std::int64_t> user_ids
    ) override final
    {
        co_return get_usernames_impl(user_ids);
    }

    asio::awaitable<result_with_message<void>> set_user_avatar(
        std::int64_t user_id,
        std::optional<std::string_view> avatar_hash
    ) override final
    {
        lock_t lock(mtx_);
        co_return execute_one("UPDATE users SET avatar_hash = ?2 WHERE id = ?1", user_id, avatar_hash);
    }

    asio::awaitable<result_with_message<void>> delete_user(std::int64_t user_id) override final
    {
        // Foreign key actions run as part of the statement, so the cascade is atomic
        lock_t lock(mtx_);
        co_return execute_one("DELETE FROM users WHERE id = ?1", user_id);
    }

    asio::awaitable<result_with_message<std::int64_t>> create_room(
        std::string_view name,
        std::int64_t owner_id,
        std::optional<std::string_view> icon_hash,
        std::optional<std::string_view> password_hash
    ) override final
    {
        lock_t lock(mtx_);
        co_return insert(
            "INSERT INTO rooms (name, owner_id, created_at, icon_hash, password_hash) VALUES (?1, ?2, ?3, ?4, ?5)",
            name,
            owner_id,
            now_timestamp(),
            icon_hash,
            password_hash
        );
    }

    asio::awaitable<result_with_message<room>> get_room(std::int64_t room_id) override final
    {
        lock_t lock(mtx_);
        auto stmt = conn_.prepare(
            "SELECT id, name, owner_id, created_at, icon_hash, password_hash FROM rooms WHERE id = ?1",
            room_id
        );
        if (stmt.has_error())
            co_return stmt.error();
        co_return read_one<room>(*stmt, read_room);
    }

    asio::awaitable<result_with_message<room>> get_room_by_name(std::string_view name) override final
    {
        lock_t lock(mtx_);
        auto stmt = conn_.prepare(
            "SELECT id, name, owner_id, created_at, icon_hash, password_hash FROM rooms WHERE name = ?1",
            name
        );
        if (stmt.has_error())
            co_return stmt.error();
        co_return read_one<room>(*stmt, read_room);
    }

    asio::awaitable<result_with_message<void>> set_room_password(
        std::int64_t room_id,
        std::optional<std::string_view> password_hash
    ) override final
    {
        lock_t lock(mtx_);
        co_return execute_one("UPDATE rooms SET password_hash = ?2 WHERE id = ?1", room_id, password_hash);
    }

    asio::awaitable<result_with_message<void>> delete_room(std::int64_t room_id) override final
    {
        lock_t lock(mtx_);
        co_return execute_one("DELETE FROM rooms WHERE id = ?1", room_id);
    }

    asio::awaitable<result_with_message<void>> add_membership(std::int64_t room_id, std::int64_t user_id)
        override final
    {
        lock_t lock(mtx_);
        auto res = conn_.execute("INSERT INTO rooms_users (room_id, user_id) VALUES (?1, ?2)", room_id, user_id);
        if (res.has_error())
            co_return res.error();
        co_return result_with_message<void>();
    }

    asio::awaitable<result_with_message<bool>> remove_membership(std::int64_t room_id, std::int64_t user_id)
        override final
    {
        lock_t lock(mtx_);
        auto res = conn_.execute("DELETE FROM rooms_users WHERE room_id = ?1 AND user_id = ?2", room_id, user_id);
        if (res.has_error())
            co_return res.error();
        co_return *res > 0;
    }

    asio::awaitable<result_with_message<bool>> is_member(std::int64_t room_id, std::int64_t user_id)
        override final
    {
        lock_t lock(mtx_);
        auto stmt = conn_.prepare("SELECT 1 FROM rooms_users WHERE room_id = ?1 AND user_id = ?2", room_id, user_id);
        if (stmt.has_error())
            co_return stmt.error();
        co_return stmt->step();
    }

    asio::awaitable<result_with_message<std::vector<user>>> fetch_room_members(std::int64_t room_id
    ) override final
    {
        co_return fetch_room_members_impl(room_id);
    }

    asio::awaitable<result_with_message<std::vector<room>>> fetch_user_rooms(std::int64_t user_id
    ) override final
    {
        co_return fetch_user_rooms_impl(user_id);
    }

    asio::awaitable<result_with_message<std::int64_t>> post_message(
        std::int64_t room_id,
        std::int64_t user_id,
        std::string_view content,
        std::string_view timestamp
    ) override final
    {
        lock_t lock(mtx_);
        co_return insert(
            "INSERT INTO messages (room_id, user_id, content, timestamp) VALUES (?1, ?2, ?3, ?4)",
            room_id,
            user_id,
            content,
            timestamp
        );
    }

    asio::awaitable<result_with_message<message_batch>> fetch_room_timeline(
        std::int64_t room_id,
        const timeline_query& query
    ) override final
    {
        co_return fetch_room_timeline_impl(room_id, query);
    }
};

}  // namespace

result_with_message<std::unique_ptr<chat_store>> chatstore::create_sqlite_store(
    const sqlite_config& cfg,
    boost::asio::any_io_executor
)
{
    auto conn = sqlite_connection::open(cfg);
    if (conn.has_error())
        return conn.error();
    return std::unique_ptr<chat_store>{new sqlite_store(std::move(*conn))};
}
