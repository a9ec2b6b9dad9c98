//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_SERVICES_CHAT_STORE_HPP
#define CHATSTORE_INCLUDE_SERVICES_CHAT_STORE_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"

// The persistence layer for users, rooms, room membership and message history.
// It implements the operations required by the application layer, abstracting
// away the actual SQL operations and the storage engine.
//
// Constraint enforcement is delegated to the engine: uniqueness failures
// (including races between concurrent writers) are reported as
// errc::constraint_violation, dangling references as errc::referential_error.
// Deleting a user or room removes everything depending on it, atomically.
//
// Usernames and room names are compared case-insensitively using the engine's
// collation. SQLite (COLLATE NOCASE) only folds ASCII letters, so "Émile" and
// "émile" are different names there. MySQL (utf8mb4_0900_as_ci) folds Unicode
// case and considers them equal.

namespace chatstore {

// Using an interface to reduce build times and improve testability
class chat_store
{
public:
    virtual ~chat_store() {}

    // Starts background tasks (e.g. a connection pool), in detached mode.
    // This must be called once before any other operation
    virtual void start_run() = 0;

    // Cancels background tasks. To be called at shutdown
    virtual void cancel() = 0;

    // Creates tables and indexes, if they don't exist yet
    virtual boost::asio::awaitable<result_with_message<void>> apply_schema() = 0;

    //
    // Users
    //

    // Creates a new user object with the given attributes.
    // Returns the ID of the newly created object on success.
    // Returns errc::constraint_violation if a user with the same username,
    // compared case-insensitively, already exists, or if any of the arguments is empty.
    virtual boost::asio::awaitable<result_with_message<std::int64_t>> create_user(
        std::string_view username,
        std::string_view password_hash,
        std::optional<std::string_view> avatar_hash = {}
    ) = 0;

    // Retrieves a user by ID.
    // Returns errc::not_found if it doesn't exist.
    virtual boost::asio::awaitable<result_with_message<user>> get_user(std::int64_t user_id) = 0;

    // Retrieves a user by username, compared case-insensitively.
    // Returns errc::not_found if it doesn't exist.
    virtual boost::asio::awaitable<result_with_message<user>> get_user_by_username(std::string_view username
    ) = 0;

    // Retrieves the usernames associated to the passed user_ids.
    // The lookup is performed in batch, for efficiency reasons.
    // If a user ID doesn't exist, it's excluded from the returned map.
    virtual boost::asio::awaitable<result_with_message<username_map>> get_usernames(
        std::span<const std::int64_t> user_ids
    ) = 0;

    // Replaces the avatar content hash. An empty optional removes it.
    // Returns errc::not_found if the user doesn't exist.
    virtual boost::asio::awaitable<result_with_message<void>> set_user_avatar(
        std::int64_t user_id,
        std::optional<std::string_view> avatar_hash
    ) = 0;

    // Deletes a user, together with the rooms it owns, its memberships
    // and messages, and the memberships and messages of the deleted rooms.
    // Returns errc::not_found if the user doesn't exist.
    virtual boost::asio::awaitable<result_with_message<void>> delete_user(std::int64_t user_id) = 0;

    //
    // Rooms
    //

    // Creates a room owned by owner_id. Returns the new room's ID.
    // Returns errc::constraint_violation if the name collides case-insensitively
    // with an existing room's name, and errc::referential_error if owner_id
    // doesn't reference an existing user.
    virtual boost::asio::awaitable<result_with_message<std::int64_t>> create_room(
        std::string_view name,
        std::int64_t owner_id,
        std::optional<std::string_view> icon_hash = {},
        std::optional<std::string_view> password_hash = {}
    ) = 0;

    // Retrieves a room by ID.
    // Returns errc::not_found if it doesn't exist.
    virtual boost::asio::awaitable<result_with_message<room>> get_room(std::int64_t room_id) = 0;

    // Retrieves a room by name, compared case-insensitively.
    // Returns errc::not_found if it doesn't exist.
    virtual boost::asio::awaitable<result_with_message<room>> get_room_by_name(std::string_view name) = 0;

    // Replaces the password hash gating entry to the room. An empty optional
    // makes the room open. Returns errc::not_found if the room doesn't exist.
    virtual boost::asio::awaitable<result_with_message<void>> set_room_password(
        std::int64_t room_id,
        std::optional<std::string_view> password_hash
    ) = 0;

    // Deletes a room, together with its memberships and messages.
    // Returns errc::not_found if the room doesn't exist.
    virtual boost::asio::awaitable<result_with_message<void>> delete_room(std::int64_t room_id) = 0;

    //
    // Membership
    //

    // Makes user_id a member of room_id. Memberships are not upserted:
    // returns errc::constraint_violation if the user is already a member,
    // and errc::referential_error if either of the IDs doesn't exist.
    virtual boost::asio::awaitable<result_with_message<void>> add_membership(
        std::int64_t room_id,
        std::int64_t user_id
    ) = 0;

    // Removes a membership. Removing a membership that doesn't exist is not an error.
    // Returns whether a membership was actually removed.
    virtual boost::asio::awaitable<result_with_message<bool>> remove_membership(
        std::int64_t room_id,
        std::int64_t user_id
    ) = 0;

    // Checks whether user_id is a member of room_id
    virtual boost::asio::awaitable<result_with_message<bool>> is_member(
        std::int64_t room_id,
        std::int64_t user_id
    ) = 0;

    // Retrieves the members of a room, ordered by user ID.
    // Returns errc::not_found if the room doesn't exist.
    virtual boost::asio::awaitable<result_with_message<std::vector<user>>> fetch_room_members(
        std::int64_t room_id
    ) = 0;

    // Retrieves the rooms a user is a member of, ordered by room ID.
    // Returns errc::not_found if the user doesn't exist.
    virtual boost::asio::awaitable<result_with_message<std::vector<room>>> fetch_user_rooms(
        std::int64_t user_id
    ) = 0;

    //
    // Messages
    //

    // Appends a message to a room's timeline. Returns the new message's ID.
    // Returns errc::referential_error if the room or the user don't exist,
    // and errc::constraint_violation if content or timestamp are empty.
    virtual boost::asio::awaitable<result_with_message<std::int64_t>> post_message(
        std::int64_t room_id,
        std::int64_t user_id,
        std::string_view content,
        std::string_view timestamp
    ) = 0;

    // Retrieves a batch of a room's messages, ordered by timestamp as requested.
    // Returns errc::not_found if the room doesn't exist, and
    // errc::invalid_argument if the query's limit is out of range.
    virtual boost::asio::awaitable<result_with_message<message_batch>> fetch_room_timeline(
        std::int64_t room_id,
        const timeline_query& query = {}
    ) = 0;
};

// Checks that a timeline query can be served.
// Returns errc::invalid_argument if its limit is out of range
error_code validate_timeline_query(const timeline_query& query) noexcept;

// Creates a store backed by SQLite. Fails if the database can't be opened
result_with_message<std::unique_ptr<chat_store>> create_sqlite_store(
    const sqlite_config& cfg,
    boost::asio::any_io_executor ex
);

// Creates a store backed by a MySQL connection pool. Connections are
// established once start_run() is called
std::unique_ptr<chat_store> create_mysql_store(const mysql_config& cfg, boost::asio::any_io_executor ex);

// Creates a store for the configured backend
result_with_message<std::unique_ptr<chat_store>> create_chat_store(
    const store_config& cfg,
    boost::asio::any_io_executor ex
);

}  // namespace chatstore

#endif
