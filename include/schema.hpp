//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_SCHEMA_HPP
#define CHATSTORE_INCLUDE_SCHEMA_HPP

#include <span>
#include <string_view>

// DDL for the tables and indexes backing the store.
//
//   users       (id, username, password_hash, created_at, avatar_hash)
//   rooms       (id, name, owner_id -> users, created_at, icon_hash, password_hash)
//   rooms_users (room_id -> rooms, user_id -> users), PK (room_id, user_id)
//   messages    (id, room_id -> rooms, user_id -> users, content, timestamp)
//
// Every foreign key cascades on delete. Usernames and room names are unique
// under case-insensitive comparison. Statements are idempotent, so applying
// the schema to an existing database is harmless.

namespace chatstore {

// Statements for SQLite, in the order they must be executed
std::span<const std::string_view> sqlite_schema() noexcept;

// Statements for MySQL 8, in the order they must be executed
std::span<const std::string_view> mysql_schema() noexcept;

}  // namespace chatstore

#endif
