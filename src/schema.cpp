//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "schema.hpp"

#include <span>
#include <string_view>

using namespace chatstore;

namespace {

// SQLite: NOCASE folds ASCII letters when comparing usernames and room names.
// Foreign keys must be enabled per connection (PRAGMA foreign_keys)
constexpr std::string_view sqlite_statements[] = {
    R"%(CREATE TABLE IF NOT EXISTS users (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        username TEXT NOT NULL UNIQUE COLLATE NOCASE CHECK (length(username) > 0),
        password_hash TEXT NOT NULL CHECK (length(password_hash) > 0),
        created_at TEXT NOT NULL,
        avatar_hash TEXT
    ))%",
    R"%(CREATE TABLE IF NOT EXISTS rooms (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL UNIQUE COLLATE NOCASE CHECK (length(name) > 0),
        owner_id INTEGER NOT NULL,
        created_at TEXT NOT NULL,
        icon_hash TEXT,
        password_hash TEXT CHECK (password_hash IS NULL OR length(password_hash) > 0),
        FOREIGN KEY (owner_id) REFERENCES users(id) ON DELETE CASCADE
    ))%",
    R"%(CREATE TABLE IF NOT EXISTS rooms_users (
        room_id INTEGER NOT NULL,
        user_id INTEGER NOT NULL,
        PRIMARY KEY (room_id, user_id),
        FOREIGN KEY (room_id) REFERENCES rooms(id) ON DELETE CASCADE,
        FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
    ))%",
    R"%(CREATE TABLE IF NOT EXISTS messages (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        room_id INTEGER NOT NULL,
        user_id INTEGER NOT NULL,
        content TEXT NOT NULL CHECK (length(content) > 0),
        timestamp TEXT NOT NULL CHECK (length(timestamp) > 0),
        FOREIGN KEY (room_id) REFERENCES rooms(id) ON DELETE CASCADE,
        FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
    ))%",
    "CREATE INDEX IF NOT EXISTS idx_messages_room_ts ON messages(room_id, timestamp)",
    "CREATE INDEX IF NOT EXISTS idx_rooms_users_user ON rooms_users(user_id)",
    // Foreign key columns need to be indexed for cascades not to scan the whole table
    "CREATE INDEX IF NOT EXISTS idx_rooms_owner ON rooms(owner_id)",
    "CREATE INDEX IF NOT EXISTS idx_messages_user ON messages(user_id)",
};

// MySQL: InnoDB is required for foreign keys. utf8mb4_0900_as_ci is
// case-insensitive but accent-sensitive, so 'Alice' and 'alice' collide
// but 'José' and 'Jose' don't. InnoDB creates indexes for foreign keys itself.
constexpr std::string_view mysql_statements[] = {
    R"%(CREATE TABLE IF NOT EXISTS users (
        id BIGINT NOT NULL AUTO_INCREMENT,
        username VARCHAR(255) COLLATE utf8mb4_0900_as_ci NOT NULL,
        password_hash VARCHAR(512) NOT NULL,
        created_at VARCHAR(64) NOT NULL,
        avatar_hash VARCHAR(255),
        PRIMARY KEY (id),
        UNIQUE KEY uq_users_username (username),
        CHECK (CHAR_LENGTH(username) > 0),
        CHECK (CHAR_LENGTH(password_hash) > 0)
    ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)%",
    R"%(CREATE TABLE IF NOT EXISTS rooms (
        id BIGINT NOT NULL AUTO_INCREMENT,
        name VARCHAR(255) COLLATE utf8mb4_0900_as_ci NOT NULL,
        owner_id BIGINT NOT NULL,
        created_at VARCHAR(64) NOT NULL,
        icon_hash VARCHAR(255),
        password_hash VARCHAR(512),
        PRIMARY KEY (id),
        UNIQUE KEY uq_rooms_name (name),
        CHECK (CHAR_LENGTH(name) > 0),
        CHECK (password_hash IS NULL OR CHAR_LENGTH(password_hash) > 0),
        FOREIGN KEY (owner_id) REFERENCES users(id) ON DELETE CASCADE
    ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)%",
    R"%(CREATE TABLE IF NOT EXISTS rooms_users (
        room_id BIGINT NOT NULL,
        user_id BIGINT NOT NULL,
        PRIMARY KEY (room_id, user_id),
        KEY idx_rooms_users_user (user_id),
        FOREIGN KEY (room_id) REFERENCES rooms(id) ON DELETE CASCADE,
        FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
    ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)%",
    R"%(CREATE TABLE IF NOT EXISTS messages (
        id BIGINT NOT NULL AUTO_INCREMENT,
        room_id BIGINT NOT NULL,
        user_id BIGINT NOT NULL,
        content TEXT NOT NULL,
        timestamp VARCHAR(64) NOT NULL,
        PRIMARY KEY (id),
        KEY idx_messages_room_ts (room_id, timestamp),
        CHECK (CHAR_LENGTH(content) > 0),
        CHECK (CHAR_LENGTH(timestamp) > 0),
        FOREIGN KEY (room_id) REFERENCES rooms(id) ON DELETE CASCADE,
        FOREIGN KEY (user_id) REFERENCES users(id) ON DELETE CASCADE
    ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)%",
};

}  // namespace

std::span<const std::string_view> chatstore::sqlite_schema() noexcept { return sqlite_statements; }

std::span<const std::string_view> chatstore::mysql_schema() noexcept { return mysql_statements; }
