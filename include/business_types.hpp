//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_BUSINESS_TYPES_HPP
#define CHATSTORE_INCLUDE_BUSINESS_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// This file contains business object definitions. Field names match
// column names, as required by static_results

namespace chatstore {

// An account
struct user
{
    // User ID
    std::int64_t id{};

    // Unique, compared case-insensitively
    std::string username;

    // Hashed by the application layer. Never plaintext
    std::string password_hash;

    // ISO-8601 UTC timestamp, assigned on creation
    std::string created_at;

    // Content hash of the avatar image, if any
    std::optional<std::string> avatar_hash;
};

// A chat channel
struct room
{
    // Room ID
    std::int64_t id{};

    // Unique, compared case-insensitively
    std::string name;

    // ID of the user that owns the room
    std::int64_t owner_id{};

    // ISO-8601 UTC timestamp, assigned on creation
    std::string created_at;

    // Content hash of the room icon, if any
    std::optional<std::string> icon_hash;

    // Hash of the password gating entry. No value means the room is open
    std::optional<std::string> password_hash;

    bool requires_password() const noexcept { return password_hash.has_value(); }
};

// A chat message. Messages are never modified after creation
struct message
{
    // Message ID
    std::int64_t id{};

    // ID of the room the message was sent to
    std::int64_t room_id{};

    // ID of the user that sent the message
    std::int64_t user_id{};

    // The actual content of the message
    std::string content;

    // Send timestamp, as supplied by the application layer
    std::string timestamp;
};

// A room timeline message batch
struct message_batch
{
    // The messages in the batch
    std::vector<message> messages;

    // true if there are more messages that could be loaded
    bool has_more{};
};

enum class sort_order
{
    ascending,
    descending,
};

// Position within a timeline. Use the timestamp and ID of the last message
// of the previous batch to get the next one
struct timeline_cursor
{
    std::string timestamp;
    std::int64_t message_id{};
};

// Used as input parameter to fetch_room_timeline
struct timeline_query
{
    // The maximum number of messages that get retrieved in a single go
    static constexpr std::size_t max_limit = 500;

    // Timestamp order. Messages with the same timestamp are ordered by ID
    sort_order order{sort_order::ascending};

    // Number of messages to retrieve. Must be in the [1, max_limit] range
    std::size_t limit{50};

    // Where to start. Leave empty to start from the first (ascending)
    // or latest (descending) message
    std::optional<timeline_cursor> cursor;
};

// A map from user IDs to usernames
using username_map = std::unordered_map<std::int64_t, std::string>;

}  // namespace chatstore

#endif
