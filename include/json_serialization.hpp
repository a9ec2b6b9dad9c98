//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_JSON_SERIALIZATION_HPP
#define CHATSTORE_INCLUDE_JSON_SERIALIZATION_HPP

#include <cstdint>
#include <span>
#include <string>

#include "business_types.hpp"

// This file contains functions to serialize business objects to JSON.
// Password hashes are never serialized.

namespace chatstore {

// Serializes a user object to its JSON string representation.
std::string serialize_user(const user& u);

// Serializes a room object. The password hash is replaced by a hasPassword flag.
std::string serialize_room(const room& r);

// Serializes a collection of rooms as a JSON array.
std::string serialize_rooms(std::span<const room> rooms);

// Serializes a collection of users as a JSON array.
std::string serialize_users(std::span<const user> users);

// Serializes a timeline batch. Each message includes the author's
// username, or null if it's not in the passed map.
std::string serialize_room_history(std::int64_t room_id, const message_batch& batch, const username_map& usernames);

// Serializes the ID of a newly created object, as {"id": <id>}
std::string serialize_id(std::int64_t id);

}  // namespace chatstore

#endif
