//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_BUSINESS_TYPES_METADATA_HPP
#define CHATSTORE_INCLUDE_BUSINESS_TYPES_METADATA_HPP

#include <boost/describe/class.hpp>

#include "business_types.hpp"

// Contains Boost.Describe metadata for business types.
// Metadata is not included in the main header to reduce build times.

namespace chatstore {

BOOST_DESCRIBE_STRUCT(user, (), (id, username, password_hash, created_at, avatar_hash))
BOOST_DESCRIBE_STRUCT(room, (), (id, name, owner_id, created_at, icon_hash, password_hash))
BOOST_DESCRIBE_STRUCT(message, (), (id, room_id, user_id, content, timestamp))

}  // namespace chatstore

#endif
