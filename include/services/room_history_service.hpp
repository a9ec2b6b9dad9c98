//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATSTORE_INCLUDE_SERVICES_ROOM_HISTORY_SERVICE_HPP
#define CHATSTORE_INCLUDE_SERVICES_ROOM_HISTORY_SERVICE_HPP

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// Contains functions to retrieve room timelines, together with
// the usernames of the messages' authors

namespace chatstore {

class chat_store;

class room_history_service
{
    chat_store* store_;

public:
    room_history_service(chat_store& store) noexcept : store_(&store) {}

    // Retrieves a timeline batch for each of the passed rooms, all using the same query.
    // The returned vector has an entry per element in room_ids.
    // It also returns a (user_id, username) map containing entries for each user
    // that appears in the retrieved history.
    // Fails with errc::not_found if any of the rooms doesn't exist.
    boost::asio::awaitable<result_with_message<std::pair<std::vector<message_batch>, username_map>>>
    get_room_history(std::span<const std::int64_t> room_ids, const timeline_query& query = {});

    // Same as the above, but for an individual room.
    boost::asio::awaitable<result_with_message<std::pair<message_batch, username_map>>> get_room_history(
        std::int64_t room_id,
        const timeline_query& query = {}
    );
};

}  // namespace chatstore

#endif
