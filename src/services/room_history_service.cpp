//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_history_service.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <unordered_set>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/chat_store.hpp"

using namespace chatstore;
namespace asio = boost::asio;

static std::vector<std::int64_t> unique_user_ids(const std::vector<message_batch>& input)
{
    std::unordered_set<std::int64_t> set;
    for (const auto& batch : input)
        for (const auto& msg : batch.messages)
            set.insert(msg.user_id);
    return std::vector<std::int64_t>(set.begin(), set.end());
}

asio::awaitable<result_with_message<std::pair<std::vector<message_batch>, username_map>>> room_history_service::
    get_room_history(std::span<const std::int64_t> room_ids, const timeline_query& query)
{
    // Lookup messages, one room at a time
    std::vector<message_batch> batches;
    batches.reserve(room_ids.size());
    for (std::int64_t room_id : room_ids)
    {
        auto batch_result = co_await store_->fetch_room_timeline(room_id, query);
        if (batch_result.has_error())
            co_return batch_result.error();
        batches.push_back(std::move(*batch_result));
    }

    // Collect the IDs we need to lookup
    auto user_ids = unique_user_ids(batches);

    // Look them up
    auto usernames_result = co_await store_->get_usernames(user_ids);
    if (usernames_result.has_error())
        co_return usernames_result.error();

    co_return std::pair{std::move(batches), std::move(*usernames_result)};
}

asio::awaitable<result_with_message<std::pair<message_batch, username_map>>> room_history_service::
    get_room_history(std::int64_t room_id, const timeline_query& query)
{
    // Compose an array with a single request
    std::array<std::int64_t, 1> room_ids{room_id};

    // Call the batch function
    auto res = co_await get_room_history(room_ids, query);
    if (res.has_error())
        co_return res.error();

    // Result
    co_return std::pair{std::move(res->first.front()), std::move(res->second)};
}
