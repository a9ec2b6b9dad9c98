//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "json_serialization.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "business_types.hpp"

using namespace chatstore;

// Helpers
static boost::json::value to_json(const std::optional<std::string>& from)
{
    if (from)
        return boost::json::value(*from);
    return boost::json::value(nullptr);
}

static boost::json::object to_json(const user& u)
{
    return boost::json::object({
        {"id",         u.id                  },
        {"username",   u.username            },
        {"createdAt",  u.created_at          },
        {"avatarHash", to_json(u.avatar_hash)},
    });
}

static boost::json::object to_json(const room& r)
{
    return boost::json::object({
        {"id",          r.id                   },
        {"name",        r.name                 },
        {"ownerId",     r.owner_id             },
        {"createdAt",   r.created_at           },
        {"iconHash",    to_json(r.icon_hash)   },
        {"hasPassword", r.requires_password()  },
    });
}

template <class T>
static boost::json::array to_json_array(std::span<const T> values)
{
    boost::json::array res;
    res.reserve(values.size());
    for (const auto& v : values)
        res.push_back(to_json(v));
    return res;
}

std::string chatstore::serialize_user(const user& u) { return boost::json::serialize(to_json(u)); }

std::string chatstore::serialize_room(const room& r) { return boost::json::serialize(to_json(r)); }

std::string chatstore::serialize_rooms(std::span<const room> rooms)
{
    return boost::json::serialize(to_json_array(rooms));
}

std::string chatstore::serialize_users(std::span<const user> users)
{
    return boost::json::serialize(to_json_array(users));
}

std::string chatstore::serialize_room_history(
    std::int64_t room_id,
    const message_batch& batch,
    const username_map& usernames
)
{
    boost::json::array messages;
    messages.reserve(batch.messages.size());
    for (const auto& msg : batch.messages)
    {
        auto it = usernames.find(msg.user_id);
        boost::json::value username = it == usernames.end() ? boost::json::value(nullptr)
                                                             : boost::json::value(it->second);
        messages.push_back(boost::json::object({
            {"id",        msg.id   },
            {"content",   msg.content },
            {"user",
             {
                 {"id", msg.user_id},
                 {"username", std::move(username)},
             }                     },
            {"timestamp", msg.timestamp},
        }));
    }

    boost::json::object res;
    res.emplace("roomId", room_id);
    res.emplace("messages", std::move(messages));
    res.emplace("hasMoreMessages", batch.has_more);
    return boost::json::serialize(res);
}

std::string chatstore::serialize_id(std::int64_t id)
{
    return boost::json::serialize(boost::json::object({
        {"id", id}
    }));
}
