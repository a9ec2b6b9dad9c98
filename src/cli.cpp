//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "cli.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "json_serialization.hpp"
#include "services/chat_store.hpp"
#include "services/room_history_service.hpp"
#include "timestamp.hpp"

using namespace chatstore;
namespace asio = boost::asio;

namespace {

constexpr std::array<command_def, 11> commands{
    {
     {"init", "", 0u, 0u},
     {"create-user", "<username> <password-hash> [avatar-hash]", 2u, 3u},
     {"create-room", "<name> <owner-id> [password-hash] [icon-hash]", 2u, 4u},
     {"join", "<room-id> <user-id>", 2u, 2u},
     {"leave", "<room-id> <user-id>", 2u, 2u},
     {"post", "<room-id> <user-id> <content>", 3u, 3u},
     {"timeline", "<room-id> [limit] [asc|desc] [<cursor-timestamp> <cursor-id>]", 1u, 5u},
     {"rooms", "<user-id>", 1u, 1u},
     {"members", "<room-id>", 1u, 1u},
     {"delete-user", "<user-id>", 1u, 1u},
     {"delete-room", "<room-id>", 1u, 1u},
     }
};

std::optional<std::string_view> optional_arg(const std::vector<std::string_view>& args, std::size_t index)
{
    if (index < args.size())
        return args[index];
    return std::nullopt;
}

}  // namespace

std::span<const command_def> chatstore::get_commands() noexcept { return commands; }

bool chatstore::check_command_line(std::span<const std::string_view> args) noexcept
{
    if (args.empty())
        return false;
    const std::size_t num_args = args.size() - 1u;
    for (const auto& cmd : commands)
    {
        if (cmd.name == args[0])
            return num_args >= cmd.min_args && num_args <= cmd.max_args;
    }
    return false;
}

void chatstore::print_usage(std::ostream& os, std::string_view program)
{
    os << "Usage: " << program << " <command> [args...]\n"
       << "Commands:\n";
    for (const auto& cmd : commands)
        os << "    " << cmd.name << ' ' << cmd.args << '\n';
    os << "Configuration is read from the environment (CHATSTORE_BACKEND, CHATSTORE_SQLITE_PATH...)\n"
       << "Example:\n"
       << "    " << program << " create-user bob 5e884898da28\n";
}

result_with_message<timeline_query> chatstore::parse_timeline_query(std::span<const std::string_view> args)
{
    timeline_query res;
    if (args.size() > 2u)
    {
        auto limit = parse_positive<std::size_t>(args[2], "limit");
        if (limit.has_error())
            return limit.error();
        res.limit = *limit;
    }
    if (args.size() > 3u)
    {
        if (args[3] == "asc")
            res.order = sort_order::ascending;
        else if (args[3] == "desc")
            res.order = sort_order::descending;
        else
            return error_with_message{errc::invalid_argument, "Invalid order: " + std::string(args[3])};
    }
    if (args.size() == 5u)
    {
        return error_with_message{errc::invalid_argument, "A cursor requires a timestamp and a message ID"};
    }
    else if (args.size() > 5u)
    {
        auto message_id = parse_positive<std::int64_t>(args[5], "cursor ID");
        if (message_id.has_error())
            return message_id.error();
        res.cursor = timeline_cursor{std::string(args[4]), *message_id};
    }
    return res;
}

asio::awaitable<result_with_message<std::string>> chatstore::run_command(
    chat_store& store,
    std::vector<std::string_view> args
)
{
    const std::string_view cmd = args[0];

    if (cmd == "init")
    {
        auto res = co_await store.apply_schema();
        if (res.has_error())
            co_return res.error();
        co_return std::string();
    }
    else if (cmd == "create-user")
    {
        auto res = co_await store.create_user(args[1], args[2], optional_arg(args, 3));
        if (res.has_error())
            co_return res.error();
        co_return serialize_id(*res);
    }
    else if (cmd == "create-room")
    {
        auto owner_id = parse_positive<std::int64_t>(args[2], "owner ID");
        if (owner_id.has_error())
            co_return owner_id.error();
        auto res = co_await store.create_room(args[1], *owner_id, optional_arg(args, 4), optional_arg(args, 3));
        if (res.has_error())
            co_return res.error();
        co_return serialize_id(*res);
    }

    // All remaining commands take an ID as first argument
    auto id = parse_positive<std::int64_t>(args[1], "ID");
    if (id.has_error())
        co_return id.error();

    if (cmd == "join" || cmd == "leave" || cmd == "post")
    {
        auto user_id = parse_positive<std::int64_t>(args[2], "user ID");
        if (user_id.has_error())
            co_return user_id.error();

        if (cmd == "join")
        {
            auto res = co_await store.add_membership(*id, *user_id);
            if (res.has_error())
                co_return res.error();
            co_return std::string();
        }
        else if (cmd == "leave")
        {
            auto res = co_await store.remove_membership(*id, *user_id);
            if (res.has_error())
                co_return res.error();
            co_return boost::json::serialize(boost::json::value(*res));
        }
        else
        {
            auto res = co_await store.post_message(*id, *user_id, args[3], now_timestamp());
            if (res.has_error())
                co_return res.error();
            co_return serialize_id(*res);
        }
    }
    else if (cmd == "timeline")
    {
        auto query = parse_timeline_query(args);
        if (query.has_error())
            co_return query.error();
        room_history_service history(store);
        auto res = co_await history.get_room_history(*id, *query);
        if (res.has_error())
            co_return res.error();
        co_return serialize_room_history(*id, res->first, res->second);
    }
    else if (cmd == "rooms")
    {
        auto res = co_await store.fetch_user_rooms(*id);
        if (res.has_error())
            co_return res.error();
        co_return serialize_rooms(*res);
    }
    else if (cmd == "members")
    {
        auto res = co_await store.fetch_room_members(*id);
        if (res.has_error())
            co_return res.error();
        co_return serialize_users(*res);
    }
    else if (cmd == "delete-user")
    {
        auto res = co_await store.delete_user(*id);
        if (res.has_error())
            co_return res.error();
        co_return std::string();
    }
    else
    {
        auto res = co_await store.delete_room(*id);
        if (res.has_error())
            co_return res.error();
        co_return std::string();
    }
}
