//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "cli.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"
#include "services/chat_store.hpp"
#include "store_fixture.hpp"

using namespace chatstore;
using namespace chatstore::test;
using args_t = std::vector<std::string_view>;

namespace {

struct fixture : store_fixture_base
{
    fixture() { setup(create_sqlite_store(sqlite_config{":memory:"}, ctx.get_executor()).value()); }

    // Runs a command that should succeed, returning its output
    std::string run_ok(args_t args)
    {
        auto res = run(run_command(*store, std::move(args)));
        BOOST_TEST_REQUIRE(res.has_value());
        return std::move(*res);
    }

    // Runs a command that should succeed and output JSON
    boost::json::value run_json(args_t args) { return boost::json::parse(run_ok(std::move(args))); }

    error_code run_error(args_t args)
    {
        auto res = run(run_command(*store, std::move(args)));
        BOOST_TEST_REQUIRE(res.has_error());
        return res.error().ec;
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(cli_)

//
// Command line validation
//
BOOST_AUTO_TEST_CASE(check_command_line_)
{
    BOOST_TEST(check_command_line(args_t{"init"}));
    BOOST_TEST(check_command_line(args_t{"create-user", "bob", "hash"}));
    BOOST_TEST(check_command_line(args_t{"create-user", "bob", "hash", "avatar"}));
    BOOST_TEST(check_command_line(args_t{"timeline", "1"}));
    BOOST_TEST(check_command_line(args_t{"timeline", "1", "10", "asc", "2024-01-15T10:00:00.000Z", "4"}));

    // Wrong number of arguments
    BOOST_TEST(!check_command_line(args_t{}));
    BOOST_TEST(!check_command_line(args_t{"init", "extra"}));
    BOOST_TEST(!check_command_line(args_t{"create-user", "bob"}));
    BOOST_TEST(!check_command_line(args_t{"create-room", "general", "1", "pwd", "icon", "extra"}));
    BOOST_TEST(!check_command_line(args_t{"post", "1", "2"}));
    BOOST_TEST(!check_command_line(args_t{"timeline"}));

    // Unknown commands
    BOOST_TEST(!check_command_line(args_t{"drop-everything"}));
    BOOST_TEST(!check_command_line(args_t{"INIT"}));
}

BOOST_AUTO_TEST_CASE(get_commands_)
{
    auto commands = get_commands();
    BOOST_TEST(commands.size() == 11u);
    for (const auto& cmd : commands)
    {
        BOOST_TEST_CONTEXT(cmd.name) { BOOST_TEST(cmd.min_args <= cmd.max_args); }
    }
}

BOOST_AUTO_TEST_CASE(print_usage_)
{
    std::ostringstream oss;
    print_usage(oss, "chatstore");
    auto text = oss.str();

    BOOST_TEST(text.find("Usage: chatstore <command>") != std::string::npos);
    BOOST_TEST(text.find("create-room <name> <owner-id> [password-hash] [icon-hash]") != std::string::npos);
    BOOST_TEST(text.find("timeline <room-id> [limit] [asc|desc] [<cursor-timestamp> <cursor-id>]") != std::string::npos);
}

//
// Parsing
//
BOOST_AUTO_TEST_CASE(parse_positive_success)
{
    BOOST_TEST(parse_positive<std::int64_t>("1", "ID").value() == 1);
    BOOST_TEST(parse_positive<std::int64_t>("9223372036854775807", "ID").value() == INT64_MAX);
    BOOST_TEST(parse_positive<std::size_t>("500", "limit").value() == 500u);
}

BOOST_AUTO_TEST_CASE(parse_positive_error)
{
    const char* invalid_values[] = {"", "0", "-1", "12abc", " 1", "abc", "9223372036854775808"};

    for (const char* value : invalid_values)
    {
        BOOST_TEST_CONTEXT(value)
        {
            auto res = parse_positive<std::int64_t>(value, "ID");
            BOOST_TEST_REQUIRE(res.has_error());
            BOOST_TEST(res.error().ec == error_code(errc::invalid_argument));
            BOOST_TEST(res.error().msg == "Invalid ID: " + std::string(value));
        }
    }
}

BOOST_AUTO_TEST_CASE(parse_timeline_query_defaults)
{
    auto q = parse_timeline_query(args_t{"timeline", "1"}).value();
    BOOST_TEST((q.order == sort_order::ascending));
    BOOST_TEST(q.limit == 50u);
    BOOST_TEST(!q.cursor.has_value());
}

BOOST_AUTO_TEST_CASE(parse_timeline_query_all_set)
{
    auto q = parse_timeline_query(args_t{"timeline", "1", "20", "desc", "2024-01-15T10:00:00.000Z", "7"}).value();
    BOOST_TEST((q.order == sort_order::descending));
    BOOST_TEST(q.limit == 20u);
    BOOST_TEST_REQUIRE(q.cursor.has_value());
    BOOST_TEST(q.cursor->timestamp == "2024-01-15T10:00:00.000Z");
    BOOST_TEST(q.cursor->message_id == 7);

    q = parse_timeline_query(args_t{"timeline", "1", "20", "asc"}).value();
    BOOST_TEST((q.order == sort_order::ascending));
}

BOOST_AUTO_TEST_CASE(parse_timeline_query_error)
{
    const args_t invalid_args[] = {
        {"timeline", "1", "0"},
        {"timeline", "1", "-5"},
        {"timeline", "1", "10x"},
        {"timeline", "1", "10", "ascending"},
        {"timeline", "1", "10", "asc", "2024-01-15T10:00:00.000Z"},
        {"timeline", "1", "10", "asc", "2024-01-15T10:00:00.000Z", "abc"},
    };

    for (const auto& args : invalid_args)
    {
        BOOST_TEST_CONTEXT(args.size())
        {
            auto res = parse_timeline_query(args);
            BOOST_TEST_REQUIRE(res.has_error());
            BOOST_TEST(res.error().ec == error_code(errc::invalid_argument));
        }
    }
}

//
// Running commands
//
BOOST_FIXTURE_TEST_CASE(init_is_idempotent, fixture)
{
    BOOST_TEST(run_ok({"init"}) == "");
    BOOST_TEST(run_ok({"init"}) == "");
}

BOOST_FIXTURE_TEST_CASE(create_user_, fixture)
{
    BOOST_TEST(run_json({"create-user", "bob", "hash", "avatar1"}) == boost::json::parse(R"({"id": 1})"));

    auto u = run(store->get_user(1)).value();
    BOOST_TEST(u.username == "bob");
    BOOST_TEST(u.password_hash == "hash");
    BOOST_TEST((u.avatar_hash == std::optional<std::string>("avatar1")));

    // Collisions are reported as errors
    BOOST_TEST(run_error({"create-user", "BOB", "hash"}) == error_code(errc::constraint_violation));
}

BOOST_FIXTURE_TEST_CASE(create_room_argument_order, fixture)
{
    create_user("bob");

    // The password hash goes before the icon hash
    BOOST_TEST(run_json({"create-room", "general", "1", "pwd_hash", "icon_hash"}) == boost::json::parse(R"({"id": 1})"));
    auto r = run(store->get_room(1)).value();
    BOOST_TEST(r.name == "general");
    BOOST_TEST(r.owner_id == 1);
    BOOST_TEST((r.password_hash == std::optional<std::string>("pwd_hash")));
    BOOST_TEST((r.icon_hash == std::optional<std::string>("icon_hash")));

    // Both are optional
    run_ok({"create-room", "random", "1"});
    r = run(store->get_room_by_name("random")).value();
    BOOST_TEST(!r.password_hash.has_value());
    BOOST_TEST(!r.icon_hash.has_value());
}

BOOST_FIXTURE_TEST_CASE(create_room_invalid_owner, fixture)
{
    BOOST_TEST(run_error({"create-room", "general", "abc"}) == error_code(errc::invalid_argument));
    BOOST_TEST(run_error({"create-room", "general", "42"}) == error_code(errc::referential_error));
}

BOOST_FIXTURE_TEST_CASE(membership, fixture)
{
    auto user_id = create_user("bob");
    create_room("general", user_id);

    BOOST_TEST(run_ok({"join", "1", "1"}) == "");
    BOOST_TEST(run_json({"rooms", "1"}).as_array().size() == 1u);
    BOOST_TEST(run_json({"members", "1"}).as_array().at(0).at("username").as_string() == "bob");

    BOOST_TEST(run_ok({"leave", "1", "1"}) == "true");
    BOOST_TEST(run_ok({"leave", "1", "1"}) == "false");
    BOOST_TEST(run_json({"members", "1"}).as_array().empty());
}

BOOST_FIXTURE_TEST_CASE(invalid_ids, fixture)
{
    BOOST_TEST(run_error({"join", "0", "1"}) == error_code(errc::invalid_argument));
    BOOST_TEST(run_error({"join", "1", "x"}) == error_code(errc::invalid_argument));
    BOOST_TEST(run_error({"delete-user", "-3"}) == error_code(errc::invalid_argument));
    BOOST_TEST(run_error({"timeline", "1", "0"}) == error_code(errc::invalid_argument));

    // Valid, but not found
    BOOST_TEST(run_error({"delete-room", "9"}) == error_code(errc::not_found));
    BOOST_TEST(run_error({"rooms", "9"}) == error_code(errc::not_found));
}

BOOST_FIXTURE_TEST_CASE(post_and_timeline, fixture)
{
    auto user_id = create_user("bob");
    create_room("general", user_id);

    BOOST_TEST(run_json({"post", "1", "1", "hi"}) == boost::json::parse(R"({"id": 1})"));

    auto res = run_json({"timeline", "1"});
    BOOST_TEST(res.at("roomId").as_int64() == 1);
    BOOST_TEST(!res.at("hasMoreMessages").as_bool());
    const auto& messages = res.at("messages").as_array();
    BOOST_TEST_REQUIRE(messages.size() == 1u);
    BOOST_TEST(messages.at(0).at("content").as_string() == "hi");
    BOOST_TEST(messages.at(0).at("user").at("username").as_string() == "bob");
}

BOOST_FIXTURE_TEST_CASE(timeline_follow_cursor, fixture)
{
    auto user_id = create_user("bob");
    auto room_id = create_room("general", user_id);
    post(room_id, user_id, "1", "2024-01-15T10:00:01.000Z");
    post(room_id, user_id, "2", "2024-01-15T10:00:02.000Z");
    post(room_id, user_id, "3", "2024-01-15T10:00:03.000Z");

    // First page
    auto page = run_json({"timeline", "1", "2", "desc"});
    BOOST_TEST(page.at("hasMoreMessages").as_bool());
    const auto& messages = page.at("messages").as_array();
    BOOST_TEST_REQUIRE(messages.size() == 2u);
    BOOST_TEST(messages.at(0).at("content").as_string() == "3");
    BOOST_TEST(messages.at(1).at("content").as_string() == "2");

    // Continue from the last message
    std::string ts(messages.at(1).at("timestamp").as_string());
    std::string id = std::to_string(messages.at(1).at("id").as_int64());
    auto next_page = run_json({"timeline", "1", "2", "desc", ts, id});
    BOOST_TEST(!next_page.at("hasMoreMessages").as_bool());
    const auto& next_messages = next_page.at("messages").as_array();
    BOOST_TEST_REQUIRE(next_messages.size() == 1u);
    BOOST_TEST(next_messages.at(0).at("content").as_string() == "1");
}

BOOST_FIXTURE_TEST_CASE(delete_commands, fixture)
{
    auto user_id = create_user("bob");
    create_room("general", user_id);

    BOOST_TEST(run_ok({"delete-room", "1"}) == "");
    BOOST_TEST(run_ok({"delete-user", "1"}) == "");
    BOOST_TEST(run_error({"delete-user", "1"}) == error_code(errc::not_found));
}

BOOST_AUTO_TEST_SUITE_END()
