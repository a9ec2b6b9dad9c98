//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_history_service.hpp"

#include <boost/test/unit_test.hpp>

#include <cstdint>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"
#include "services/chat_store.hpp"
#include "store_fixture.hpp"

using namespace chatstore;
using namespace chatstore::test;

namespace {

struct fixture : store_fixture_base
{
    fixture() { setup(create_sqlite_store(sqlite_config{":memory:"}, ctx.get_executor()).value()); }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(room_history_service_)

BOOST_FIXTURE_TEST_CASE(single_room, fixture)
{
    auto alice = create_user("alice");
    auto bob = create_user("bob");
    create_user("carol");
    auto room_id = create_room("general", alice);
    auto m1 = post(room_id, alice, "hi", "2024-01-15T10:00:00.000Z");
    auto m2 = post(room_id, bob, "hello", "2024-01-15T10:00:01.000Z");
    auto m3 = post(room_id, alice, "how are you?", "2024-01-15T10:00:02.000Z");

    room_history_service svc(*store);
    auto res = run(svc.get_room_history(room_id)).value();

    // Messages
    BOOST_TEST(message_ids(res.first) == (id_vector{m1, m2, m3}));
    BOOST_TEST(!res.first.has_more);

    // Usernames, only for the authors
    BOOST_TEST(res.second.size() == 2u);
    BOOST_TEST(res.second.at(alice) == "alice");
    BOOST_TEST(res.second.at(bob) == "bob");
}

BOOST_FIXTURE_TEST_CASE(single_room_query, fixture)
{
    auto alice = create_user("alice");
    auto bob = create_user("bob");
    auto room_id = create_room("general", alice);
    post(room_id, bob, "hello", "2024-01-15T10:00:00.000Z");
    auto m2 = post(room_id, alice, "bye", "2024-01-15T10:00:01.000Z");

    // The query is forwarded to the store
    timeline_query q;
    q.order = sort_order::descending;
    q.limit = 1;
    room_history_service svc(*store);
    auto res = run(svc.get_room_history(room_id, q)).value();

    BOOST_TEST(message_ids(res.first) == id_vector{m2});
    BOOST_TEST(res.first.has_more);
    BOOST_TEST(res.second.size() == 1u);
    BOOST_TEST(res.second.at(alice) == "alice");
}

BOOST_FIXTURE_TEST_CASE(single_room_empty, fixture)
{
    auto room_id = create_room("general", create_user("alice"));

    room_history_service svc(*store);
    auto res = run(svc.get_room_history(room_id)).value();

    BOOST_TEST(res.first.messages.empty());
    BOOST_TEST(res.second.empty());
}

BOOST_FIXTURE_TEST_CASE(single_room_not_found, fixture)
{
    room_history_service svc(*store);
    auto res = run(svc.get_room_history(9999));

    BOOST_TEST_REQUIRE(res.has_error());
    BOOST_TEST(res.error().ec == error_code(errc::not_found));
}

BOOST_FIXTURE_TEST_CASE(several_rooms, fixture)
{
    auto alice = create_user("alice");
    auto bob = create_user("bob");
    auto carol = create_user("carol");
    auto r1 = create_room("r1", alice);
    auto r2 = create_room("r2", alice);
    auto r3 = create_room("r3", alice);
    auto m1 = post(r1, bob, "hello", "2024-01-15T10:00:00.000Z");
    auto m2 = post(r3, carol, "hi", "2024-01-15T10:00:01.000Z");
    auto m3 = post(r1, carol, "bye", "2024-01-15T10:00:02.000Z");

    // One batch per room, in the order they were requested
    const std::int64_t room_ids[] = {r3, r2, r1};
    room_history_service svc(*store);
    auto res = run(svc.get_room_history(room_ids)).value();

    BOOST_TEST_REQUIRE(res.first.size() == 3u);
    BOOST_TEST(message_ids(res.first[0]) == id_vector{m2});
    BOOST_TEST(message_ids(res.first[1]) == id_vector{});
    BOOST_TEST(message_ids(res.first[2]) == (id_vector{m1, m3}));

    // Each author appears once
    BOOST_TEST(res.second.size() == 2u);
    BOOST_TEST(res.second.at(bob) == "bob");
    BOOST_TEST(res.second.at(carol) == "carol");
}

BOOST_FIXTURE_TEST_CASE(several_rooms_one_missing, fixture)
{
    auto r1 = create_room("r1", create_user("alice"));

    const std::int64_t room_ids[] = {r1, 9999};
    room_history_service svc(*store);
    auto res = run(svc.get_room_history(room_ids));

    BOOST_TEST_REQUIRE(res.has_error());
    BOOST_TEST(res.error().ec == error_code(errc::not_found));
}

BOOST_AUTO_TEST_SUITE_END()
