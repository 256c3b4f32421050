/**
 * @file test_client_session.cpp
 * @brief Handshake and outbound message helpers.
 *
 * NOTE: These tests use MockSession to avoid a real server.
 */

#include <catch2/catch_test_macros.hpp>

#include "client/net/client_session.hpp"

#include "mock_session.hpp"
#include "test_utils.hpp"

using namespace client::net;
using namespace shared::proto;
using namespace test_helpers;

// =============================================================================
// Handshake
// =============================================================================

TEST_CASE("Handshake sends Hello and returns Welcome", "[client][session]") {
    auto transport = std::make_shared<MockSession>();
    transport->inject_message(make_welcome(7, 3.0f, 4.0f, 100));

    ClientSession session(transport);
    const Welcome welcome = session.handshake("alice");

    REQUIRE(welcome.playerId == 7);
    REQUIRE(welcome.worldWidth == 100);
    REQUIRE(welcome.spawnX == 3.0f);
    REQUIRE(welcome.spawnY == 4.0f);

    const auto sent = transport->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(get_message<Hello>(sent[0])->name == "alice");
}

TEST_CASE("Handshake skips messages before Welcome", "[client][session]") {
    auto transport = std::make_shared<MockSession>();
    transport->inject_message(HeartbeatPing{});
    transport->inject_raw({0xFE});
    transport->inject_message(make_chunk_data(0, 0, 1));
    transport->inject_message(make_welcome(2, 0.0f, 0.0f));

    ClientSession session(transport);
    REQUIRE(session.handshake("bob").playerId == 2);
}

TEST_CASE("Handshake reports a Kick", "[client][session]") {
    auto transport = std::make_shared<MockSession>();
    transport->inject_message(Kick{"name taken"});

    ClientSession session(transport);
    try {
        (void)session.handshake("alice");
        FAIL("expected Kicked");
    } catch (const Kicked& e) {
        REQUIRE(e.reason() == "name taken");
    }
}

TEST_CASE("Handshake rejects a foreign chunk size", "[client][session]") {
    auto transport = std::make_shared<MockSession>();
    Welcome welcome = make_welcome(7, 0.0f, 0.0f);
    welcome.chunkSize = 32;
    transport->inject_message(welcome);

    ClientSession session(transport);
    REQUIRE_THROWS_AS(session.handshake("alice"), IncompatibleServer);
}

TEST_CASE("Handshake fails when the transport closes", "[client][session]") {
    auto transport = std::make_shared<MockSession>();

    ClientSession session(transport);
    REQUIRE_THROWS_AS(session.handshake("alice"), shared::transport::TransportClosed);
}

TEST_CASE("Session requires a transport", "[client][session]") {
    REQUIRE_THROWS_AS(ClientSession(nullptr), std::invalid_argument);
}

// =============================================================================
// Outbound helpers
// =============================================================================

TEST_CASE("Send helpers emit the matching messages", "[client][session]") {
    auto transport = std::make_shared<MockSession>();
    ClientSession session(transport);

    session.send_place_block(4, 5);
    session.send_break_block(-1, 2);
    session.send_velocity_change(-5.0f);
    session.send_jump();
    session.send_change_slot(3);
    session.send_chat_message("hello");
    session.send_heartbeat();
    session.send_goodbye();

    const auto sent = transport->sent();
    REQUIRE(sent.size() == 8);

    REQUIRE(get_message<PlaceBlock>(sent[0])->x == 4);
    REQUIRE(get_message<PlaceBlock>(sent[0])->y == 5);
    REQUIRE(get_message<BreakBlock>(sent[1])->x == -1);
    REQUIRE(get_message<PlayerVelocityChange>(sent[2])->vx == -5.0f);
    REQUIRE(is_message_type<PlayerJump>(sent[3]));
    REQUIRE(get_message<ChangeSlot>(sent[4])->slot == 3);
    REQUIRE(get_message<SendChatMessage>(sent[5])->text == "hello");
    REQUIRE(is_message_type<Heartbeat>(sent[6]));
    REQUIRE(is_message_type<Goodbye>(sent[7]));
}

TEST_CASE("Send on a closed transport throws", "[client][session]") {
    auto transport = std::make_shared<MockSession>();
    ClientSession session(transport);
    transport->close();

    REQUIRE_THROWS_AS(session.send_jump(), shared::transport::TransportClosed);
}
