/**
 * @file test_end_to_end.cpp
 * @brief Full client flow over an in-memory transport.
 *
 * The test body plays the server on the other end of a LocalTransport pair
 * while the real receiver thread runs on the client end.
 */

#include <catch2/catch_test_macros.hpp>

#include "client/game/client_world.hpp"
#include "client/net/network_receiver.hpp"

#include "test_utils.hpp"

#include "protocol/serialization.hpp"
#include "transport/local_transport.hpp"

#include <chrono>
#include <functional>
#include <thread>

using namespace client::game;
using namespace client::net;
using namespace shared::proto;
using namespace test_helpers;

namespace {

bool wait_for(const std::function<bool()>& pred) {
    for (int i = 0; i < 400; ++i) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Next datagram the client sent, decoded.
Message server_recv(shared::transport::LocalTransport::Endpoint& server) {
    return decode(server.recv());
}

} // namespace

TEST_CASE("Join, spawn and a stale block change", "[integration]") {
    auto pair = shared::transport::LocalTransport::create_pair();
    auto session = std::make_shared<ClientSession>(pair.client);
    auto channels = std::make_shared<SyncChannels>();

    // Queued ahead so the blocking handshake finds it.
    pair.server->send(encode(make_welcome(7, 3.0f, 4.0f, 100)));

    const Welcome welcome = session->handshake("alice");

    const Message hello = server_recv(*pair.server);
    REQUIRE(std::get<Hello>(hello).name == "alice");

    ClientWorld::Options opts;
    ClientWorld world(session, channels, opts);
    world.apply_welcome(welcome);

    REQUIRE(world.player_id() == 7);
    REQUIRE(world.world_width() == 100);
    REQUIRE(world.position().x == 3.0f * opts.pixelScale);
    REQUIRE(world.position().y == 4.0f * opts.pixelScale);

    NetworkReceiver receiver(session, channels, welcome.playerId, std::chrono::milliseconds(1));
    receiver.start();

    // Chunk (1, 0) was never requested.
    pair.server->send(encode(BlockChanged{19, 2, 3}));
    REQUIRE(wait_for([&]() { return channels->inbound.size() == 1; }));

    REQUIRE_NOTHROW(world.drain_and_apply());
    REQUIRE_FALSE(world.chunks().contains({1, 0}));
    REQUIRE(world.chunks().get_block(19, 2) == shared::world::kAirBlock);

    receiver.stop();
}

TEST_CASE("Heartbeat, streaming and kick over the wire", "[integration]") {
    auto pair = shared::transport::LocalTransport::create_pair();
    auto session = std::make_shared<ClientSession>(pair.client);
    auto channels = std::make_shared<SyncChannels>();

    pair.server->send(encode(make_welcome(7, 0.0f, 0.0f)));
    const Welcome welcome = session->handshake("alice");
    (void)server_recv(*pair.server);   // Hello

    ClientWorld::Options opts;
    opts.viewportRadiusX = 0;
    opts.viewportRadiusY = 0;
    ClientWorld world(session, channels, opts);
    world.apply_welcome(welcome);

    NetworkReceiver receiver(session, channels, welcome.playerId, std::chrono::milliseconds(1));
    receiver.start();

    SECTION("HeartbeatPing is answered by the receiver") {
        pair.server->send(encode(HeartbeatPing{}));
        REQUIRE(std::holds_alternative<Heartbeat>(server_recv(*pair.server)));
    }

    SECTION("Requested chunk arrives and is readable") {
        world.tick();
        const Message req = server_recv(*pair.server);
        REQUIRE(std::get<RequestChunk>(req).chunkX == 0);
        REQUIRE(std::get<RequestChunk>(req).chunkY == 0);

        pair.server->send(encode(make_chunk_data(0, 0, 4)));
        REQUIRE(wait_for([&]() { return channels->inbound.size() == 1; }));

        world.tick();
        REQUIRE(world.chunks().is_populated({0, 0}));
        REQUIRE(world.chunks().get_block(5, 5) == 4);
    }

    SECTION("Server position overrides the local prediction") {
        pair.server->send(encode(make_position(7, 2.0f, 1.0f)));
        REQUIRE(wait_for([&]() { return !channels->mailbox.empty(); }));

        world.drain_and_apply();
        REQUIRE(world.position().x == 2.0f * opts.pixelScale);
        REQUIRE(world.position().y == 1.0f * opts.pixelScale);
    }

    SECTION("Kick ends the session") {
        pair.server->send(encode(Kick{"server closing"}));
        REQUIRE(wait_for([&]() { return receiver.state() == NetworkReceiver::State::Terminated; }));

        REQUIRE_FALSE(world.is_connected());
        REQUIRE(*channels->status.kick_reason() == "server closing");
    }

    receiver.stop();
}
