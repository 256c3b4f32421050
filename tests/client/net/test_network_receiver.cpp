/**
 * @file test_network_receiver.cpp
 * @brief Receiver dispatch rules and lifecycle.
 *
 * NOTE: Dispatch tests drive handle_datagram() directly; only the lifecycle
 * tests start the background thread.
 */

#include <catch2/catch_test_macros.hpp>

#include "client/net/network_receiver.hpp"

#include "mock_session.hpp"
#include "test_utils.hpp"

#include "protocol/serialization.hpp"
#include "transport/local_transport.hpp"

#include <chrono>
#include <thread>

using namespace client::net;
using namespace shared::proto;
using namespace test_helpers;

namespace {

constexpr PlayerId kLocalId = 7;

struct Fixture {
    std::shared_ptr<MockSession> transport = std::make_shared<MockSession>();
    std::shared_ptr<ClientSession> session = std::make_shared<ClientSession>(transport);
    std::shared_ptr<SyncChannels> channels = std::make_shared<SyncChannels>();
    NetworkReceiver receiver{session, channels, kLocalId, std::chrono::milliseconds(0)};

    bool feed(const Message& msg) {
        return receiver.handle_datagram(encode(msg));
    }
};

} // namespace

// =============================================================================
// Dispatch
// =============================================================================

TEST_CASE("Kick terminates and records the reason", "[net][receiver]") {
    Fixture f;

    REQUIRE_FALSE(f.feed(Kick{"banned"}));
    REQUIRE(f.channels->status.is_kicked());
    REQUIRE(*f.channels->status.kick_reason() == "banned");
    REQUIRE(f.receiver.state() == NetworkReceiver::State::Terminated);
}

TEST_CASE("HeartbeatPing is answered", "[net][receiver]") {
    Fixture f;

    REQUIRE(f.feed(HeartbeatPing{}));

    const auto sent = f.transport->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(is_message_type<Heartbeat>(sent[0]));
}

TEST_CASE("HeartbeatPing on a closed session keeps the loop alive", "[net][receiver]") {
    Fixture f;
    f.transport->fail_sends();

    REQUIRE(f.feed(HeartbeatPing{}));
    REQUIRE(f.transport->sent_count() == 0);
}

TEST_CASE("Local position goes to the mailbox, remote to the queue", "[net][receiver]") {
    Fixture f;

    REQUIRE(f.feed(make_position(kLocalId, 1.0f, 1.0f)));
    REQUIRE(f.feed(make_position(kLocalId, 2.0f, 2.0f)));
    REQUIRE(f.feed(make_position(99, 3.0f, 3.0f)));

    auto mail = f.channels->mailbox.take();
    REQUIRE(mail.size() == 1);
    REQUIRE(std::get<PlayerPositionUpdate>(mail.begin()->second).x == 2.0f);

    auto events = f.channels->inbound.take();
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<PlayerPositionUpdate>(events[0]).playerId == 99);
}

TEST_CASE("World events are queued in order", "[net][receiver]") {
    Fixture f;

    REQUIRE(f.feed(make_chunk_data(0, 0, 1)));
    REQUIRE(f.feed(BlockChanged{1, 2, 3}));
    REQUIRE(f.feed(BatchBlockChanged{{BlockPos{1, 1}}, 4}));
    REQUIRE(f.feed(PlayerEnteredView{5, 1.0f, 2.0f}));
    REQUIRE(f.feed(PlayerLeftView{5}));
    REQUIRE(f.feed(InventoryUpdate{}));
    REQUIRE(f.feed(ChatBroadcast{"bob", "hi"}));

    auto events = f.channels->inbound.take();
    REQUIRE(events.size() == 7);
    REQUIRE(is_message_type<ChunkData>(events[0]));
    REQUIRE(is_message_type<BlockChanged>(events[1]));
    REQUIRE(is_message_type<BatchBlockChanged>(events[2]));
    REQUIRE(is_message_type<PlayerEnteredView>(events[3]));
    REQUIRE(is_message_type<PlayerLeftView>(events[4]));
    REQUIRE(is_message_type<InventoryUpdate>(events[5]));
    REQUIRE(is_message_type<ChatBroadcast>(events[6]));
}

TEST_CASE("Malformed and unexpected datagrams are dropped", "[net][receiver]") {
    Fixture f;

    const std::vector<std::uint8_t> garbage{0xEE, 0x01};
    REQUIRE(f.receiver.handle_datagram(garbage));

    REQUIRE(f.feed(make_welcome(1, 0.0f, 0.0f)));
    REQUIRE(f.feed(PlayerJoined{3, "carol"}));
    REQUIRE(f.feed(Hello{"echo"}));

    REQUIRE(f.channels->inbound.size() == 0);
    REQUIRE(f.channels->mailbox.empty());
    REQUIRE(f.channels->status.is_active());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("Receiver thread stops on transport close", "[net][receiver]") {
    Fixture f;
    f.transport->inject_message(make_chunk_data(0, 0, 2));

    f.receiver.start();

    // MockSession throws TransportClosed once drained.
    for (int i = 0; i < 200 && f.receiver.state() != NetworkReceiver::State::Terminated; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    REQUIRE(f.receiver.state() == NetworkReceiver::State::Terminated);
    REQUIRE(f.channels->status.is_disconnected());
    REQUIRE(f.channels->inbound.size() == 1);
    f.receiver.stop();
}

TEST_CASE("Receiver thread exits on Kick over a local pair", "[net][receiver]") {
    auto pair = shared::transport::LocalTransport::create_pair();
    auto session = std::make_shared<ClientSession>(pair.client);
    auto channels = std::make_shared<SyncChannels>();

    NetworkReceiver receiver(session, channels, kLocalId, std::chrono::milliseconds(1));
    receiver.start();

    pair.server->send(encode(Kick{"maintenance"}));

    for (int i = 0; i < 200 && receiver.state() != NetworkReceiver::State::Terminated; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    REQUIRE(receiver.state() == NetworkReceiver::State::Terminated);
    REQUIRE(channels->status.is_kicked());
    REQUIRE_FALSE(channels->status.is_disconnected());
    receiver.stop();
}

TEST_CASE("stop() unblocks a waiting receiver", "[net][receiver]") {
    auto pair = shared::transport::LocalTransport::create_pair();
    auto session = std::make_shared<ClientSession>(pair.client);
    auto channels = std::make_shared<SyncChannels>();

    NetworkReceiver receiver(session, channels, kLocalId, std::chrono::milliseconds(1));
    receiver.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    receiver.stop();
    REQUIRE(receiver.state() == NetworkReceiver::State::Terminated);
}
