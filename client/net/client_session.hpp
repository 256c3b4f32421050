#pragma once

#include "../../shared/protocol/messages.hpp"
#include "../../shared/transport/datagram_session.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace client::net {

// The server refused the connection (or dropped it) with a Kick.
class Kicked : public std::runtime_error {
public:
    explicit Kicked(std::string reason)
        : std::runtime_error("kicked: " + reason), reason_(std::move(reason)) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

// The server's Welcome describes a world layout this client cannot index
// (currently: a chunk edge other than 16).
class IncompatibleServer : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Outbound half of the protocol plus the blocking handshake. send_* may be
// called from the tick and the receiver concurrently; the transport
// serialises writes.
class ClientSession {
public:
    explicit ClientSession(std::shared_ptr<shared::transport::IDatagramSession> transport);

    // Sends Hello(name) and blocks until Welcome. Anything else that arrives
    // first is dropped. Throws Kicked, IncompatibleServer or
    // shared::transport::TransportClosed.
    shared::proto::Welcome handshake(const std::string& playerName);

    void send(const shared::proto::Message& msg);

    void send_goodbye();
    void send_heartbeat();
    void send_place_block(std::int32_t x, std::int32_t y);
    void send_break_block(std::int32_t x, std::int32_t y);
    void send_velocity_change(float vx);
    void send_jump();
    void send_change_slot(std::uint8_t slot);
    void send_chat_message(const std::string& text);

    shared::transport::IDatagramSession& transport() { return *transport_; }

private:
    std::shared_ptr<shared::transport::IDatagramSession> transport_;
};

} // namespace client::net
