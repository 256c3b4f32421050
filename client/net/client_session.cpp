#include "client_session.hpp"

#include "../../shared/protocol/serialization.hpp"

#include <raylib.h>

#include <string>

namespace client::net {

ClientSession::ClientSession(std::shared_ptr<shared::transport::IDatagramSession> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("ClientSession requires a transport");
    }
}

shared::proto::Welcome ClientSession::handshake(const std::string& playerName) {
    send(shared::proto::Hello{playerName});
    TraceLog(LOG_INFO, "[session] Hello sent as '%s', waiting for Welcome", playerName.c_str());

    while (true) {
        const auto datagram = transport_->recv();

        auto msg = shared::proto::try_decode(datagram);
        if (!msg) {
            TraceLog(LOG_WARNING, "[session] malformed datagram during handshake (%zu bytes)", datagram.size());
            continue;
        }

        if (auto* welcome = std::get_if<shared::proto::Welcome>(&*msg)) {
            TraceLog(LOG_INFO, "[session] Welcome: playerId=%u world=%ux%u spawn=(%.1f, %.1f)",
                     welcome->playerId,
                     welcome->worldWidth,
                     welcome->worldHeight,
                     welcome->spawnX,
                     welcome->spawnY);
            if (welcome->chunkSize != static_cast<std::uint32_t>(shared::world::kChunkEdge)) {
                TraceLog(LOG_ERROR, "[session] server chunk size %u, client expects %d",
                         welcome->chunkSize, shared::world::kChunkEdge);
                throw IncompatibleServer("unsupported chunk size " + std::to_string(welcome->chunkSize));
            }
            return *welcome;
        }

        if (auto* kick = std::get_if<shared::proto::Kick>(&*msg)) {
            TraceLog(LOG_WARNING, "[session] kicked during handshake: %s", kick->reason.c_str());
            throw Kicked(kick->reason);
        }

        TraceLog(LOG_DEBUG, "[session] dropping %s before Welcome",
                 std::string(shared::proto::message_name(shared::proto::message_type(*msg))).c_str());
    }
}

void ClientSession::send(const shared::proto::Message& msg) {
    const auto bytes = shared::proto::encode(msg);
    transport_->send(bytes);
}

void ClientSession::send_goodbye() {
    send(shared::proto::Goodbye{});
}

void ClientSession::send_heartbeat() {
    send(shared::proto::Heartbeat{});
}

void ClientSession::send_place_block(std::int32_t x, std::int32_t y) {
    shared::proto::PlaceBlock req;
    req.x = x;
    req.y = y;
    send(req);
}

void ClientSession::send_break_block(std::int32_t x, std::int32_t y) {
    shared::proto::BreakBlock req;
    req.x = x;
    req.y = y;
    send(req);
}

void ClientSession::send_velocity_change(float vx) {
    shared::proto::PlayerVelocityChange req;
    req.vx = vx;
    send(req);
}

void ClientSession::send_jump() {
    send(shared::proto::PlayerJump{});
}

void ClientSession::send_change_slot(std::uint8_t slot) {
    shared::proto::ChangeSlot req;
    req.slot = slot;
    send(req);
}

void ClientSession::send_chat_message(const std::string& text) {
    shared::proto::SendChatMessage req;
    req.text = text;
    send(req);
}

} // namespace client::net
