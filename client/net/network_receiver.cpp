#include "network_receiver.hpp"

#include "../../shared/protocol/serialization.hpp"
#include "../core/logger.hpp"

#include <raylib.h>

#include <string>

namespace client::net {

namespace proto = shared::proto;

NetworkReceiver::NetworkReceiver(std::shared_ptr<ClientSession> session,
                                 std::shared_ptr<SyncChannels> channels,
                                 proto::PlayerId localPlayerId,
                                 std::chrono::milliseconds pollInterval)
    : session_(std::move(session)),
      channels_(std::move(channels)),
      localPlayerId_(localPlayerId),
      pollInterval_(pollInterval) {}

NetworkReceiver::~NetworkReceiver() {
    stop();
}

void NetworkReceiver::start() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;
    }

    thread_ = std::thread([this]() { run_loop_(); });
}

void NetworkReceiver::stop() {
    stopRequested_.store(true);

    if (thread_.joinable()) {
        session_->transport().close();
        thread_.join();
    }
}

void NetworkReceiver::run_loop_() {
    core::Logger::set_thread_tag("net");
    TraceLog(LOG_INFO, "[net] receiver started (local player %u)", localPlayerId_);

    while (!stopRequested_.load()) {
        std::this_thread::sleep_for(pollInterval_);

        std::vector<std::uint8_t> datagram;
        try {
            datagram = session_->transport().recv();
        } catch (const shared::transport::TransportClosed& e) {
            if (!stopRequested_.load()) {
                TraceLog(LOG_WARNING, "[net] connection lost: %s", e.what());
            }
            channels_->status.mark_disconnected();
            break;
        }

        if (!handle_datagram(datagram)) {
            break;
        }
    }

    state_.store(State::Terminated);
    TraceLog(LOG_INFO, "[net] receiver stopped");
}

bool NetworkReceiver::handle_datagram(std::span<const std::uint8_t> datagram) {
    try {
        const proto::Message msg = proto::decode(datagram);
        if (!dispatch_(msg)) {
            state_.store(State::Terminated);
            return false;
        }
    } catch (const proto::MalformedMessage& e) {
        TraceLog(LOG_WARNING, "[net] dropping malformed datagram (%zu bytes): %s", datagram.size(), e.what());
    } catch (const shared::transport::TransportClosed& e) {
        // Heartbeat reply failed; the next recv() reports the closure.
        TraceLog(LOG_WARNING, "[net] heartbeat not sent: %s", e.what());
    }
    return true;
}

bool NetworkReceiver::dispatch_(const proto::Message& msg) {
    if (const auto* kick = std::get_if<proto::Kick>(&msg)) {
        TraceLog(LOG_WARNING, "[net] kicked by server: %s", kick->reason.c_str());
        channels_->status.mark_kicked(kick->reason);
        return false;
    }

    if (std::holds_alternative<proto::HeartbeatPing>(msg)) {
        session_->send_heartbeat();
        return true;
    }

    if (const auto* pos = std::get_if<proto::PlayerPositionUpdate>(&msg)) {
        if (pos->playerId == localPlayerId_) {
            channels_->mailbox.post(proto::MessageType::PlayerPositionUpdate, pos->playerId, msg);
        } else {
            channels_->inbound.push(msg);
        }
        return true;
    }

    if (std::holds_alternative<proto::ChunkData>(msg) ||
        std::holds_alternative<proto::BlockChanged>(msg) ||
        std::holds_alternative<proto::BatchBlockChanged>(msg) ||
        std::holds_alternative<proto::PlayerEnteredView>(msg) ||
        std::holds_alternative<proto::PlayerLeftView>(msg) ||
        std::holds_alternative<proto::InventoryUpdate>(msg) ||
        std::holds_alternative<proto::ChatBroadcast>(msg)) {
        channels_->inbound.push(msg);
        return true;
    }

    if (const auto* joined = std::get_if<proto::PlayerJoined>(&msg)) {
        TraceLog(LOG_INFO, "[net] player joined: %s (id=%u)", joined->name.c_str(), joined->playerId);
        return true;
    }

    if (const auto* left = std::get_if<proto::PlayerLeft>(&msg)) {
        TraceLog(LOG_INFO, "[net] player left: %s (id=%u)", left->name.c_str(), left->playerId);
        return true;
    }

    TraceLog(LOG_DEBUG, "[net] ignoring unexpected %s",
             std::string(proto::message_name(proto::message_type(msg))).c_str());
    return true;
}

} // namespace client::net
