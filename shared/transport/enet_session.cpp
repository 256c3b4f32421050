#include "enet_session.hpp"

#include <enet/enet.h>

#include <chrono>
#include <cstdio>
#include <thread>

namespace shared::transport {

ENetSession::~ENetSession() {
    close();
}

// =============================================================================
// Connection
// =============================================================================

bool ENetSession::connect(const std::string& host, std::uint16_t port, std::uint32_t timeoutMs) {
    std::lock_guard lock(mutex_);

    if (connected_) {
        std::fprintf(stderr, "[enet_session] already connected\n");
        return false;
    }

    host_ = enet_host_create(
        nullptr,  // No address - we're a client
        1,        // Only one outgoing connection
        static_cast<std::size_t>(ENetChannel::Count),
        0,        // Unlimited incoming bandwidth
        0         // Unlimited outgoing bandwidth
    );

    if (!host_) {
        std::fprintf(stderr, "[enet_session] enet_host_create failed\n");
        return false;
    }

    ENetAddress address;
    address.port = port;

    // IP literal first, DNS lookup as fallback.
    int result = enet_address_set_host_ip(&address, host.c_str());
    if (result < 0) {
        result = enet_address_set_host(&address, host.c_str());
    }

    if (result < 0) {
        std::fprintf(stderr, "[enet_session] failed to resolve host: %s\n", host.c_str());
        enet_host_destroy(host_);
        host_ = nullptr;
        return false;
    }

    std::fprintf(stderr, "[enet_session] connecting to %s:%u (timeout=%ums)...\n",
                 host.c_str(), port, timeoutMs);

    peer_ = enet_host_connect(host_, &address, static_cast<std::size_t>(ENetChannel::Count), 0);
    if (!peer_) {
        std::fprintf(stderr, "[enet_session] enet_host_connect failed\n");
        enet_host_destroy(host_);
        host_ = nullptr;
        return false;
    }

    ENetEvent event;
    if (enet_host_service(host_, &event, timeoutMs) > 0 &&
        event.type == ENET_EVENT_TYPE_CONNECT) {
        connected_ = true;
        std::fprintf(stderr, "[enet_session] connected, ping=%ums\n", peer_->roundTripTime);
        return true;
    }

    std::fprintf(stderr, "[enet_session] connection timed out\n");
    enet_peer_reset(peer_);
    peer_ = nullptr;
    enet_host_destroy(host_);
    host_ = nullptr;
    return false;
}

void ENetSession::close() {
    std::lock_guard lock(mutex_);

    if (peer_ && connected_) {
        enet_peer_disconnect(peer_, 0);

        // Give the server a moment to acknowledge.
        ENetEvent event;
        while (enet_host_service(host_, &event, config::kDisconnectWaitMs) > 0) {
            if (event.type == ENET_EVENT_TYPE_RECEIVE) {
                enet_packet_destroy(event.packet);
                continue;
            }
            if (event.type == ENET_EVENT_TYPE_DISCONNECT) {
                break;
            }
        }

        enet_peer_reset(peer_);
    }

    connected_ = false;
    peer_ = nullptr;
    recvQueue_.clear();

    if (host_) {
        enet_host_destroy(host_);
        host_ = nullptr;
    }
}

bool ENetSession::is_open() const {
    std::lock_guard lock(mutex_);
    return connected_;
}

std::uint32_t ENetSession::ping_ms() const {
    std::lock_guard lock(mutex_);
    if (peer_ && connected_) {
        return peer_->roundTripTime;
    }
    return 0;
}

// =============================================================================
// Datagrams
// =============================================================================

void ENetSession::send(std::span<const std::uint8_t> datagram) {
    std::lock_guard lock(mutex_);

    if (!connected_ || !peer_) {
        throw TransportClosed("enet session: send while disconnected");
    }

    ENetPacket* packet = enet_packet_create(datagram.data(), datagram.size(), ENET_PACKET_FLAG_UNSEQUENCED);
    if (!packet) {
        std::fprintf(stderr, "[enet_session] enet_packet_create failed (%zu bytes)\n", datagram.size());
        return;
    }

    if (enet_peer_send(peer_, static_cast<enet_uint8>(ENetChannel::Datagram), packet) < 0) {
        // Ownership stays with us when enet_peer_send fails.
        enet_packet_destroy(packet);
        std::fprintf(stderr, "[enet_session] enet_peer_send failed\n");
        return;
    }

    enet_host_flush(host_);
}

std::vector<std::uint8_t> ENetSession::recv() {
    for (;;) {
        {
            std::lock_guard lock(mutex_);

            if (recvQueue_.empty() && connected_) {
                service_locked_(0);
            }

            if (!recvQueue_.empty()) {
                std::vector<std::uint8_t> out = std::move(recvQueue_.front());
                recvQueue_.pop_front();
                return out;
            }

            if (!connected_) {
                throw TransportClosed("enet session: not connected");
            }
        }

        // Release the host lock between polls so send() is never starved.
        std::this_thread::sleep_for(std::chrono::milliseconds(config::kServiceSliceMs));
    }
}

void ENetSession::service_locked_(std::uint32_t timeoutMs) {
    if (!host_) {
        return;
    }

    ENetEvent event;
    while (enet_host_service(host_, &event, timeoutMs) > 0) {
        switch (event.type) {
            case ENET_EVENT_TYPE_RECEIVE:
                recvQueue_.emplace_back(event.packet->data, event.packet->data + event.packet->dataLength);
                enet_packet_destroy(event.packet);
                break;

            case ENET_EVENT_TYPE_DISCONNECT:
                std::fprintf(stderr, "[enet_session] peer disconnected\n");
                connected_ = false;
                peer_ = nullptr;
                break;

            default:
                break;
        }

        // Only wait on first iteration
        timeoutMs = 0;
    }
}

} // namespace shared::transport
