#pragma once

// ENetSession - client datagram session over ENet.
// Forward declarations keep <enet/enet.h> (and its platform headers) out of
// every translation unit that only needs IDatagramSession.

#include "datagram_session.hpp"
#include "enet_common.hpp"

#include <deque>
#include <mutex>
#include <string>

struct _ENetHost;
struct _ENetPeer;
typedef struct _ENetHost ENetHost;
typedef struct _ENetPeer ENetPeer;

namespace shared::transport {

class ENetSession final : public IDatagramSession {
public:
    ENetSession() = default;
    ~ENetSession() override;

    ENetSession(const ENetSession&) = delete;
    ENetSession& operator=(const ENetSession&) = delete;

    // Blocks until the peer accepts or timeoutMs elapses.
    bool connect(const std::string& host, std::uint16_t port,
                 std::uint32_t timeoutMs = config::kConnectionTimeoutMs);

    void send(std::span<const std::uint8_t> datagram) override;
    std::vector<std::uint8_t> recv() override;
    void close() override;
    bool is_open() const override;

    std::uint32_t ping_ms() const;

private:
    // Requires mutex_. Moves received packets into recvQueue_.
    void service_locked_(std::uint32_t timeoutMs);

    mutable std::mutex mutex_;
    ENetHost* host_{nullptr};
    ENetPeer* peer_{nullptr};
    bool connected_{false};
    std::deque<std::vector<std::uint8_t>> recvQueue_;
};

} // namespace shared::transport
