#pragma once

#include "client_session.hpp"
#include "sync_channels.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <thread>

namespace client::net {

// Background reader for the lifetime of one connection. It never touches
// tick-owned state: local position updates go to the mailbox, world events
// to the inbound queue, and the outcome to the connection status.
class NetworkReceiver {
public:
    enum class State : std::uint8_t {
        Idle,
        Running,
        Terminated
    };

    NetworkReceiver(std::shared_ptr<ClientSession> session,
                    std::shared_ptr<SyncChannels> channels,
                    shared::proto::PlayerId localPlayerId,
                    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(16));
    ~NetworkReceiver();

    NetworkReceiver(const NetworkReceiver&) = delete;
    NetworkReceiver& operator=(const NetworkReceiver&) = delete;

    void start();

    // Closes the transport (unblocking recv) and joins the thread.
    void stop();

    // One loop iteration without the thread: decode and dispatch a datagram.
    // Returns false once the connection is finished (Kick).
    bool handle_datagram(std::span<const std::uint8_t> datagram);

    State state() const { return state_.load(); }

private:
    void run_loop_();
    bool dispatch_(const shared::proto::Message& msg);

    std::shared_ptr<ClientSession> session_;
    std::shared_ptr<SyncChannels> channels_;
    shared::proto::PlayerId localPlayerId_{0};
    std::chrono::milliseconds pollInterval_;

    std::atomic<State> state_{State::Idle};
    std::atomic<bool> stopRequested_{false};
    std::thread thread_{};
};

} // namespace client::net
