#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace client::net {

// Connection outcome shared between the receiver and the tick. Once either
// flag is set it stays set for the lifetime of the connection.
class ConnectionStatus {
public:
    void mark_kicked(std::string reason);
    void mark_disconnected();

    bool is_kicked() const { return kicked_.load(std::memory_order_acquire); }
    bool is_disconnected() const { return disconnected_.load(std::memory_order_acquire); }

    // Neither kicked nor disconnected.
    bool is_active() const { return !is_kicked() && !is_disconnected(); }

    std::optional<std::string> kick_reason() const;

private:
    std::atomic<bool> kicked_{false};
    std::atomic<bool> disconnected_{false};

    mutable std::mutex mutex_;
    std::optional<std::string> kickReason_;
};

} // namespace client::net
