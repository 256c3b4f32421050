#include "connection_status.hpp"

#include <utility>

namespace client::net {

void ConnectionStatus::mark_kicked(std::string reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!kickReason_) {
            kickReason_ = std::move(reason);
        }
    }
    kicked_.store(true, std::memory_order_release);
}

void ConnectionStatus::mark_disconnected() {
    disconnected_.store(true, std::memory_order_release);
}

std::optional<std::string> ConnectionStatus::kick_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kickReason_;
}

} // namespace client::net
