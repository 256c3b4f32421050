#pragma once

#include <mutex>
#include <vector>

#include "../../shared/protocol/messages.hpp"

namespace client::net {

// Ordered hand-off of world events (chunk data, block changes, remote player
// movement, inventory, chat) from the receiver thread to the tick. Unlike the
// mailbox nothing is coalesced: block changes must replay in arrival order.
class InboundQueue {
public:
    void push(shared::proto::Message msg);

    // Moves every queued event out, oldest first.
    std::vector<shared::proto::Message> take();

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<shared::proto::Message> events_;
};

} // namespace client::net
