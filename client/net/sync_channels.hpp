#pragma once

#include "connection_status.hpp"
#include "inbound_queue.hpp"
#include "update_mailbox.hpp"

namespace client::net {

// Everything the receiver thread may touch. Shared (by shared_ptr) between
// the NetworkReceiver and the ClientWorld that drains it.
struct SyncChannels {
    UpdateMailbox mailbox;
    InboundQueue inbound;
    ConnectionStatus status;
};

} // namespace client::net
