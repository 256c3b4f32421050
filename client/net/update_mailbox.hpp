#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <mutex>

#include "../../shared/protocol/messages.hpp"

namespace client::net {

struct UpdateKey {
    shared::proto::MessageType kind{};
    std::uint32_t id{0};

    friend auto operator<=>(const UpdateKey&, const UpdateKey&) = default;
};

// Latest-value slots written by the receiver thread and drained by the tick.
// A post() overwrites any value for the same (kind, id) that the tick has not
// taken yet, so stale positions never pile up.
class UpdateMailbox {
public:
    using Snapshot = std::map<UpdateKey, shared::proto::Message>;

    void post(shared::proto::MessageType kind, std::uint32_t id, shared::proto::Message value);

    // Moves every pending value out and leaves the mailbox empty.
    Snapshot take();

    std::size_t size() const;
    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    Snapshot pending_;
};

} // namespace client::net
