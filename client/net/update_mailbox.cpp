#include "update_mailbox.hpp"

#include <utility>

namespace client::net {

void UpdateMailbox::post(shared::proto::MessageType kind, std::uint32_t id, shared::proto::Message value) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.insert_or_assign(UpdateKey{kind, id}, std::move(value));
}

UpdateMailbox::Snapshot UpdateMailbox::take() {
    Snapshot out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.swap(pending_);
    return out;
}

std::size_t UpdateMailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace client::net
