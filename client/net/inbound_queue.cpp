#include "inbound_queue.hpp"

#include <utility>

namespace client::net {

void InboundQueue::push(shared::proto::Message msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(msg));
}

std::vector<shared::proto::Message> InboundQueue::take() {
    std::vector<shared::proto::Message> out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.swap(events_);
    return out;
}

std::size_t InboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace client::net
