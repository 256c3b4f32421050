#include "local_transport.hpp"

namespace shared::transport {

std::deque<std::vector<std::uint8_t>>& LocalTransport::Endpoint::inbox() {
    return side_ == Side::Client ? state_->toClient : state_->toServer;
}

std::deque<std::vector<std::uint8_t>>& LocalTransport::Endpoint::outbox() {
    return side_ == Side::Client ? state_->toServer : state_->toClient;
}

void LocalTransport::Endpoint::send(std::span<const std::uint8_t> datagram) {
    {
        std::lock_guard lock(state_->mutex);
        if (state_->closed) {
            throw TransportClosed("local transport: send on closed session");
        }
        outbox().emplace_back(datagram.begin(), datagram.end());
    }
    state_->cv.notify_all();
}

std::vector<std::uint8_t> LocalTransport::Endpoint::recv() {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->closed || !inbox().empty(); });

    if (inbox().empty()) {
        throw TransportClosed("local transport: session closed");
    }

    std::vector<std::uint8_t> out = std::move(inbox().front());
    inbox().pop_front();
    return out;
}

bool LocalTransport::Endpoint::try_recv(std::vector<std::uint8_t>& out) {
    std::lock_guard lock(state_->mutex);
    if (inbox().empty()) {
        return false;
    }

    out = std::move(inbox().front());
    inbox().pop_front();
    return true;
}

void LocalTransport::Endpoint::close() {
    {
        std::lock_guard lock(state_->mutex);
        state_->closed = true;
    }
    state_->cv.notify_all();
}

bool LocalTransport::Endpoint::is_open() const {
    std::lock_guard lock(state_->mutex);
    return !state_->closed;
}

LocalTransport::Pair LocalTransport::create_pair() {
    auto state = std::make_shared<SharedState>();

    Pair pair;
    pair.client = std::make_shared<Endpoint>(state, Endpoint::Side::Client);
    pair.server = std::make_shared<Endpoint>(state, Endpoint::Side::Server);
    return pair;
}

} // namespace shared::transport
