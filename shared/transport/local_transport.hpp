#pragma once

#include "datagram_session.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace shared::transport {

// In-process datagram pair. Both ends share one mutex; closing either end
// closes the pair and wakes any blocked recv().
class LocalTransport {
public:
    struct SharedState {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::vector<std::uint8_t>> toServer;
        std::deque<std::vector<std::uint8_t>> toClient;
        bool closed{false};
    };

    class Endpoint final : public IDatagramSession {
    public:
        enum class Side { Client, Server };

        Endpoint(std::shared_ptr<SharedState> state, Side side)
            : state_(std::move(state)), side_(side) {}

        void send(std::span<const std::uint8_t> datagram) override;
        std::vector<std::uint8_t> recv() override;
        void close() override;
        bool is_open() const override;

        // Non-blocking variant used by tests and in-process servers.
        bool try_recv(std::vector<std::uint8_t>& out);

    private:
        std::deque<std::vector<std::uint8_t>>& inbox();
        std::deque<std::vector<std::uint8_t>>& outbox();

        std::shared_ptr<SharedState> state_;
        Side side_;
    };

    struct Pair {
        std::shared_ptr<Endpoint> client;
        std::shared_ptr<Endpoint> server;
    };

    static Pair create_pair();
};

} // namespace shared::transport
