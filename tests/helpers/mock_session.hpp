#pragma once

/**
 * @file mock_session.hpp
 * @brief Scripted datagram session for testing.
 *
 * Lets tests drive components that depend on IDatagramSession without a
 * second thread or a real socket.
 */

#include "transport/datagram_session.hpp"
#include "protocol/messages.hpp"
#include "protocol/serialization.hpp"

#include <deque>
#include <mutex>
#include <vector>

namespace test_helpers {

/**
 * @brief Session that records outgoing datagrams and replays injected ones.
 *
 * recv() never blocks: once the injected datagrams are used up it throws
 * TransportClosed, which ends any receive loop under test.
 *
 * Usage:
 *   auto session = std::make_shared<MockSession>();
 *   session->inject_message(Welcome{});      // Simulate incoming
 *   component.run(session);
 *   REQUIRE(session->sent().size() == 1);    // Check outgoing
 */
class MockSession final : public shared::transport::IDatagramSession {
public:
    void send(std::span<const std::uint8_t> datagram) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || fail_sends_) {
            throw shared::transport::TransportClosed("mock session closed");
        }
        sent_.push_back(shared::proto::decode(datagram));
    }

    std::vector<std::uint8_t> recv() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (incoming_.empty()) {
            throw shared::transport::TransportClosed("mock session drained");
        }
        auto out = std::move(incoming_.front());
        incoming_.pop_front();
        return out;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_;
    }

    // =========================================================================
    // Test helpers
    // =========================================================================

    /** @brief Queue a message to be returned by recv(). */
    void inject_message(const shared::proto::Message& msg) {
        inject_raw(shared::proto::encode(msg));
    }

    /** @brief Queue raw bytes (e.g. a malformed datagram). */
    void inject_raw(std::vector<std::uint8_t> bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        incoming_.push_back(std::move(bytes));
    }

    /** @brief Make every following send() throw TransportClosed. */
    void fail_sends() {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = true;
    }

    /** @brief Messages sent by the component under test, decoded. */
    std::vector<shared::proto::Message> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::size_t sent_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

    void clear_sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::vector<std::uint8_t>> incoming_;
    std::vector<shared::proto::Message> sent_;
    bool closed_{false};
    bool fail_sends_{false};
};

} // namespace test_helpers
