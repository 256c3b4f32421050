#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace shared::transport {

// Raised by recv()/send() once the session is closed or the peer is gone.
class TransportClosed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unordered, lossy datagram channel to the server.
// send() may be called from any thread; recv() is owned by a single reader.
class IDatagramSession {
public:
    virtual ~IDatagramSession() = default;

    virtual void send(std::span<const std::uint8_t> datagram) = 0;

    // Blocks until a datagram arrives. Throws TransportClosed.
    virtual std::vector<std::uint8_t> recv() = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

} // namespace shared::transport
