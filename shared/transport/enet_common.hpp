#pragma once

#include <cstddef>
#include <cstdint>

namespace shared::transport {

// =============================================================================
// ENetInitializer - RAII wrapper for enet_initialize/enet_deinitialize
// =============================================================================

class ENetInitializer {
public:
    ENetInitializer();
    ~ENetInitializer();

    ENetInitializer(const ENetInitializer&) = delete;
    ENetInitializer& operator=(const ENetInitializer&) = delete;

    bool is_initialized() const { return initialized_; }

private:
    bool initialized_{false};
};

// Every message travels unsequenced on a single channel, so the session
// behaves like plain UDP: no retransmission, no ordering.
enum class ENetChannel : std::uint8_t {
    Datagram = 0,

    Count = 1
};

namespace config {
    constexpr std::uint16_t kDefaultPort = 8475;
    constexpr std::uint32_t kConnectionTimeoutMs = 5000;
    // Upper bound on how long recv() holds the host lock per service call.
    constexpr std::uint32_t kServiceSliceMs = 2;
    constexpr std::uint32_t kDisconnectWaitMs = 100;
}

} // namespace shared::transport
