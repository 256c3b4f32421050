#pragma once

#include "messages.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace shared::proto {

// Decoding failure: unknown tag, truncated payload or a field that violates
// its schema. The offending datagram is dropped by the caller.
class MalformedMessage : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Serialization
// ============================================================================

/// Encode a message as tag byte + ordered fields.
std::vector<std::uint8_t> encode(const Message& msg);

/// Decode one datagram. Throws MalformedMessage on any schema violation.
/// Bytes following the last known field are ignored.
Message decode(std::span<const std::uint8_t> data);

/// Same as decode() but returns std::nullopt instead of throwing.
std::optional<Message> try_decode(std::span<const std::uint8_t> data);

MessageType message_type(const Message& msg);
std::string_view message_name(MessageType type);

} // namespace shared::proto
