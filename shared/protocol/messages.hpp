#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../world/block.hpp"

namespace shared::proto {

using PlayerId = std::uint32_t;
using shared::world::BlockId;

// Wire tags. Values must never change (binary protocol compatibility); new
// kinds are appended.
enum class MessageType : std::uint8_t {
    Hello = 1,
    Welcome = 2,
    RequestChunk = 3,
    ChunkData = 4,
    UnloadChunk = 5,
    PlayerJoined = 6,
    PlayerEnteredView = 7,
    PlayerLeftView = 8,
    PlayerLeft = 9,
    Goodbye = 10,
    PlaceBlock = 11,
    BlockChanged = 12,
    PlayerVelocityChange = 13,
    PlayerJump = 14,
    PlayerPositionUpdate = 15,
    Kick = 16,
    HeartbeatPing = 17,
    Heartbeat = 18,
    BreakBlock = 19,
    BatchBlockChanged = 20,
    InventoryUpdate = 21,
    ChangeSlot = 22,
    SendChatMessage = 23,
    ChatBroadcast = 24,
};

// Upper bounds enforced while decoding list payloads.
inline constexpr std::size_t kMaxBatchPositions = 4096;
inline constexpr std::size_t kMaxInventorySlots = 64;

// ============================================================================
// Client -> Server
// ============================================================================

struct Hello {
    std::string name;
};

struct Goodbye {
};

// Reply to HeartbeatPing.
struct Heartbeat {
};

struct RequestChunk {
    std::int32_t chunkX{0};
    std::int32_t chunkY{0};
};

struct UnloadChunk {
    std::int32_t chunkX{0};
    std::int32_t chunkY{0};
};

// World-space block coordinates.
struct PlaceBlock {
    std::int32_t x{0};
    std::int32_t y{0};
};

struct BreakBlock {
    std::int32_t x{0};
    std::int32_t y{0};
};

// Horizontal velocity in blocks per second; sent on direction change only.
struct PlayerVelocityChange {
    float vx{0.0f};
};

struct PlayerJump {
};

struct ChangeSlot {
    std::uint8_t slot{0};
};

struct SendChatMessage {
    std::string text;
};

// ============================================================================
// Server -> Client
// ============================================================================

// Handshake reply to Hello. Spawn is in block units.
struct Welcome {
    PlayerId playerId{0};
    std::uint32_t worldWidth{0};
    std::uint32_t worldHeight{0};
    std::uint32_t chunkSize{static_cast<std::uint32_t>(shared::world::kChunkEdge)};
    float spawnX{0.0f};
    float spawnY{0.0f};
};

struct Kick {
    std::string reason;
};

struct HeartbeatPing {
};

// Blocks arrive in the server's order; see world::ChunkStore::ingest_chunk_data
// for how they map onto cells.
struct ChunkData {
    std::int32_t chunkX{0};
    std::int32_t chunkY{0};
    std::array<BlockId, shared::world::kChunkCells> blocks{};
};

struct PlayerPositionUpdate {
    PlayerId playerId{0};
    float x{0.0f};
    float y{0.0f};
};

struct PlayerEnteredView {
    PlayerId playerId{0};
    float x{0.0f};
    float y{0.0f};
};

struct PlayerLeftView {
    PlayerId playerId{0};
};

// Server-wide join/leave notices (not tied to the viewport).
struct PlayerJoined {
    PlayerId playerId{0};
    std::string name;
};

struct PlayerLeft {
    PlayerId playerId{0};
    std::string name;
};

struct BlockChanged {
    std::int32_t x{0};
    std::int32_t y{0};
    BlockId blockId{shared::world::kAirBlock};
};

struct BlockPos {
    std::int32_t x{0};
    std::int32_t y{0};
};

struct BatchBlockChanged {
    std::vector<BlockPos> positions;
    BlockId blockId{shared::world::kAirBlock};
};

struct ItemStack {
    std::int32_t item{-1};
    std::uint16_t count{0};
};

// One entry per hotbar slot; std::nullopt clears the slot.
struct InventoryUpdate {
    std::vector<std::optional<ItemStack>> slots;
};

struct ChatBroadcast {
    std::string sender;
    std::string text;
};

using Message = std::variant<
    Hello,
    Welcome,
    RequestChunk,
    ChunkData,
    UnloadChunk,
    PlayerJoined,
    PlayerEnteredView,
    PlayerLeftView,
    PlayerLeft,
    Goodbye,
    PlaceBlock,
    BlockChanged,
    PlayerVelocityChange,
    PlayerJump,
    PlayerPositionUpdate,
    Kick,
    HeartbeatPing,
    Heartbeat,
    BreakBlock,
    BatchBlockChanged,
    InventoryUpdate,
    ChangeSlot,
    SendChatMessage,
    ChatBroadcast
>;

} // namespace shared::proto
