#include "serialization.hpp"

#include <engine/core/byte_buffer.hpp>

#include <cmath>
#include <string>
#include <type_traits>

namespace shared::proto {

namespace {

template <typename T>
constexpr MessageType tag_of() {
    if constexpr (std::is_same_v<T, Hello>) return MessageType::Hello;
    else if constexpr (std::is_same_v<T, Welcome>) return MessageType::Welcome;
    else if constexpr (std::is_same_v<T, RequestChunk>) return MessageType::RequestChunk;
    else if constexpr (std::is_same_v<T, ChunkData>) return MessageType::ChunkData;
    else if constexpr (std::is_same_v<T, UnloadChunk>) return MessageType::UnloadChunk;
    else if constexpr (std::is_same_v<T, PlayerJoined>) return MessageType::PlayerJoined;
    else if constexpr (std::is_same_v<T, PlayerEnteredView>) return MessageType::PlayerEnteredView;
    else if constexpr (std::is_same_v<T, PlayerLeftView>) return MessageType::PlayerLeftView;
    else if constexpr (std::is_same_v<T, PlayerLeft>) return MessageType::PlayerLeft;
    else if constexpr (std::is_same_v<T, Goodbye>) return MessageType::Goodbye;
    else if constexpr (std::is_same_v<T, PlaceBlock>) return MessageType::PlaceBlock;
    else if constexpr (std::is_same_v<T, BlockChanged>) return MessageType::BlockChanged;
    else if constexpr (std::is_same_v<T, PlayerVelocityChange>) return MessageType::PlayerVelocityChange;
    else if constexpr (std::is_same_v<T, PlayerJump>) return MessageType::PlayerJump;
    else if constexpr (std::is_same_v<T, PlayerPositionUpdate>) return MessageType::PlayerPositionUpdate;
    else if constexpr (std::is_same_v<T, Kick>) return MessageType::Kick;
    else if constexpr (std::is_same_v<T, HeartbeatPing>) return MessageType::HeartbeatPing;
    else if constexpr (std::is_same_v<T, Heartbeat>) return MessageType::Heartbeat;
    else if constexpr (std::is_same_v<T, BreakBlock>) return MessageType::BreakBlock;
    else if constexpr (std::is_same_v<T, BatchBlockChanged>) return MessageType::BatchBlockChanged;
    else if constexpr (std::is_same_v<T, InventoryUpdate>) return MessageType::InventoryUpdate;
    else if constexpr (std::is_same_v<T, ChangeSlot>) return MessageType::ChangeSlot;
    else if constexpr (std::is_same_v<T, SendChatMessage>) return MessageType::SendChatMessage;
    else {
        static_assert(std::is_same_v<T, ChatBroadcast>, "message kind without a wire tag");
        return MessageType::ChatBroadcast;
    }
}

// Positions and velocities feed integer chunk math on the client; NaN and
// infinity never come from a well-behaved server.
float read_finite_f32(engine::ByteReader& r, const char* field) {
    const float v = r.read_f32();
    if (!std::isfinite(v)) {
        throw MalformedMessage(std::string("non-finite ") + field);
    }
    return v;
}

Message read_body(MessageType type, engine::ByteReader& r) {
    switch (type) {
        // --- Session ---
        case MessageType::Hello: {
            Hello m;
            m.name = r.read_string();
            return m;
        }
        case MessageType::Welcome: {
            Welcome m;
            m.playerId = r.read_u32();
            m.worldWidth = r.read_u32();
            m.worldHeight = r.read_u32();
            m.chunkSize = r.read_u32();
            m.spawnX = read_finite_f32(r, "spawn x");
            m.spawnY = read_finite_f32(r, "spawn y");
            return m;
        }
        case MessageType::Goodbye:
            return Goodbye{};
        case MessageType::Kick: {
            Kick m;
            m.reason = r.read_string();
            return m;
        }
        case MessageType::HeartbeatPing:
            return HeartbeatPing{};
        case MessageType::Heartbeat:
            return Heartbeat{};

        // --- Chunks ---
        case MessageType::RequestChunk: {
            RequestChunk m;
            m.chunkX = r.read_i32();
            m.chunkY = r.read_i32();
            return m;
        }
        case MessageType::UnloadChunk: {
            UnloadChunk m;
            m.chunkX = r.read_i32();
            m.chunkY = r.read_i32();
            return m;
        }
        case MessageType::ChunkData: {
            ChunkData m;
            m.chunkX = r.read_i32();
            m.chunkY = r.read_i32();
            const std::size_t count = r.read_u16();
            if (count != m.blocks.size()) {
                throw MalformedMessage("ChunkData: expected " + std::to_string(m.blocks.size()) +
                                       " blocks, got " + std::to_string(count));
            }
            const auto raw = r.read_bytes(count);
            for (std::size_t i = 0; i < count; ++i) {
                m.blocks[i] = raw[i];
            }
            return m;
        }

        // --- Players ---
        case MessageType::PlayerJoined: {
            PlayerJoined m;
            m.playerId = r.read_u32();
            m.name = r.read_string();
            return m;
        }
        case MessageType::PlayerLeft: {
            PlayerLeft m;
            m.playerId = r.read_u32();
            m.name = r.read_string();
            return m;
        }
        case MessageType::PlayerEnteredView: {
            PlayerEnteredView m;
            m.playerId = r.read_u32();
            m.x = read_finite_f32(r, "x");
            m.y = read_finite_f32(r, "y");
            return m;
        }
        case MessageType::PlayerLeftView: {
            PlayerLeftView m;
            m.playerId = r.read_u32();
            return m;
        }
        case MessageType::PlayerPositionUpdate: {
            PlayerPositionUpdate m;
            m.playerId = r.read_u32();
            m.x = read_finite_f32(r, "x");
            m.y = read_finite_f32(r, "y");
            return m;
        }
        case MessageType::PlayerVelocityChange: {
            PlayerVelocityChange m;
            m.vx = read_finite_f32(r, "vx");
            return m;
        }
        case MessageType::PlayerJump:
            return PlayerJump{};

        // --- Blocks ---
        case MessageType::PlaceBlock: {
            PlaceBlock m;
            m.x = r.read_i32();
            m.y = r.read_i32();
            return m;
        }
        case MessageType::BreakBlock: {
            BreakBlock m;
            m.x = r.read_i32();
            m.y = r.read_i32();
            return m;
        }
        case MessageType::BlockChanged: {
            BlockChanged m;
            m.x = r.read_i32();
            m.y = r.read_i32();
            m.blockId = r.read_u8();
            return m;
        }
        case MessageType::BatchBlockChanged: {
            BatchBlockChanged m;
            const std::size_t count = r.read_count(kMaxBatchPositions);
            m.positions.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                BlockPos p;
                p.x = r.read_i32();
                p.y = r.read_i32();
                m.positions.push_back(p);
            }
            m.blockId = r.read_u8();
            return m;
        }

        // --- Inventory / chat ---
        case MessageType::InventoryUpdate: {
            InventoryUpdate m;
            const std::size_t count = r.read_count(kMaxInventorySlots);
            m.slots.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                if (!r.read_bool()) {
                    m.slots.emplace_back(std::nullopt);
                    continue;
                }
                ItemStack stack;
                stack.item = r.read_i32();
                stack.count = r.read_u16();
                m.slots.emplace_back(stack);
            }
            return m;
        }
        case MessageType::ChangeSlot: {
            ChangeSlot m;
            m.slot = r.read_u8();
            return m;
        }
        case MessageType::SendChatMessage: {
            SendChatMessage m;
            m.text = r.read_string();
            return m;
        }
        case MessageType::ChatBroadcast: {
            ChatBroadcast m;
            m.sender = r.read_string();
            m.text = r.read_string();
            return m;
        }
    }

    throw MalformedMessage("unknown message tag " + std::to_string(static_cast<unsigned>(type)));
}

} // namespace

// ============================================================================
// Encode
// ============================================================================

std::vector<std::uint8_t> encode(const Message& msg) {
    engine::ByteWriter w;

    std::visit([&w](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        w.write_u8(static_cast<std::uint8_t>(tag_of<T>()));

        // --- Session ---
        if constexpr (std::is_same_v<T, Hello>) {
            w.write_string(m.name);
        }
        else if constexpr (std::is_same_v<T, Welcome>) {
            w.write_u32(m.playerId);
            w.write_u32(m.worldWidth);
            w.write_u32(m.worldHeight);
            w.write_u32(m.chunkSize);
            w.write_f32(m.spawnX);
            w.write_f32(m.spawnY);
        }
        else if constexpr (std::is_same_v<T, Kick>) {
            w.write_string(m.reason);
        }
        // --- Chunks ---
        else if constexpr (std::is_same_v<T, RequestChunk> || std::is_same_v<T, UnloadChunk>) {
            w.write_i32(m.chunkX);
            w.write_i32(m.chunkY);
        }
        else if constexpr (std::is_same_v<T, ChunkData>) {
            w.write_i32(m.chunkX);
            w.write_i32(m.chunkY);
            w.write_count(m.blocks.size());
            w.write_bytes(m.blocks);
        }
        // --- Players ---
        else if constexpr (std::is_same_v<T, PlayerJoined> || std::is_same_v<T, PlayerLeft>) {
            w.write_u32(m.playerId);
            w.write_string(m.name);
        }
        else if constexpr (std::is_same_v<T, PlayerEnteredView> || std::is_same_v<T, PlayerPositionUpdate>) {
            w.write_u32(m.playerId);
            w.write_f32(m.x);
            w.write_f32(m.y);
        }
        else if constexpr (std::is_same_v<T, PlayerLeftView>) {
            w.write_u32(m.playerId);
        }
        else if constexpr (std::is_same_v<T, PlayerVelocityChange>) {
            w.write_f32(m.vx);
        }
        // --- Blocks ---
        else if constexpr (std::is_same_v<T, PlaceBlock> || std::is_same_v<T, BreakBlock>) {
            w.write_i32(m.x);
            w.write_i32(m.y);
        }
        else if constexpr (std::is_same_v<T, BlockChanged>) {
            w.write_i32(m.x);
            w.write_i32(m.y);
            w.write_u8(m.blockId);
        }
        else if constexpr (std::is_same_v<T, BatchBlockChanged>) {
            w.write_count(m.positions.size());
            for (const auto& p : m.positions) {
                w.write_i32(p.x);
                w.write_i32(p.y);
            }
            w.write_u8(m.blockId);
        }
        // --- Inventory / chat ---
        else if constexpr (std::is_same_v<T, InventoryUpdate>) {
            w.write_count(m.slots.size());
            for (const auto& slot : m.slots) {
                w.write_bool(slot.has_value());
                if (slot) {
                    w.write_i32(slot->item);
                    w.write_u16(slot->count);
                }
            }
        }
        else if constexpr (std::is_same_v<T, ChangeSlot>) {
            w.write_u8(m.slot);
        }
        else if constexpr (std::is_same_v<T, SendChatMessage>) {
            w.write_string(m.text);
        }
        else if constexpr (std::is_same_v<T, ChatBroadcast>) {
            w.write_string(m.sender);
            w.write_string(m.text);
        }
        // Goodbye, Heartbeat, HeartbeatPing, PlayerJump: tag only.
    }, msg);

    return w.take();
}

// ============================================================================
// Decode
// ============================================================================

Message decode(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        throw MalformedMessage("empty datagram");
    }

    engine::ByteReader r(data);
    const auto type = static_cast<MessageType>(r.read_u8());
    try {
        return read_body(type, r);
    } catch (const engine::BufferUnderflow& e) {
        throw MalformedMessage(std::string(message_name(type)) + ": " + e.what());
    }
}

std::optional<Message> try_decode(std::span<const std::uint8_t> data) {
    try {
        return decode(data);
    } catch (const MalformedMessage&) {
        return std::nullopt;
    }
}

MessageType message_type(const Message& msg) {
    return std::visit([](const auto& m) {
        return tag_of<std::decay_t<decltype(m)>>();
    }, msg);
}

std::string_view message_name(MessageType type) {
    switch (type) {
        case MessageType::Hello: return "Hello";
        case MessageType::Welcome: return "Welcome";
        case MessageType::RequestChunk: return "RequestChunk";
        case MessageType::ChunkData: return "ChunkData";
        case MessageType::UnloadChunk: return "UnloadChunk";
        case MessageType::PlayerJoined: return "PlayerJoined";
        case MessageType::PlayerEnteredView: return "PlayerEnteredView";
        case MessageType::PlayerLeftView: return "PlayerLeftView";
        case MessageType::PlayerLeft: return "PlayerLeft";
        case MessageType::Goodbye: return "Goodbye";
        case MessageType::PlaceBlock: return "PlaceBlock";
        case MessageType::BlockChanged: return "BlockChanged";
        case MessageType::PlayerVelocityChange: return "PlayerVelocityChange";
        case MessageType::PlayerJump: return "PlayerJump";
        case MessageType::PlayerPositionUpdate: return "PlayerPositionUpdate";
        case MessageType::Kick: return "Kick";
        case MessageType::HeartbeatPing: return "HeartbeatPing";
        case MessageType::Heartbeat: return "Heartbeat";
        case MessageType::BreakBlock: return "BreakBlock";
        case MessageType::BatchBlockChanged: return "BatchBlockChanged";
        case MessageType::InventoryUpdate: return "InventoryUpdate";
        case MessageType::ChangeSlot: return "ChangeSlot";
        case MessageType::SendChatMessage: return "SendChatMessage";
        case MessageType::ChatBroadcast: return "ChatBroadcast";
    }
    return "Unknown";
}

} // namespace shared::proto
