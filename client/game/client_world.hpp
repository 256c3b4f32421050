#pragma once

#include "../core/config.hpp"
#include "../ecs/components.hpp"
#include "../ecs/entity_registry.hpp"
#include "../net/client_session.hpp"
#include "../net/sync_channels.hpp"
#include "../world/chunk_store.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace client::game {

// Component names used for every player entity.
namespace component {
    inline constexpr std::string_view kPosition = "position";
    inline constexpr std::string_view kVelocity = "velocity";
    inline constexpr std::string_view kAcceleration = "acceleration";
    inline constexpr std::string_view kRotation = "rotation";
    inline constexpr std::string_view kHealth = "health";
    inline constexpr std::string_view kInventory = "inventory";
    inline constexpr std::string_view kSelectedSlot = "selected_slot";
}

// Remote player as last reported by the server. Stored in pixels like the
// local player; velocity is the displacement between the last two updates.
struct OtherPlayer {
    ecs::Position2D position{};
    ecs::Velocity2D velocity{};
};

// Simulation-side state of one connection. Only the tick thread calls into
// this class; the receiver feeds it through SyncChannels.
class ClientWorld {
public:
    struct Options {
        float pixelScale{25.0f};
        int viewportRadiusX{2};
        int viewportRadiusY{2};
        float moveSpeed{5.0f};
        std::size_t maxChatMessages{50};

        static Options from_config(const core::ClientConfig& cfg);
    };

    ClientWorld(std::shared_ptr<net::ClientSession> session,
                std::shared_ptr<net::SyncChannels> channels,
                Options opts);

    ClientWorld(const ClientWorld&) = delete;
    ClientWorld& operator=(const ClientWorld&) = delete;

    // Adopts the handshake result: local id, spawn position and world size.
    void apply_welcome(const shared::proto::Welcome& welcome);

    // Applies everything the receiver posted since the last call: the
    // mailbox first, then queued world events in arrival order.
    void drain_and_apply();

    // drain_and_apply() followed by viewport streaming around the local
    // player's chunk.
    void tick();

    // ------------------------------------------------------------------------
    // Intents. All of them are no-ops once the connection is gone.
    // ------------------------------------------------------------------------

    // direction: -1 left, 0 idle, 1 right. Moves the local prediction and
    // reports velocity only when the direction changes.
    void move_horizontal(int direction, float dt);

    // Edge-triggered: a jump is sent when `held` goes from false to true.
    void jump(bool held);

    // World block coordinates. Return false if rejected locally (negative
    // coordinates, out of reach, disconnected).
    bool place_block(int x, int y);
    bool break_block(int x, int y);

    bool change_slot(int slot);
    bool send_chat(const std::string& text);

    // ------------------------------------------------------------------------
    // Read side (renderer / UI)
    // ------------------------------------------------------------------------

    bool is_connected() const { return channels_->status.is_active(); }

    shared::proto::PlayerId player_id() const { return playerId_; }
    std::uint32_t world_width() const { return worldWidth_; }
    std::uint32_t world_height() const { return worldHeight_; }

    ecs::Entity local_player() const { return localPlayer_; }
    const ecs::Position2D& position() const;
    const ecs::Position2D& world_origin() const { return worldOrigin_; }
    world::ChunkCoord current_chunk() const;

    const ecs::InventorySlots& inventory() const;
    int selected_slot() const;

    bool in_reach(int x, int y) const;

    std::optional<OtherPlayer> other_player(shared::proto::PlayerId id) const;
    std::size_t other_player_count() const { return otherPlayers_.size(); }

    const std::deque<std::string>& chat_log() const { return chatLog_; }

    const world::ChunkStore& chunks() const { return chunks_; }
    world::ChunkStore& chunks() { return chunks_; }
    ecs::EntityRegistry& registry() { return registry_; }
    const Options& options() const { return opts_; }

private:
    void apply_event_(const shared::proto::Message& msg);
    void set_local_position_(float blockX, float blockY);

    void on_player_entered_(const shared::proto::PlayerEnteredView& msg);
    void on_player_left_(const shared::proto::PlayerLeftView& msg);
    void on_player_moved_(const shared::proto::PlayerPositionUpdate& msg);
    void on_inventory_(const shared::proto::InventoryUpdate& msg);
    void on_chat_(const shared::proto::ChatBroadcast& msg);

    // Sends and reports success; a closed transport marks the connection
    // disconnected.
    template <typename Fn>
    bool try_send_(const char* what, Fn&& fn);

    std::shared_ptr<net::ClientSession> session_;
    std::shared_ptr<net::SyncChannels> channels_;
    Options opts_{};

    world::ChunkStore chunks_;
    ecs::EntityRegistry registry_;
    ecs::Entity localPlayer_{entt::null};
    ecs::Position2D worldOrigin_{};

    shared::proto::PlayerId playerId_{0};
    std::uint32_t worldWidth_{0};
    std::uint32_t worldHeight_{0};

    int prevDirection_{0};
    bool wasJumpHeld_{false};

    std::unordered_map<shared::proto::PlayerId, ecs::Entity> otherPlayers_;
    std::deque<std::string> chatLog_;
};

} // namespace client::game
