#include "client_world.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace client::game {

namespace proto = shared::proto;

ClientWorld::Options ClientWorld::Options::from_config(const core::ClientConfig& cfg) {
    Options opts;
    opts.pixelScale = cfg.world.pixel_scale;
    opts.viewportRadiusX = cfg.world.viewport_radius_x;
    opts.viewportRadiusY = cfg.world.viewport_radius_y;
    if (cfg.world.screen_width > 0 && cfg.world.screen_height > 0) {
        const auto radius = world::viewport_radius_for(cfg.world.screen_width, cfg.world.screen_height,
                                                       cfg.world.pixel_scale);
        opts.viewportRadiusX = radius.x;
        opts.viewportRadiusY = radius.y;
    }
    opts.moveSpeed = cfg.world.move_speed;
    opts.maxChatMessages = static_cast<std::size_t>(std::max(1, cfg.chat.max_messages));
    return opts;
}

ClientWorld::ClientWorld(std::shared_ptr<net::ClientSession> session,
                         std::shared_ptr<net::SyncChannels> channels,
                         Options opts)
    : session_(std::move(session)),
      channels_(std::move(channels)),
      opts_(opts) {
    if (opts_.pixelScale <= 0.0f) {
        throw std::invalid_argument("pixel scale must be positive");
    }
    if (opts_.maxChatMessages == 0) {
        opts_.maxChatMessages = 1;
    }

    localPlayer_ = registry_.create();
    registry_.add(localPlayer_, component::kPosition, ecs::Position2D{});
    registry_.add(localPlayer_, component::kVelocity, ecs::Velocity2D{});
    registry_.add(localPlayer_, component::kAcceleration, ecs::Acceleration2D{});
    registry_.add(localPlayer_, component::kRotation, ecs::Rotation2D{});
    registry_.add(localPlayer_, component::kHealth, ecs::Health{});
    registry_.add(localPlayer_, component::kInventory, ecs::Inventory{});
    registry_.add(localPlayer_, component::kSelectedSlot, ecs::SelectedSlot{});
}

template <typename Fn>
bool ClientWorld::try_send_(const char* what, Fn&& fn) {
    if (!is_connected()) {
        return false;
    }
    try {
        fn();
        return true;
    } catch (const shared::transport::TransportClosed& e) {
        TraceLog(LOG_WARNING, "[world] %s not sent, connection closed: %s", what, e.what());
        channels_->status.mark_disconnected();
        return false;
    }
}

void ClientWorld::apply_welcome(const proto::Welcome& welcome) {
    playerId_ = welcome.playerId;
    worldWidth_ = welcome.worldWidth;
    worldHeight_ = welcome.worldHeight;
    set_local_position_(welcome.spawnX, welcome.spawnY);

    const auto& pos = position();
    TraceLog(LOG_INFO, "[world] local player %u spawned at (%.1f, %.1f) px", playerId_, pos.x, pos.y);
}

void ClientWorld::set_local_position_(float blockX, float blockY) {
    auto& pos = registry_.get<ecs::Position2D>(localPlayer_, component::kPosition);
    pos.x = blockX * opts_.pixelScale;
    pos.y = blockY * opts_.pixelScale;
    worldOrigin_ = -pos;
}

void ClientWorld::drain_and_apply() {
    for (auto& [key, value] : channels_->mailbox.take()) {
        if (key.kind != proto::MessageType::PlayerPositionUpdate || key.id != playerId_) {
            continue;
        }
        if (const auto* update = std::get_if<proto::PlayerPositionUpdate>(&value)) {
            set_local_position_(update->x, update->y);
        }
    }

    for (const auto& event : channels_->inbound.take()) {
        apply_event_(event);
    }
}

void ClientWorld::apply_event_(const proto::Message& msg) {
    if (const auto* chunk = std::get_if<proto::ChunkData>(&msg)) {
        chunks_.ingest_chunk_data(chunk->chunkX, chunk->chunkY, chunk->blocks);
    } else if (const auto* change = std::get_if<proto::BlockChanged>(&msg)) {
        chunks_.apply_block_change(change->x, change->y, change->blockId);
    } else if (const auto* batch = std::get_if<proto::BatchBlockChanged>(&msg)) {
        chunks_.apply_batch_block_change(batch->positions, batch->blockId);
    } else if (const auto* entered = std::get_if<proto::PlayerEnteredView>(&msg)) {
        on_player_entered_(*entered);
    } else if (const auto* left = std::get_if<proto::PlayerLeftView>(&msg)) {
        on_player_left_(*left);
    } else if (const auto* moved = std::get_if<proto::PlayerPositionUpdate>(&msg)) {
        on_player_moved_(*moved);
    } else if (const auto* inv = std::get_if<proto::InventoryUpdate>(&msg)) {
        on_inventory_(*inv);
    } else if (const auto* chat = std::get_if<proto::ChatBroadcast>(&msg)) {
        on_chat_(*chat);
    }
}

void ClientWorld::on_player_entered_(const proto::PlayerEnteredView& msg) {
    if (msg.playerId == playerId_) {
        return;
    }

    auto it = otherPlayers_.find(msg.playerId);
    ecs::Entity e = entt::null;
    if (it == otherPlayers_.end()) {
        e = registry_.create();
        otherPlayers_.emplace(msg.playerId, e);
    } else {
        e = it->second;
    }

    registry_.add(e, component::kPosition, ecs::Position2D{msg.x * opts_.pixelScale, msg.y * opts_.pixelScale});
    registry_.add(e, component::kVelocity, ecs::Velocity2D{});
}

void ClientWorld::on_player_left_(const proto::PlayerLeftView& msg) {
    auto it = otherPlayers_.find(msg.playerId);
    if (it == otherPlayers_.end()) {
        return;
    }
    registry_.destroy(it->second);
    otherPlayers_.erase(it);
}

void ClientWorld::on_player_moved_(const proto::PlayerPositionUpdate& msg) {
    // Updates for players outside the view are stale; the server sends
    // PlayerEnteredView before tracking resumes.
    auto it = otherPlayers_.find(msg.playerId);
    if (it == otherPlayers_.end()) {
        return;
    }

    auto& pos = registry_.get<ecs::Position2D>(it->second, component::kPosition);
    auto& vel = registry_.get<ecs::Velocity2D>(it->second, component::kVelocity);

    const ecs::Position2D next{msg.x * opts_.pixelScale, msg.y * opts_.pixelScale};
    const ecs::Position2D delta = next - pos;
    vel = ecs::Velocity2D{delta.x, delta.y};
    pos = next;
}

void ClientWorld::on_inventory_(const proto::InventoryUpdate& msg) {
    auto& inv = registry_.get<ecs::Inventory>(localPlayer_, component::kInventory);

    const std::size_t n = std::min(msg.slots.size(), inv.slots.size());
    for (std::size_t i = 0; i < n; ++i) {
        const auto& slot = msg.slots[i];
        if (!slot) {
            inv.slots[i] = ecs::ItemSlot{-1, 0};
            continue;
        }
        inv.slots[i] = ecs::ItemSlot{slot->item, static_cast<int>(slot->count)};
    }
}

void ClientWorld::on_chat_(const proto::ChatBroadcast& msg) {
    TraceLog(LOG_INFO, "[chat] [%s] %s", msg.sender.c_str(), msg.text.c_str());

    if (chatLog_.size() >= opts_.maxChatMessages) {
        chatLog_.pop_front();
    }
    chatLog_.push_back("[" + msg.sender + "] " + msg.text);
}

void ClientWorld::tick() {
    drain_and_apply();

    const world::ChunkCoord center = current_chunk();
    auto requests = chunks_.reconcile_viewport(center, opts_.viewportRadiusX, opts_.viewportRadiusY);

    if (!is_connected()) {
        return;
    }

    for (const auto& msg : requests) {
        if (!try_send_("chunk request", [&]() { session_->send(msg); })) {
            // The tick re-derives missing chunks every frame; nothing to retry.
            break;
        }
    }
}

void ClientWorld::move_horizontal(int direction, float dt) {
    if (!is_connected()) {
        return;
    }

    direction = std::clamp(direction, -1, 1);

    auto& pos = registry_.get<ecs::Position2D>(localPlayer_, component::kPosition);
    auto& vel = registry_.get<ecs::Velocity2D>(localPlayer_, component::kVelocity);

    const float vx = static_cast<float>(direction) * opts_.moveSpeed;
    vel.vx = vx * opts_.pixelScale;
    pos = ecs::integrate(pos, ecs::Velocity2D{vel.vx, 0.0f}, dt);
    worldOrigin_ = -pos;

    if (direction != prevDirection_) {
        prevDirection_ = direction;
        try_send_("velocity change", [&]() { session_->send_velocity_change(vx); });
    }
}

void ClientWorld::jump(bool held) {
    if (!is_connected()) {
        return;
    }

    if (held && !wasJumpHeld_) {
        try_send_("jump", [&]() { session_->send_jump(); });
    }
    wasJumpHeld_ = held;
}

bool ClientWorld::in_reach(int x, int y) const {
    const auto& pos = position();
    const float dx = static_cast<float>(x) - pos.x / opts_.pixelScale;
    const float dy = static_cast<float>(y) - pos.y / opts_.pixelScale;
    const float reach2 = shared::world::kBlockReachDistance * shared::world::kBlockReachDistance;

    // The player is two blocks tall: measure from the feet and the head.
    return (dx * dx + dy * dy) <= reach2 || (dx * dx + (dy - 1.0f) * (dy - 1.0f)) <= reach2;
}

bool ClientWorld::place_block(int x, int y) {
    if (x < 0 || y < 0 || !in_reach(x, y)) {
        return false;
    }
    return try_send_("place block", [&]() { session_->send_place_block(x, y); });
}

bool ClientWorld::break_block(int x, int y) {
    if (x < 0 || y < 0 || !in_reach(x, y)) {
        return false;
    }
    return try_send_("break block", [&]() { session_->send_break_block(x, y); });
}

bool ClientWorld::change_slot(int slot) {
    if (slot < 0 || slot >= static_cast<int>(shared::world::kInventorySlots)) {
        return false;
    }
    if (!is_connected()) {
        return false;
    }

    registry_.set_field(localPlayer_, component::kSelectedSlot, "slot", slot);
    return try_send_("slot change", [&]() { session_->send_change_slot(static_cast<std::uint8_t>(slot)); });
}

bool ClientWorld::send_chat(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    return try_send_("chat message", [&]() { session_->send_chat_message(text); });
}

const ecs::Position2D& ClientWorld::position() const {
    return registry_.get<ecs::Position2D>(localPlayer_, component::kPosition);
}

world::ChunkCoord ClientWorld::current_chunk() const {
    const auto& pos = position();
    return world::chunk_of_pixel(pos.x, pos.y, opts_.pixelScale);
}

const ecs::InventorySlots& ClientWorld::inventory() const {
    return registry_.get<ecs::Inventory>(localPlayer_, component::kInventory).slots;
}

int ClientWorld::selected_slot() const {
    return registry_.get<ecs::SelectedSlot>(localPlayer_, component::kSelectedSlot).slot;
}

std::optional<OtherPlayer> ClientWorld::other_player(proto::PlayerId id) const {
    auto it = otherPlayers_.find(id);
    if (it == otherPlayers_.end()) {
        return std::nullopt;
    }
    OtherPlayer out;
    out.position = registry_.get<ecs::Position2D>(it->second, component::kPosition);
    out.velocity = registry_.get<ecs::Velocity2D>(it->second, component::kVelocity);
    return out;
}

} // namespace client::game
