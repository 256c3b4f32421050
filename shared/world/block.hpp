#pragma once

#include <cstddef>
#include <cstdint>

namespace shared::world {

// Block ids are opaque to the client apart from Air, which is never drawn and
// is what any unloaded position reads as.
using BlockId = std::uint8_t;

inline constexpr BlockId kAirBlock = 0;

// Chunks are square grids of kChunkEdge x kChunkEdge cells.
inline constexpr int kChunkEdge = 16;
inline constexpr std::size_t kChunkCells = static_cast<std::size_t>(kChunkEdge) * kChunkEdge;

// Hotbar size; InventoryUpdate overwrites these slots positionally.
inline constexpr std::size_t kInventorySlots = 9;

// Interaction reach (in blocks) for place/break intents.
inline constexpr float kBlockReachDistance = 8.0f;

// Floor division so that negative world coordinates map to negative chunks.
constexpr int floor_div(int a, int b) {
    const int q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

// Always in [0, b) for positive b.
constexpr int floor_mod(int a, int b) {
    const int r = a % b;
    return r < 0 ? r + b : r;
}

} // namespace shared::world
