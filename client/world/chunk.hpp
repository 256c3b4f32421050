#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <span>

#include "../../shared/world/block.hpp"

namespace world {

using shared::world::BlockId;

struct ChunkCoord {
    int x{0};
    int y{0};

    bool is_fetchable() const { return x >= 0 && y >= 0; }

    friend bool operator==(const ChunkCoord&, const ChunkCoord&) = default;
};

struct ChunkCoordHash {
    std::size_t operator()(const ChunkCoord& coord) const {
        return std::hash<int>()(coord.x) ^ (std::hash<int>()(coord.y) << 16);
    }
};

// 16x16 grid of block ids in chunk-local (cx, cy) cells. A chunk starts as an
// all-air placeholder and becomes populated once its ChunkData arrives.
class Chunk {
public:
    explicit Chunk(ChunkCoord coord);

    // Non-copyable
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    BlockId get_block(int cx, int cy) const;
    void set_block(int cx, int cy, BlockId id);

    // Replaces every cell from a server payload. Cell (i % 16, i / 16)
    // receives blocks[255 - i].
    void fill_from_wire(std::span<const BlockId, shared::world::kChunkCells> blocks);

    ChunkCoord coord() const { return coord_; }
    bool is_populated() const { return populated_; }

    static bool is_valid_cell(int cx, int cy);

private:
    static std::size_t get_index(int cx, int cy);

    ChunkCoord coord_{};
    std::array<BlockId, shared::world::kChunkCells> blocks_{};
    bool populated_{false};
};

} // namespace world
