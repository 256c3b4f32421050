#include "chunk.hpp"

namespace world {

using shared::world::kAirBlock;
using shared::world::kChunkCells;
using shared::world::kChunkEdge;

Chunk::Chunk(ChunkCoord coord) : coord_(coord) {
    blocks_.fill(kAirBlock);
}

bool Chunk::is_valid_cell(int cx, int cy) {
    return cx >= 0 && cx < kChunkEdge && cy >= 0 && cy < kChunkEdge;
}

std::size_t Chunk::get_index(int cx, int cy) {
    return static_cast<std::size_t>(cy) * kChunkEdge + static_cast<std::size_t>(cx);
}

BlockId Chunk::get_block(int cx, int cy) const {
    if (!is_valid_cell(cx, cy)) {
        return kAirBlock;
    }
    return blocks_[get_index(cx, cy)];
}

void Chunk::set_block(int cx, int cy, BlockId id) {
    if (!is_valid_cell(cx, cy)) {
        return;
    }
    blocks_[get_index(cx, cy)] = id;
}

void Chunk::fill_from_wire(std::span<const BlockId, kChunkCells> blocks) {
    for (std::size_t i = 0; i < kChunkCells; ++i) {
        const int cx = static_cast<int>(i % kChunkEdge);
        const int cy = static_cast<int>(i / kChunkEdge);
        blocks_[get_index(cx, cy)] = blocks[kChunkCells - 1 - i];
    }
    populated_ = true;
}

} // namespace world
