#pragma once

#include "chunk.hpp"

#include <limits>
#include <memory>
#include <span>
#include <unordered_map>
#include <vector>

#include "../../shared/protocol/messages.hpp"

namespace world {

// Screen-space chunk radius needed to cover a window, the way the 2D view
// frames it: ceil(extent / 32 / pixel_scale) per axis.
struct ViewportRadius {
    int x{0};
    int y{0};
};

ViewportRadius viewport_radius_for(int screen_width, int screen_height, float pixel_scale);

// Largest chunk index chunk_of_pixel() reports on either axis. Points further
// out are clamped to it and NaN maps to chunk 0.
inline constexpr int kMaxChunkIndex = std::numeric_limits<int>::max() / 2;

// Chunk holding a pixel-space point (pixel_scale pixels per block).
ChunkCoord chunk_of_pixel(float px, float py, float pixel_scale);

// Chunk holding a block-space position.
ChunkCoord chunk_of_block(int x, int y);

// Local mirror of the server's chunked world. Absence of a chunk means air.
// Owned by the simulation tick; not thread-safe.
class ChunkStore {
public:
    ChunkStore() = default;

    // Non-copyable
    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    // Replaces (or creates) the chunk at (cx, cy) from a server payload.
    void ingest_chunk_data(int cx, int cy, std::span<const BlockId, shared::world::kChunkCells> blocks);

    // Writes one block in world coordinates. No-op if the owning chunk is
    // not loaded.
    void apply_block_change(int x, int y, BlockId id);
    void apply_batch_block_change(std::span<const shared::proto::BlockPos> positions, BlockId id);

    // Unloads chunks outside [center - r, center + r] on either axis and
    // requests every absent, non-negative chunk inside it. Returns the
    // UnloadChunk / RequestChunk messages to send, unloads first.
    std::vector<shared::proto::Message> reconcile_viewport(ChunkCoord center, int radius_x, int radius_y);

    BlockId get_block(int x, int y) const;

    const Chunk* get_chunk(ChunkCoord coord) const;
    bool contains(ChunkCoord coord) const;
    bool is_populated(ChunkCoord coord) const;
    std::size_t size() const { return chunks_.size(); }

    void clear() { chunks_.clear(); }

private:
    Chunk* find_chunk(ChunkCoord coord);

    using ChunkMap = std::unordered_map<ChunkCoord, std::unique_ptr<Chunk>, ChunkCoordHash>;
    ChunkMap chunks_;
};

} // namespace world
