#include "chunk_store.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace world {

using shared::world::floor_div;
using shared::world::floor_mod;
using shared::world::kAirBlock;
using shared::world::kChunkEdge;

namespace {

// Local cell of a world position inside its chunk. The server lays cells out
// mirrored on both axes relative to world coordinates.
void local_cell(int x, int y, int& cx, int& cy) {
    cx = kChunkEdge - 1 - floor_mod(x, kChunkEdge);
    cy = kChunkEdge - 1 - floor_mod(y, kChunkEdge);
}

int clamp_chunk_index(float chunks) {
    if (std::isnan(chunks)) {
        return 0;
    }
    const double limit = static_cast<double>(kMaxChunkIndex);
    return static_cast<int>(std::clamp(std::floor(static_cast<double>(chunks)), -limit, limit));
}

} // namespace

ViewportRadius viewport_radius_for(int screen_width, int screen_height, float pixel_scale) {
    if (pixel_scale <= 0.0f) {
        return {};
    }
    const float divisor = 32.0f * pixel_scale;
    return ViewportRadius{
        static_cast<int>(std::ceil(static_cast<float>(screen_width) / divisor)),
        static_cast<int>(std::ceil(static_cast<float>(screen_height) / divisor)),
    };
}

ChunkCoord chunk_of_pixel(float px, float py, float pixel_scale) {
    const float span = static_cast<float>(kChunkEdge) * pixel_scale;
    return ChunkCoord{clamp_chunk_index(px / span), clamp_chunk_index(py / span)};
}

ChunkCoord chunk_of_block(int x, int y) {
    return ChunkCoord{floor_div(x, kChunkEdge), floor_div(y, kChunkEdge)};
}

void ChunkStore::ingest_chunk_data(int cx, int cy, std::span<const BlockId, shared::world::kChunkCells> blocks) {
    const ChunkCoord coord{cx, cy};
    if (!coord.is_fetchable()) {
        TraceLog(LOG_WARNING, "[world] ignoring chunk data for negative chunk (%d, %d)", cx, cy);
        return;
    }

    auto& slot = chunks_[coord];
    if (!slot) {
        slot = std::make_unique<Chunk>(coord);
    }
    slot->fill_from_wire(blocks);
}

void ChunkStore::apply_block_change(int x, int y, BlockId id) {
    Chunk* chunk = find_chunk(chunk_of_block(x, y));
    if (!chunk) {
        return;
    }

    int cx = 0;
    int cy = 0;
    local_cell(x, y, cx, cy);
    chunk->set_block(cx, cy, id);
}

void ChunkStore::apply_batch_block_change(std::span<const shared::proto::BlockPos> positions, BlockId id) {
    for (const auto& pos : positions) {
        apply_block_change(pos.x, pos.y, id);
    }
}

std::vector<shared::proto::Message> ChunkStore::reconcile_viewport(ChunkCoord center, int radius_x, int radius_y) {
    radius_x = std::max(0, radius_x);
    radius_y = std::max(0, radius_y);

    constexpr std::int64_t kIntMax = std::numeric_limits<int>::max();
    const std::int64_t min_x = static_cast<std::int64_t>(center.x) - radius_x;
    const std::int64_t max_x = std::min(static_cast<std::int64_t>(center.x) + radius_x, kIntMax);
    const std::int64_t min_y = static_cast<std::int64_t>(center.y) - radius_y;
    const std::int64_t max_y = std::min(static_cast<std::int64_t>(center.y) + radius_y, kIntMax);

    std::vector<shared::proto::Message> out;

    for (auto it = chunks_.begin(); it != chunks_.end();) {
        const ChunkCoord c = it->first;
        if (c.x < min_x || c.x > max_x || c.y < min_y || c.y > max_y) {
            out.emplace_back(shared::proto::UnloadChunk{c.x, c.y});
            it = chunks_.erase(it);
        } else {
            ++it;
        }
    }

    for (std::int64_t y = std::max<std::int64_t>(0, min_y); y <= max_y; ++y) {
        for (std::int64_t x = std::max<std::int64_t>(0, min_x); x <= max_x; ++x) {
            const ChunkCoord c{static_cast<int>(x), static_cast<int>(y)};
            if (chunks_.contains(c)) {
                continue;
            }
            chunks_.emplace(c, std::make_unique<Chunk>(c));
            out.emplace_back(shared::proto::RequestChunk{c.x, c.y});
        }
    }

    return out;
}

BlockId ChunkStore::get_block(int x, int y) const {
    if (x < 0 || y < 0) {
        return kAirBlock;
    }

    const Chunk* chunk = get_chunk(chunk_of_block(x, y));
    if (!chunk) {
        return kAirBlock;
    }

    int cx = 0;
    int cy = 0;
    local_cell(x, y, cx, cy);
    return chunk->get_block(cx, cy);
}

const Chunk* ChunkStore::get_chunk(ChunkCoord coord) const {
    auto it = chunks_.find(coord);
    return it != chunks_.end() ? it->second.get() : nullptr;
}

Chunk* ChunkStore::find_chunk(ChunkCoord coord) {
    auto it = chunks_.find(coord);
    return it != chunks_.end() ? it->second.get() : nullptr;
}

bool ChunkStore::contains(ChunkCoord coord) const {
    return chunks_.contains(coord);
}

bool ChunkStore::is_populated(ChunkCoord coord) const {
    const Chunk* chunk = get_chunk(coord);
    return chunk != nullptr && chunk->is_populated();
}

} // namespace world
