/**
 * @file test_chunk_store.cpp
 * @brief Chunk ingestion, block changes and viewport streaming.
 */

#include <catch2/catch_test_macros.hpp>

#include "client/world/chunk_store.hpp"

#include "test_utils.hpp"

#include <limits>
#include <variant>

using namespace world;
using namespace shared::proto;
using namespace test_helpers;

namespace {

// Populates a chunk with a uniform block id.
void load_uniform(ChunkStore& store, int cx, int cy, BlockId id) {
    const auto chunk = make_chunk_data(cx, cy, id);
    store.ingest_chunk_data(cx, cy, chunk.blocks);
}

bool has_negative_coord(const Message& msg) {
    if (const auto* req = std::get_if<RequestChunk>(&msg)) {
        return req->chunkX < 0 || req->chunkY < 0;
    }
    if (const auto* unload = std::get_if<UnloadChunk>(&msg)) {
        return unload->chunkX < 0 || unload->chunkY < 0;
    }
    return false;
}

} // namespace

// =============================================================================
// Ingestion
// =============================================================================

TEST_CASE("Chunk payload is stored index-reversed", "[world][chunks]") {
    ChunkStore store;
    const auto blocks = make_sequential_blocks();
    store.ingest_chunk_data(0, 0, blocks);

    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            const Chunk* chunk = store.get_chunk({0, 0});
            REQUIRE(chunk != nullptr);
            REQUIRE(chunk->get_block(x, y) == blocks[255 - (y * 16 + x)]);
        }
    }
    REQUIRE(store.is_populated({0, 0}));
}

TEST_CASE("World lookups apply the axis mirror", "[world][chunks]") {
    ChunkStore store;
    const auto blocks = make_sequential_blocks();
    store.ingest_chunk_data(1, 0, blocks);

    // World (16, 0) is local cell (15, 15) of chunk (1, 0), i.e. wire index 0.
    REQUIRE(store.get_block(16, 0) == blocks[0]);
    // World (31, 15) is local cell (0, 0), wire index 255.
    REQUIRE(store.get_block(31, 15) == blocks[255]);
}

TEST_CASE("Negative chunk data is ignored", "[world][chunks]") {
    ChunkStore store;
    load_uniform(store, -1, 0, 4);
    REQUIRE(store.size() == 0);
}

// =============================================================================
// get_block
// =============================================================================

TEST_CASE("Unloaded and negative positions read as air", "[world][chunks]") {
    ChunkStore store;
    load_uniform(store, 0, 0, 7);

    REQUIRE(store.get_block(3, 3) == 7);
    REQUIRE(store.get_block(100, 100) == shared::world::kAirBlock);
    REQUIRE(store.get_block(-1, 0) == shared::world::kAirBlock);
    REQUIRE(store.get_block(0, -20) == shared::world::kAirBlock);
}

// =============================================================================
// Block changes
// =============================================================================

TEST_CASE("Block change lands in the mirrored cell", "[world][chunks]") {
    ChunkStore store;
    load_uniform(store, 1, 0, 0);

    store.apply_block_change(19, 2, 3);

    // x = 19 -> chunk 1, cell 15 - 3 = 12; y = 2 -> chunk 0, cell 13.
    REQUIRE(store.get_chunk({1, 0})->get_block(12, 13) == 3);
    REQUIRE(store.get_block(19, 2) == 3);
    REQUIRE(store.get_block(18, 2) == 0);
}

TEST_CASE("Block change for an absent chunk is a no-op", "[world][chunks]") {
    ChunkStore store;
    load_uniform(store, 0, 0, 1);

    REQUIRE_NOTHROW(store.apply_block_change(19, 2, 3));
    REQUIRE_FALSE(store.contains({1, 0}));
    REQUIRE(store.size() == 1);
}

TEST_CASE("Batch block change writes every loaded position", "[world][chunks]") {
    ChunkStore store;
    load_uniform(store, 0, 0, 0);

    const std::vector<BlockPos> positions{BlockPos{0, 0}, BlockPos{5, 9}, BlockPos{40, 40}};
    store.apply_batch_block_change(positions, 2);

    REQUIRE(store.get_block(0, 0) == 2);
    REQUIRE(store.get_block(5, 9) == 2);
    REQUIRE(store.get_block(40, 40) == 0);
}

// =============================================================================
// Viewport streaming
// =============================================================================

TEST_CASE("Reconcile requests every chunk in the window", "[world][viewport]") {
    ChunkStore store;
    const auto msgs = store.reconcile_viewport({3, 3}, 1, 1);

    REQUIRE(count_messages<RequestChunk>(msgs) == 9);
    REQUIRE(count_messages<UnloadChunk>(msgs) == 0);
    REQUIRE(store.size() == 9);
    REQUIRE(store.contains({2, 2}));
    REQUIRE(store.contains({4, 4}));
    REQUIRE_FALSE(store.is_populated({3, 3}));
}

TEST_CASE("Reconcile is idempotent", "[world][viewport]") {
    ChunkStore store;
    const auto first = store.reconcile_viewport({2, 2}, 2, 2);
    REQUIRE_FALSE(first.empty());

    const auto second = store.reconcile_viewport({2, 2}, 2, 2);
    REQUIRE(second.empty());
}

TEST_CASE("Reconcile evicts chunks outside the window", "[world][viewport]") {
    ChunkStore store;
    load_uniform(store, 0, 0, 1);
    load_uniform(store, 5, 5, 1);

    const auto msgs = store.reconcile_viewport({0, 0}, 2, 2);

    REQUIRE_FALSE(store.contains({5, 5}));
    REQUIRE(store.contains({0, 0}));
    REQUIRE(store.is_populated({0, 0}));

    REQUIRE(count_messages<UnloadChunk>(msgs) == 1);
    for (const auto& m : msgs) {
        if (const auto* unload = get_message<UnloadChunk>(m)) {
            REQUIRE(unload->chunkX == 5);
            REQUIRE(unload->chunkY == 5);
        }
    }
}

TEST_CASE("Reconcile never touches negative coordinates", "[world][viewport]") {
    for (int radius = 0; radius <= 4; ++radius) {
        ChunkStore store;
        const auto msgs = store.reconcile_viewport({0, 0}, radius, radius);

        for (const auto& m : msgs) {
            REQUIRE_FALSE(has_negative_coord(m));
        }
        REQUIRE(count_messages<RequestChunk>(msgs) ==
                static_cast<std::size_t>((radius + 1) * (radius + 1)));

        const auto moved = store.reconcile_viewport({1, 1}, radius, radius);
        for (const auto& m : moved) {
            REQUIRE_FALSE(has_negative_coord(m));
        }
    }
}

TEST_CASE("Requested placeholders are filled by chunk data", "[world][viewport]") {
    ChunkStore store;
    (void)store.reconcile_viewport({0, 0}, 0, 0);
    REQUIRE(store.contains({0, 0}));
    REQUIRE_FALSE(store.is_populated({0, 0}));

    load_uniform(store, 0, 0, 9);
    REQUIRE(store.is_populated({0, 0}));
    REQUIRE(store.get_block(1, 1) == 9);
}

// =============================================================================
// Helpers
// =============================================================================

TEST_CASE("Viewport radius follows the window size", "[world][viewport]") {
    const auto r = viewport_radius_for(1280, 720, 25.0f);
    REQUIRE(r.x == 2);   // ceil(1280 / 800)
    REQUIRE(r.y == 1);   // ceil(720 / 800)

    const auto zero = viewport_radius_for(1280, 720, 0.0f);
    REQUIRE(zero.x == 0);
}

TEST_CASE("Chunk of a pixel position", "[world][viewport]") {
    REQUIRE(chunk_of_pixel(0.0f, 0.0f, 25.0f) == ChunkCoord{0, 0});
    REQUIRE(chunk_of_pixel(400.0f, 399.0f, 25.0f) == ChunkCoord{1, 0});
    REQUIRE(chunk_of_pixel(-1.0f, 0.0f, 25.0f) == ChunkCoord{-1, 0});
    REQUIRE(chunk_of_block(-1, 17) == ChunkCoord{-1, 1});
}

TEST_CASE("Chunk of an out-of-range pixel position is clamped", "[world][viewport]") {
    REQUIRE(chunk_of_pixel(1e30f * 25.0f, -1e30f * 25.0f, 25.0f) == ChunkCoord{kMaxChunkIndex, -kMaxChunkIndex});
    REQUIRE(chunk_of_pixel(std::numeric_limits<float>::infinity(), 0.0f, 25.0f) == ChunkCoord{kMaxChunkIndex, 0});
    REQUIRE(chunk_of_pixel(std::numeric_limits<float>::quiet_NaN(), 400.0f, 25.0f) == ChunkCoord{0, 1});
}

TEST_CASE("Reconcile near the integer limits stays in range", "[world][viewport]") {
    constexpr int kMin = std::numeric_limits<int>::min();
    constexpr int kMax = std::numeric_limits<int>::max();

    SECTION("Center at the lowest index unloads everything and requests nothing") {
        ChunkStore store;
        load_uniform(store, 0, 0, 1);

        const auto msgs = store.reconcile_viewport({kMin, kMin}, 2, 2);
        REQUIRE(msgs.size() == 1);
        REQUIRE(std::holds_alternative<UnloadChunk>(msgs[0]));
        REQUIRE(store.size() == 0);
    }

    SECTION("Center at the highest index requests the window inside the range") {
        ChunkStore store;

        const auto msgs = store.reconcile_viewport({kMax, kMax}, 1, 1);
        REQUIRE(msgs.size() == 4);
        for (const auto& msg : msgs) {
            const auto* req = std::get_if<RequestChunk>(&msg);
            REQUIRE(req != nullptr);
            REQUIRE(req->chunkX >= kMax - 1);
            REQUIRE(req->chunkY >= kMax - 1);
        }
        REQUIRE(store.contains({kMax, kMax}));
        REQUIRE(store.reconcile_viewport({kMax, kMax}, 1, 1).empty());
    }
}
