#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunk_store.h"
#include "terrain/height_field.h"
#include "terrain/terrain_generator.h"
#include "test_support.h"

TEST(ChunkStoreTest, GetOrGenerateIsIdempotent)
{
    test_support::FlatTerrain flat(8);
    const terrain::TerrainGenerator generator = flat.generator();
    ChunkStore store(generator);

    const auto first = store.getOrGenerate(glm::ivec3(1, 0, 1));
    const auto second = store.getOrGenerate(glm::ivec3(1, 0, 1));

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(store.generationCount(), 1u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.contains(glm::ivec3(1, 0, 1)));
    EXPECT_FALSE(store.contains(glm::ivec3(0, 0, 0)));
}

TEST(ChunkStoreTest, EvictThenRegenerateGivesIdenticalContents)
{
    terrain::HeightField field(5u);
    terrain::TerrainGenerator generator(field);
    ChunkStore store(generator);

    const glm::ivec3 coord(0, 1, 0);
    const VoxelGrid before = *store.getOrGenerate(coord);
    EXPECT_TRUE(store.evict(coord));
    EXPECT_FALSE(store.contains(coord));
    EXPECT_FALSE(store.evict(coord));

    const VoxelGrid after = *store.getOrGenerate(coord);
    EXPECT_EQ(store.generationCount(), 2u);
    EXPECT_EQ(before, after);
}

TEST(ChunkStoreTest, EvictedGridStaysValidForHolders)
{
    test_support::FlatTerrain flat(3);
    const terrain::TerrainGenerator generator = flat.generator();
    ChunkStore store(generator);

    const auto grid = store.getOrGenerate(glm::ivec3(0));
    store.evict(glm::ivec3(0));
    EXPECT_EQ(grid->solidCount(), static_cast<std::size_t>(3 * kChunkSizeX * kChunkSizeZ));
}

TEST(ChunkStoreTest, InsertKeepsExistingEntry)
{
    test_support::FlatTerrain flat(4);
    const terrain::TerrainGenerator generator = flat.generator();
    ChunkStore store(generator);

    const auto resident = store.getOrGenerate(glm::ivec3(2, 0, 0));
    auto replacement = std::make_shared<const VoxelGrid>();
    const auto kept = store.insert(glm::ivec3(2, 0, 0), replacement);

    EXPECT_EQ(kept.get(), resident.get());
    EXPECT_EQ(store.find(glm::ivec3(2, 0, 0)).get(), resident.get());

    const auto adopted = store.insert(glm::ivec3(3, 0, 0), replacement);
    EXPECT_EQ(adopted.get(), replacement.get());
    EXPECT_EQ(store.generationCount(), 1u);
    EXPECT_THROW(store.insert(glm::ivec3(4, 0, 0), nullptr), std::invalid_argument);
}

TEST(ChunkStoreTest, FindReturnsNullForMissingChunk)
{
    test_support::FlatTerrain flat(4);
    const terrain::TerrainGenerator generator = flat.generator();
    ChunkStore store(generator);

    EXPECT_EQ(store.find(glm::ivec3(9, 9, 9)), nullptr);
    EXPECT_EQ(store.generationCount(), 0u);
}

TEST(ChunkStoreTest, ResidentBoundEvictsLeastRecentlyUsed)
{
    test_support::FlatTerrain flat(4);
    const terrain::TerrainGenerator generator = flat.generator();
    ChunkStore store(generator, 2);

    store.getOrGenerate(glm::ivec3(0, 0, 0));
    store.getOrGenerate(glm::ivec3(1, 0, 0));
    store.getOrGenerate(glm::ivec3(0, 0, 0)); // touch
    store.getOrGenerate(glm::ivec3(2, 0, 0));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.contains(glm::ivec3(0, 0, 0)));
    EXPECT_FALSE(store.contains(glm::ivec3(1, 0, 0)));
    EXPECT_TRUE(store.contains(glm::ivec3(2, 0, 0)));
    EXPECT_EQ(store.evictionCount(), 1u);
}

TEST(ChunkStoreTest, PinnedChunksSurviveResidentBound)
{
    test_support::FlatTerrain flat(4);
    const terrain::TerrainGenerator generator = flat.generator();
    ChunkStore store(generator, 1);

    store.getOrGenerate(glm::ivec3(0, 0, 0));
    store.pin(glm::ivec3(0, 0, 0));
    store.getOrGenerate(glm::ivec3(1, 0, 0));

    EXPECT_TRUE(store.contains(glm::ivec3(0, 0, 0)));
    EXPECT_TRUE(store.contains(glm::ivec3(1, 0, 0)));

    store.unpin(glm::ivec3(0, 0, 0));
    store.getOrGenerate(glm::ivec3(2, 0, 0));
    EXPECT_FALSE(store.contains(glm::ivec3(0, 0, 0)));
    EXPECT_FALSE(store.contains(glm::ivec3(1, 0, 0)));
    EXPECT_TRUE(store.contains(glm::ivec3(2, 0, 0)));
}

TEST(ChunkStoreTest, ConcurrentRequestsGenerateOnce)
{
    std::atomic<int> samples{0};
    terrain::TerrainGenerator generator([&samples](int, int) {
        if (samples.fetch_add(1) == 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return 6;
    });
    ChunkStore store(generator);

    std::vector<std::shared_ptr<const VoxelGrid>> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back([&store, &results, i] { results[i] = store.getOrGenerate(glm::ivec3(5, 0, 5)); });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(store.generationCount(), 1u);
    EXPECT_EQ(samples.load(), kChunkSizeX * kChunkSizeZ);
    for (const auto& grid : results)
    {
        EXPECT_EQ(grid.get(), results.front().get());
    }
}

TEST(ChunkStoreTest, FailedGenerationLeavesNoEntry)
{
    bool fail = true;
    terrain::TerrainGenerator generator([&fail](int, int) -> int {
        if (fail)
        {
            throw std::runtime_error("sampler failure");
        }
        return 1;
    });
    ChunkStore store(generator);

    EXPECT_THROW(store.getOrGenerate(glm::ivec3(0)), std::runtime_error);
    EXPECT_FALSE(store.contains(glm::ivec3(0)));

    fail = false;
    EXPECT_NE(store.getOrGenerate(glm::ivec3(0)), nullptr);
    EXPECT_EQ(store.generationCount(), 1u);
}

TEST(ChunkStoreTest, OriginColumnSurvivesEvictAndRegenerate)
{
    terrain::HeightFieldSettings settings{};
    settings.offset = 8.0f;
    settings.amplitude = 6.0f;
    terrain::HeightField field(2024u, settings);
    terrain::TerrainGenerator generator(field);
    ChunkStore store(generator);

    const int h = field.height(0, 0);
    ASSERT_GE(h, 0);
    ASSERT_LE(h, kChunkSizeY);

    const auto checkColumn = [h](const VoxelGrid& grid) {
        for (int y = 0; y < kChunkSizeY; ++y)
        {
            EXPECT_EQ(grid.solid(0, y, 0), y < h) << "y = " << y;
        }
    };

    const VoxelGrid first = *store.getOrGenerate(glm::ivec3(0));
    checkColumn(first);

    store.evict(glm::ivec3(0));
    const VoxelGrid second = *store.getOrGenerate(glm::ivec3(0));
    EXPECT_EQ(field.height(0, 0), h);
    checkColumn(second);
    EXPECT_EQ(first, second);
}

TEST(ChunkStoreTest, DetachedGenerationIsCountedButNotResident)
{
    test_support::FlatTerrain flat(6);
    const terrain::TerrainGenerator generator = flat.generator();
    ChunkStore store(generator);

    const auto grid = store.generateDetached(glm::ivec3(1, 0, 2));
    ASSERT_NE(grid, nullptr);
    EXPECT_EQ(grid->solidCount(), static_cast<std::size_t>(6 * kChunkSizeX * kChunkSizeZ));
    EXPECT_EQ(store.generationCount(), 1u);
    EXPECT_FALSE(store.contains(glm::ivec3(1, 0, 2)));

    EXPECT_EQ(store.insert(glm::ivec3(1, 0, 2), grid).get(), grid.get());
    EXPECT_EQ(store.getOrGenerate(glm::ivec3(1, 0, 2)).get(), grid.get());
    EXPECT_EQ(store.generationCount(), 1u);
}
