#pragma once
// chunk_store.h
// Owns resident voxel grids keyed by chunk coordinate.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include <glm/vec3.hpp>

#include "voxel_grid.h"

namespace terrain
{
class TerrainGenerator;
}

class ChunkStore
{
public:
    using GridPtr = std::shared_ptr<const VoxelGrid>;

    // maxResidentChunks == 0 leaves the store unbounded.
    explicit ChunkStore(const terrain::TerrainGenerator& generator, std::size_t maxResidentChunks = 0);

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    // Returns the resident grid, generating it on a miss. Concurrent callers
    // for the same coordinate wait for a single generation pass.
    GridPtr getOrGenerate(const glm::ivec3& chunkCoord);

    // Runs one generation pass without making the result resident. Counted by
    // generationCount(); hand the grid to insert() to adopt it.
    GridPtr generateDetached(const glm::ivec3& chunkCoord);

    // Adopts a grid generated elsewhere. An already resident grid wins and is returned.
    GridPtr insert(const glm::ivec3& chunkCoord, GridPtr grid);

    [[nodiscard]] GridPtr find(const glm::ivec3& chunkCoord) const;
    [[nodiscard]] bool contains(const glm::ivec3& chunkCoord) const;
    std::size_t size() const;

    bool evict(const glm::ivec3& chunkCoord);

    // Pinned coordinates are skipped by the resident bound.
    void pin(const glm::ivec3& chunkCoord);
    void unpin(const glm::ivec3& chunkCoord);

    void setMaxResidentChunks(std::size_t maxResidentChunks);

    std::size_t generationCount() const noexcept { return generationCount_.load(std::memory_order_relaxed); }
    std::size_t evictionCount() const noexcept { return evictionCount_.load(std::memory_order_relaxed); }

private:
    struct Entry
    {
        GridPtr grid;
        std::list<glm::ivec3>::iterator lruPosition;
    };

    GridPtr insertLocked(const glm::ivec3& chunkCoord, GridPtr grid);
    void touchLocked(Entry& entry);
    void eraseLocked(std::unordered_map<glm::ivec3, Entry, ChunkHasher>::iterator it);
    void enforceBoundLocked(const glm::ivec3* keep);

    const terrain::TerrainGenerator& generator_;

    mutable std::mutex mutex_;
    std::condition_variable generationDone_;
    std::unordered_map<glm::ivec3, Entry, ChunkHasher> entries_;
    std::unordered_set<glm::ivec3, ChunkHasher> generating_;
    std::unordered_set<glm::ivec3, ChunkHasher> pinned_;
    std::list<glm::ivec3> lru_; // front is most recently used
    std::size_t maxResidentChunks_{0};

    std::atomic<std::size_t> generationCount_{0};
    std::atomic<std::size_t> evictionCount_{0};
};
