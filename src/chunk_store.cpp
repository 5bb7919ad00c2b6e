#include "chunk_store.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "terrain/terrain_generator.h"

ChunkStore::ChunkStore(const terrain::TerrainGenerator& generator, std::size_t maxResidentChunks)
    : generator_(generator),
      maxResidentChunks_(maxResidentChunks)
{
}

ChunkStore::GridPtr ChunkStore::getOrGenerate(const glm::ivec3& chunkCoord)
{
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;)
    {
        auto it = entries_.find(chunkCoord);
        if (it != entries_.end())
        {
            touchLocked(it->second);
            return it->second.grid;
        }
        if (generating_.insert(chunkCoord).second)
        {
            break;
        }
        generationDone_.wait(lock);
    }
    lock.unlock();

    GridPtr grid;
    try
    {
        grid = std::make_shared<const VoxelGrid>(generator_.generateChunk(chunkCoord));
    }
    catch (...)
    {
        lock.lock();
        generating_.erase(chunkCoord);
        generationDone_.notify_all();
        throw;
    }
    generationCount_.fetch_add(1, std::memory_order_relaxed);

    lock.lock();
    generating_.erase(chunkCoord);
    GridPtr resident = insertLocked(chunkCoord, std::move(grid));
    generationDone_.notify_all();
    return resident;
}

ChunkStore::GridPtr ChunkStore::generateDetached(const glm::ivec3& chunkCoord)
{
    GridPtr grid = std::make_shared<const VoxelGrid>(generator_.generateChunk(chunkCoord));
    generationCount_.fetch_add(1, std::memory_order_relaxed);
    return grid;
}

ChunkStore::GridPtr ChunkStore::insert(const glm::ivec3& chunkCoord, GridPtr grid)
{
    if (!grid)
    {
        throw std::invalid_argument("ChunkStore::insert requires a voxel grid");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return insertLocked(chunkCoord, std::move(grid));
}

ChunkStore::GridPtr ChunkStore::find(const glm::ivec3& chunkCoord) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(chunkCoord);
    return it != entries_.end() ? it->second.grid : nullptr;
}

bool ChunkStore::contains(const glm::ivec3& chunkCoord) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(chunkCoord) != entries_.end();
}

std::size_t ChunkStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool ChunkStore::evict(const glm::ivec3& chunkCoord)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(chunkCoord);
    if (it == entries_.end())
    {
        return false;
    }
    eraseLocked(it);
    return true;
}

void ChunkStore::pin(const glm::ivec3& chunkCoord)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pinned_.insert(chunkCoord);
}

void ChunkStore::unpin(const glm::ivec3& chunkCoord)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pinned_.erase(chunkCoord);
}

void ChunkStore::setMaxResidentChunks(std::size_t maxResidentChunks)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (maxResidentChunks_ == maxResidentChunks)
    {
        return;
    }
    maxResidentChunks_ = maxResidentChunks;
    std::cout << "[ChunkStore] Resident bound set to "
              << (maxResidentChunks_ == 0 ? std::string("unbounded") : std::to_string(maxResidentChunks_))
              << std::endl;
    enforceBoundLocked(nullptr);
}

ChunkStore::GridPtr ChunkStore::insertLocked(const glm::ivec3& chunkCoord, GridPtr grid)
{
    auto [it, inserted] = entries_.try_emplace(chunkCoord);
    if (!inserted)
    {
        touchLocked(it->second);
        return it->second.grid;
    }

    lru_.push_front(chunkCoord);
    it->second.grid = std::move(grid);
    it->second.lruPosition = lru_.begin();
    GridPtr resident = it->second.grid;
    enforceBoundLocked(&chunkCoord);
    return resident;
}

void ChunkStore::touchLocked(Entry& entry)
{
    lru_.splice(lru_.begin(), lru_, entry.lruPosition);
}

void ChunkStore::eraseLocked(std::unordered_map<glm::ivec3, Entry, ChunkHasher>::iterator it)
{
    lru_.erase(it->second.lruPosition);
    entries_.erase(it);
    evictionCount_.fetch_add(1, std::memory_order_relaxed);
}

void ChunkStore::enforceBoundLocked(const glm::ivec3* keep)
{
    if (maxResidentChunks_ == 0)
    {
        return;
    }

    auto cursor = lru_.end();
    while (entries_.size() > maxResidentChunks_ && cursor != lru_.begin())
    {
        --cursor;
        const glm::ivec3 candidate = *cursor;
        if ((keep && candidate == *keep) || pinned_.count(candidate) != 0)
        {
            continue;
        }

        auto victim = entries_.find(candidate);
        // Step past the node before the list erase invalidates it.
        auto next = cursor;
        ++next;
        eraseLocked(victim);
        cursor = next;
    }
}
