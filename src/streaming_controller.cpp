#include "streaming_controller.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "chunk_coords.h"
#include "chunk_store.h"
#include "mesh_builder.h"
#include "render_sink.h"
#include "streaming_job_queue.h"

namespace
{

struct LoadedChunk
{
    std::shared_ptr<const VoxelGrid> grid;
    std::optional<RenderHandle> handle;
    std::size_t triangles{0};
};

struct CompletedJob
{
    glm::ivec3 chunkCoord{0};
    std::shared_ptr<const VoxelGrid> grid;
    MeshData mesh;
    bool generated{false};
    std::exception_ptr error;
};

struct ProfilingCounters
{
    std::atomic<long long> generationMicros{0};
    std::atomic<long long> meshingMicros{0};
    std::atomic<std::uint64_t> generatedChunks{0};
    std::atomic<std::uint64_t> meshedChunks{0};
};

long long elapsedMicros(std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
}

} // namespace

struct StreamingController::Impl
{
    Impl(ChunkStore& store, const MeshBuilder& mesher, RenderSink& sink, const StreamingSettings& settings);
    ~Impl();

    void tick(const glm::vec3& observerPosition);
    void drain();
    StreamingStats stats() const;

    void unloadOutOfRange(const glm::ivec3& origin);
    void loadMissingSync(const glm::ivec3& origin);
    void dropStaleJobs(const glm::ivec3& origin);
    void collectCompleted(const glm::ivec3& origin);
    void enqueueMissing(const glm::ivec3& origin);
    void spawnChunk(const glm::ivec3& coord, std::shared_ptr<const VoxelGrid> grid, const MeshData& mesh);

    void startWorkerThreads();
    void stopWorkerThreads();
    void workerThreadFunction();
    void processJob(const StreamingJob& job);

    bool loadBudgetExhausted(int loadsThisTick) const noexcept
    {
        return settings_.maxLoadsPerTick > 0 && loadsThisTick >= settings_.maxLoadsPerTick;
    }

    ChunkStore& store_;
    const MeshBuilder& mesher_;
    RenderSink& sink_;
    StreamingSettings settings_;

    std::unordered_map<glm::ivec3, LoadedChunk, ChunkHasher> loaded_;
    std::unordered_set<glm::ivec3, ChunkHasher> pending_;
    std::size_t loadedTriangles_{0};
    std::optional<glm::ivec3> lastObserverChunk_;

    StreamingJobQueue jobQueue_;
    std::vector<std::thread> workerThreads_;

    mutable std::mutex completedMutex_;
    std::condition_variable completedCondition_;
    std::deque<CompletedJob> completed_;
    std::size_t outstandingJobs_{0};

    ProfilingCounters profilingCounters_{};
    std::uint64_t spawnedChunks_{0};
    std::uint64_t despawnedChunks_{0};
    std::uint64_t droppedJobs_{0};
    std::uint64_t discardedResults_{0};

    // First worker failure; every later tick rethrows it instead of streaming.
    std::exception_ptr failure_;
};

StreamingController::Impl::Impl(ChunkStore& store,
                                 const MeshBuilder& mesher,
                                 RenderSink& sink,
                                 const StreamingSettings& settings)
    : store_(store),
      mesher_(mesher),
      sink_(sink),
      settings_(settings)
{
    if (settings_.renderDistance < 0 || settings_.renderDistance > StreamingSettings::kMaxRenderDistance)
    {
        throw std::invalid_argument("Render distance must be in [0, " +
                                    std::to_string(StreamingSettings::kMaxRenderDistance) + "]");
    }
    if (settings_.workerThreads < 0 || settings_.workerThreads > StreamingSettings::kMaxWorkerThreads)
    {
        throw std::invalid_argument("Worker thread count must be in [0, " +
                                    std::to_string(StreamingSettings::kMaxWorkerThreads) + "]");
    }
    if (settings_.maxLoadsPerTick < 0)
    {
        throw std::invalid_argument("Load budget must be non-negative");
    }

    if (settings_.eviction == EvictionPolicy::LeastRecentlyUsed)
    {
        store_.setMaxResidentChunks(settings_.maxResidentChunks);
    }

    std::cout << "[Streaming] Render distance " << settings_.renderDistance << ", "
              << (settings_.workerThreads == 0 ? std::string("synchronous")
                                               : std::to_string(settings_.workerThreads) + " worker threads")
              << ", eviction " << toString(settings_.eviction) << std::endl;

    if (settings_.workerThreads > 0)
    {
        startWorkerThreads();
    }
}

StreamingController::Impl::~Impl()
{
    stopWorkerThreads();
}

void StreamingController::Impl::tick(const glm::vec3& observerPosition)
{
    if (failure_)
    {
        std::rethrow_exception(failure_);
    }
    if (!isWithinWorldBounds(observerPosition))
    {
        throw std::invalid_argument("Observer position must be finite and within the world bounds");
    }

    const glm::ivec3 origin = worldToChunkCoords(observerPosition);

    if (!workerThreads_.empty())
    {
        dropStaleJobs(origin);
    }

    unloadOutOfRange(origin);

    if (workerThreads_.empty())
    {
        loadMissingSync(origin);
    }
    else
    {
        collectCompleted(origin);
        enqueueMissing(origin);
    }

    if (!lastObserverChunk_ || *lastObserverChunk_ != origin)
    {
        lastObserverChunk_ = origin;
        std::cout << "[Streaming] Observer entered chunk (" << origin.x << ", " << origin.y << ", " << origin.z
                  << "): " << loaded_.size() << " loaded, " << pending_.size() << " pending, "
                  << store_.size() << " resident" << std::endl;
    }
}

void StreamingController::Impl::unloadOutOfRange(const glm::ivec3& origin)
{
    for (auto it = loaded_.begin(); it != loaded_.end();)
    {
        if (chebyshevDistance(it->first, origin) <= settings_.renderDistance)
        {
            ++it;
            continue;
        }

        if (it->second.handle)
        {
            sink_.despawn(*it->second.handle);
        }
        ++despawnedChunks_;
        loadedTriangles_ -= it->second.triangles;
        store_.unpin(it->first);
        if (settings_.eviction == EvictionPolicy::Evict)
        {
            store_.evict(it->first);
        }
        it = loaded_.erase(it);
    }
}

void StreamingController::Impl::loadMissingSync(const glm::ivec3& origin)
{
    int loadsThisTick = 0;
    for (const glm::ivec3& coord : desiredChunks(origin, settings_.renderDistance))
    {
        if (loaded_.count(coord) != 0)
        {
            continue;
        }
        if (loadBudgetExhausted(loadsThisTick))
        {
            break;
        }

        const std::size_t generatedBefore = store_.generationCount();
        const auto genStart = std::chrono::steady_clock::now();
        std::shared_ptr<const VoxelGrid> grid = store_.getOrGenerate(coord);
        if (store_.generationCount() != generatedBefore)
        {
            profilingCounters_.generationMicros.fetch_add(elapsedMicros(genStart), std::memory_order_relaxed);
            profilingCounters_.generatedChunks.fetch_add(1, std::memory_order_relaxed);
        }

        const auto meshStart = std::chrono::steady_clock::now();
        MeshData mesh = mesher_.build(*grid);
        profilingCounters_.meshingMicros.fetch_add(elapsedMicros(meshStart), std::memory_order_relaxed);
        profilingCounters_.meshedChunks.fetch_add(1, std::memory_order_relaxed);

        spawnChunk(coord, std::move(grid), mesh);
        ++loadsThisTick;
    }
}

void StreamingController::Impl::dropStaleJobs(const glm::ivec3& origin)
{
    std::vector<StreamingJob> dropped = jobQueue_.updatePriorityOrigin(origin, settings_.renderDistance);
    if (dropped.empty())
    {
        return;
    }

    for (const StreamingJob& job : dropped)
    {
        pending_.erase(job.chunkCoord);
    }
    droppedJobs_ += dropped.size();

    std::lock_guard<std::mutex> lock(completedMutex_);
    outstandingJobs_ -= dropped.size();
    completedCondition_.notify_all();
}

void StreamingController::Impl::collectCompleted(const glm::ivec3& origin)
{
    std::deque<CompletedJob> results;
    {
        std::lock_guard<std::mutex> lock(completedMutex_);
        results.swap(completed_);
    }

    std::exception_ptr firstError;
    int loadsThisTick = 0;
    while (!results.empty())
    {
        if (loadBudgetExhausted(loadsThisTick))
        {
            break;
        }

        CompletedJob result = std::move(results.front());
        results.pop_front();
        pending_.erase(result.chunkCoord);

        if (result.error)
        {
            if (!firstError)
            {
                firstError = result.error;
            }
            continue;
        }

        if (chebyshevDistance(result.chunkCoord, origin) > settings_.renderDistance)
        {
            ++discardedResults_;
            if (result.generated && settings_.eviction != EvictionPolicy::Evict)
            {
                store_.insert(result.chunkCoord, std::move(result.grid));
            }
            continue;
        }

        if (loaded_.count(result.chunkCoord) != 0)
        {
            continue;
        }

        std::shared_ptr<const VoxelGrid> grid = store_.insert(result.chunkCoord, std::move(result.grid));
        spawnChunk(result.chunkCoord, std::move(grid), result.mesh);
        ++loadsThisTick;
    }

    if (!results.empty())
    {
        std::lock_guard<std::mutex> lock(completedMutex_);
        while (!results.empty())
        {
            completed_.push_front(std::move(results.back()));
            results.pop_back();
        }
    }

    if (firstError)
    {
        failure_ = firstError;
        std::cerr << "[Streaming] Worker job failed; streaming halted and the error rethrown on the tick thread"
                  << std::endl;
        std::rethrow_exception(failure_);
    }
}

void StreamingController::Impl::enqueueMissing(const glm::ivec3& origin)
{
    for (const glm::ivec3& coord : desiredChunks(origin, settings_.renderDistance))
    {
        if (loaded_.count(coord) != 0 || pending_.count(coord) != 0)
        {
            continue;
        }

        StreamingJob job{coord, origin, store_.find(coord)};
        pending_.insert(coord);
        {
            std::lock_guard<std::mutex> lock(completedMutex_);
            ++outstandingJobs_;
        }
        try
        {
            jobQueue_.push(job);
        }
        catch (...)
        {
            pending_.erase(coord);
            std::lock_guard<std::mutex> lock(completedMutex_);
            --outstandingJobs_;
            throw;
        }
    }
}

void StreamingController::Impl::spawnChunk(const glm::ivec3& coord,
                                           std::shared_ptr<const VoxelGrid> grid,
                                           const MeshData& mesh)
{
    LoadedChunk record{};
    record.grid = std::move(grid);
    record.triangles = mesh.triangleCount();
    if (!mesh.empty())
    {
        record.handle = sink_.spawn(mesh, chunkWorldOrigin(coord));
        ++spawnedChunks_;
    }

    store_.pin(coord);
    loadedTriangles_ += record.triangles;
    loaded_.emplace(coord, std::move(record));
}

void StreamingController::Impl::drain()
{
    if (workerThreads_.empty())
    {
        return;
    }

    std::unique_lock<std::mutex> lock(completedMutex_);
    completedCondition_.wait(lock, [this] { return outstandingJobs_ == 0; });
}

StreamingStats StreamingController::Impl::stats() const
{
    StreamingStats snapshot{};
    snapshot.observerChunk = lastObserverChunk_.value_or(glm::ivec3(0));
    snapshot.loadedChunks = loaded_.size();
    snapshot.residentChunks = store_.size();
    snapshot.pendingJobs = pending_.size();
    snapshot.loadedTriangles = loadedTriangles_;
    snapshot.spawnedChunks = spawnedChunks_;
    snapshot.despawnedChunks = despawnedChunks_;
    snapshot.evictedChunks = store_.evictionCount();
    snapshot.droppedJobs = droppedJobs_;
    snapshot.discardedResults = discardedResults_;
    snapshot.workerThreads = static_cast<int>(workerThreads_.size());

    const std::uint64_t generated = profilingCounters_.generatedChunks.load(std::memory_order_relaxed);
    const std::uint64_t meshed = profilingCounters_.meshedChunks.load(std::memory_order_relaxed);
    snapshot.generatedChunks = generated;
    snapshot.meshedChunks = meshed;

    const long long genMicros = profilingCounters_.generationMicros.load(std::memory_order_relaxed);
    const long long meshMicros = profilingCounters_.meshingMicros.load(std::memory_order_relaxed);
    if (generated > 0)
    {
        snapshot.averageGenerationMs = static_cast<double>(genMicros) /
                                       (1000.0 * static_cast<double>(generated));
    }
    if (meshed > 0)
    {
        snapshot.averageMeshingMs = static_cast<double>(meshMicros) /
                                    (1000.0 * static_cast<double>(meshed));
    }

    return snapshot;
}

void StreamingController::Impl::startWorkerThreads()
{
    const std::size_t count = static_cast<std::size_t>(settings_.workerThreads);
    workerThreads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        workerThreads_.emplace_back(&StreamingController::Impl::workerThreadFunction, this);
    }
}

void StreamingController::Impl::stopWorkerThreads()
{
    jobQueue_.stop();

    for (auto& thread : workerThreads_)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
    workerThreads_.clear();
}

void StreamingController::Impl::workerThreadFunction()
{
    while (std::optional<StreamingJob> job = jobQueue_.waitAndPop())
    {
        processJob(*job);
    }
}

void StreamingController::Impl::processJob(const StreamingJob& job)
{
    CompletedJob result{};
    result.chunkCoord = job.chunkCoord;

    try
    {
        result.grid = job.residentGrid;
        if (!result.grid)
        {
            const auto start = std::chrono::steady_clock::now();
            result.grid = store_.generateDetached(job.chunkCoord);
            result.generated = true;
            profilingCounters_.generationMicros.fetch_add(elapsedMicros(start), std::memory_order_relaxed);
            profilingCounters_.generatedChunks.fetch_add(1, std::memory_order_relaxed);
        }

        const auto start = std::chrono::steady_clock::now();
        result.mesh = mesher_.build(*result.grid);
        profilingCounters_.meshingMicros.fetch_add(elapsedMicros(start), std::memory_order_relaxed);
        profilingCounters_.meshedChunks.fetch_add(1, std::memory_order_relaxed);
    }
    catch (...)
    {
        result.error = std::current_exception();
    }

    std::lock_guard<std::mutex> lock(completedMutex_);
    completed_.push_back(std::move(result));
    --outstandingJobs_;
    completedCondition_.notify_all();
}

StreamingController::StreamingController(ChunkStore& store,
                                         const MeshBuilder& mesher,
                                         RenderSink& sink,
                                         const StreamingSettings& settings)
    : impl_(std::make_unique<Impl>(store, mesher, sink, settings))
{
}

StreamingController::~StreamingController() = default;

void StreamingController::tick(const glm::vec3& observerPosition)
{
    impl_->tick(observerPosition);
}

void StreamingController::drain()
{
    impl_->drain();
}

StreamingStats StreamingController::stats() const
{
    return impl_->stats();
}

std::vector<glm::ivec3> StreamingController::loadedCoordinates() const
{
    std::vector<glm::ivec3> coords;
    coords.reserve(impl_->loaded_.size());
    for (const auto& [coord, chunk] : impl_->loaded_)
    {
        coords.push_back(coord);
    }
    return coords;
}

std::size_t StreamingController::loadedCount() const noexcept
{
    return impl_->loaded_.size();
}

void StreamingController::setMaxLoadsPerTick(int maxLoads)
{
    if (maxLoads < 0)
    {
        throw std::invalid_argument("Load budget must be non-negative");
    }
    if (impl_->settings_.maxLoadsPerTick == maxLoads)
    {
        return;
    }
    impl_->settings_.maxLoadsPerTick = maxLoads;
    std::cout << "[Streaming] Load budget set to "
              << (maxLoads == 0 ? std::string("unlimited") : std::to_string(maxLoads) + " per tick") << std::endl;
}

const StreamingSettings& StreamingController::settings() const noexcept
{
    return impl_->settings_;
}

std::vector<glm::ivec3> StreamingController::desiredChunks(const glm::ivec3& center, int radius)
{
    if (radius > StreamingSettings::kMaxRenderDistance)
    {
        throw std::invalid_argument("Render distance must be at most " +
                                    std::to_string(StreamingSettings::kMaxRenderDistance));
    }

    std::vector<glm::ivec3> coords;
    if (radius < 0)
    {
        return coords;
    }

    const std::size_t side = static_cast<std::size_t>(2 * radius + 1);
    coords.reserve(side * side * side);
    for (int dx = -radius; dx <= radius; ++dx)
    {
        for (int dy = -radius; dy <= radius; ++dy)
        {
            for (int dz = -radius; dz <= radius; ++dz)
            {
                coords.emplace_back(center.x + dx, center.y + dy, center.z + dz);
            }
        }
    }
    return coords;
}
