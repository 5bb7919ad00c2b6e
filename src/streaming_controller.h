#pragma once
// streaming_controller.h
// Keeps the loaded chunk set equal to the Chebyshev neighbourhood of the observer.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <glm/glm.hpp>

#include "world_config.h"

class ChunkStore;
class MeshBuilder;
class RenderSink;

struct StreamingStats
{
    glm::ivec3 observerChunk{0};
    std::size_t loadedChunks{0};
    std::size_t residentChunks{0};
    std::size_t pendingJobs{0};
    std::size_t loadedTriangles{0};
    std::uint64_t generatedChunks{0};
    std::uint64_t meshedChunks{0};
    std::uint64_t spawnedChunks{0};
    std::uint64_t despawnedChunks{0};
    std::uint64_t evictedChunks{0};
    std::uint64_t droppedJobs{0};
    std::uint64_t discardedResults{0};
    double averageGenerationMs{0.0};
    double averageMeshingMs{0.0};
    int workerThreads{0};
};

class StreamingController
{
public:
    StreamingController(ChunkStore& store,
                        const MeshBuilder& mesher,
                        RenderSink& sink,
                        const StreamingSettings& settings);
    ~StreamingController();

    StreamingController(const StreamingController&) = delete;
    StreamingController& operator=(const StreamingController&) = delete;
    StreamingController(StreamingController&&) = delete;
    StreamingController& operator=(StreamingController&&) = delete;

    // Throws std::invalid_argument for a non-finite or out-of-bounds position. After a
    // worker job fails, this and every later call rethrow that failure.
    void tick(const glm::vec3& observerPosition);

    // Blocks until every queued and running job has produced a result.
    // Results are spawned by the next tick.
    void drain();

    StreamingStats stats() const;

    std::vector<glm::ivec3> loadedCoordinates() const;
    std::size_t loadedCount() const noexcept;

    void setMaxLoadsPerTick(int maxLoads);
    const StreamingSettings& settings() const noexcept;

    // Cube of side 2 * radius + 1 around center, ordered by x, then y, then z.
    static std::vector<glm::ivec3> desiredChunks(const glm::ivec3& center, int radius);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
