#pragma once
// streaming_job_queue.h
// Generate-and-mesh jobs ordered by Chebyshev distance from the observer chunk.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include <glm/vec3.hpp>

class VoxelGrid;

struct StreamingJob
{
    glm::ivec3 chunkCoord{0};
    glm::ivec3 observerChunkAtEnqueue{0};
    // Set when the store already holds the voxels and only meshing remains.
    std::shared_ptr<const VoxelGrid> residentGrid;
};

class StreamingJobQueue
{
public:
    void push(const StreamingJob& job);
    bool tryPop(StreamingJob& job);
    // Blocks until a job is available; empty once the queue is stopped and drained.
    std::optional<StreamingJob> waitAndPop();
    void stop();
    bool empty() const;
    std::size_t size() const;

    // Re-keys every queued job against the new origin and removes those farther
    // than keepRadius, returning them to the caller.
    std::vector<StreamingJob> updatePriorityOrigin(const glm::ivec3& origin, int keepRadius);

private:
    struct PrioritizedJob
    {
        StreamingJob job;
        int distance{0};
        std::uint64_t sequence{0};
    };

    struct JobComparer
    {
        bool operator()(const PrioritizedJob& lhs, const PrioritizedJob& rhs) const noexcept;
    };

    PrioritizedJob wrap(const StreamingJob& job);

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> shouldStop_{false};
    glm::ivec3 priorityOrigin_{0, 0, 0};
    std::priority_queue<PrioritizedJob, std::vector<PrioritizedJob>, JobComparer> priorityQueue_;
    std::uint64_t nextSequence_{0};
};
