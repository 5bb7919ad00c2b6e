#include "streaming_job_queue.h"

#include <utility>

#include "chunk_coords.h"
#include "voxel_grid.h"

void StreamingJobQueue::push(const StreamingJob& job)
{
    std::lock_guard<std::mutex> lock(mutex_);
    priorityQueue_.push(wrap(job));
    condition_.notify_one();
}

bool StreamingJobQueue::tryPop(StreamingJob& job)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (priorityQueue_.empty())
    {
        return false;
    }
    job = priorityQueue_.top().job;
    priorityQueue_.pop();
    return true;
}

std::optional<StreamingJob> StreamingJobQueue::waitAndPop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return !priorityQueue_.empty() || shouldStop_.load(std::memory_order_acquire); });

    if (shouldStop_.load(std::memory_order_acquire))
    {
        return std::nullopt;
    }

    StreamingJob job = priorityQueue_.top().job;
    priorityQueue_.pop();
    return job;
}

void StreamingJobQueue::stop()
{
    std::lock_guard<std::mutex> lock(mutex_);
    shouldStop_.store(true, std::memory_order_release);
    condition_.notify_all();
}

bool StreamingJobQueue::empty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return priorityQueue_.empty();
}

std::size_t StreamingJobQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return priorityQueue_.size();
}

std::vector<StreamingJob> StreamingJobQueue::updatePriorityOrigin(const glm::ivec3& origin, int keepRadius)
{
    std::lock_guard<std::mutex> lock(mutex_);
    priorityOrigin_ = origin;

    std::vector<StreamingJob> removed;
    if (priorityQueue_.empty())
    {
        return removed;
    }

    std::vector<PrioritizedJob> jobs;
    jobs.reserve(priorityQueue_.size());
    while (!priorityQueue_.empty())
    {
        jobs.push_back(priorityQueue_.top());
        priorityQueue_.pop();
    }

    for (auto& prioritized : jobs)
    {
        prioritized.distance = chebyshevDistance(prioritized.job.chunkCoord, priorityOrigin_);
        if (prioritized.distance > keepRadius)
        {
            removed.push_back(std::move(prioritized.job));
            continue;
        }
        priorityQueue_.push(std::move(prioritized));
    }
    return removed;
}

bool StreamingJobQueue::JobComparer::operator()(const PrioritizedJob& lhs, const PrioritizedJob& rhs) const noexcept
{
    if (lhs.distance != rhs.distance)
    {
        return lhs.distance > rhs.distance;
    }
    return lhs.sequence > rhs.sequence;
}

StreamingJobQueue::PrioritizedJob StreamingJobQueue::wrap(const StreamingJob& job)
{
    const int distance = chebyshevDistance(job.chunkCoord, priorityOrigin_);
    return PrioritizedJob{job, distance, nextSequence_++};
}
