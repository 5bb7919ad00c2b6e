#include <thread>

#include <gtest/gtest.h>

#include "streaming_job_queue.h"

namespace
{
StreamingJob jobAt(const glm::ivec3& coord)
{
    StreamingJob job{};
    job.chunkCoord = coord;
    return job;
}
} // namespace

TEST(StreamingJobQueueTest, PopsNearestFirst)
{
    StreamingJobQueue queue;
    queue.push(jobAt(glm::ivec3(3, 0, 0)));
    queue.push(jobAt(glm::ivec3(0, 1, 0)));
    queue.push(jobAt(glm::ivec3(-2, 2, 2)));
    queue.push(jobAt(glm::ivec3(0, 0, 0)));

    StreamingJob job;
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(0, 0, 0));
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(0, 1, 0));
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(-2, 2, 2));
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(3, 0, 0));
    EXPECT_FALSE(queue.tryPop(job));
}

TEST(StreamingJobQueueTest, EqualDistanceKeepsEnqueueOrder)
{
    StreamingJobQueue queue;
    queue.push(jobAt(glm::ivec3(1, 0, 0)));
    queue.push(jobAt(glm::ivec3(0, 0, -1)));
    queue.push(jobAt(glm::ivec3(1, 1, 1)));

    StreamingJob job;
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(1, 0, 0));
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(0, 0, -1));
}

TEST(StreamingJobQueueTest, NewOriginReordersAndDropsFarJobs)
{
    StreamingJobQueue queue;
    queue.push(jobAt(glm::ivec3(0, 0, 0)));
    queue.push(jobAt(glm::ivec3(5, 0, 0)));
    queue.push(jobAt(glm::ivec3(9, 0, 0)));

    const std::vector<StreamingJob> dropped = queue.updatePriorityOrigin(glm::ivec3(8, 0, 0), 3);
    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped.front().chunkCoord, glm::ivec3(0, 0, 0));
    EXPECT_EQ(queue.size(), 2u);

    StreamingJob job;
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(9, 0, 0));
    ASSERT_TRUE(queue.tryPop(job));
    EXPECT_EQ(job.chunkCoord, glm::ivec3(5, 0, 0));
}

TEST(StreamingJobQueueTest, StopReleasesWaitingWorker)
{
    StreamingJobQueue queue;
    bool gotJob = true;
    std::thread worker([&] { gotJob = queue.waitAndPop().has_value(); });
    queue.stop();
    worker.join();
    EXPECT_FALSE(gotJob);
}

TEST(StreamingJobQueueTest, WaitAndPopReturnsQueuedJob)
{
    StreamingJobQueue queue;
    queue.push(jobAt(glm::ivec3(2, 2, 2)));
    const auto job = queue.waitAndPop();
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->chunkCoord, glm::ivec3(2, 2, 2));
    EXPECT_TRUE(queue.empty());
}
