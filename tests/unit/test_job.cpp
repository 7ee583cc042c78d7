#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../../src/engine/job/job.hpp"

using namespace Rotor::Engine;

TEST(JobTest, Identity) {
    Job job("chunk_01", "in/chunk_01.wav", "out/chunk_01.html");
    EXPECT_EQ(job.name(), "chunk_01");
    EXPECT_EQ(job.input(), "in/chunk_01.wav");
    EXPECT_EQ(job.output(), "out/chunk_01.html");
    EXPECT_TRUE(job.is_incomplete());
    EXPECT_FALSE(job.in_flight());
}

TEST(JobTest, MarkCompletedIsLatchedOnce) {
    Job job("a", "in", "out");
    EXPECT_TRUE(job.mark_completed());
    EXPECT_FALSE(job.mark_completed());
    EXPECT_TRUE(job.is_completed());
    EXPECT_FALSE(job.is_incomplete());
}

TEST(JobTest, TryAcquireIsExclusive) {
    Job job("a", "in", "out");
    EXPECT_TRUE(job.try_acquire());
    EXPECT_FALSE(job.try_acquire());
    job.release();
    EXPECT_TRUE(job.try_acquire());
    job.release();
}

TEST(JobTest, ConcurrentAcquireHasSingleWinner) {
    for (int round = 0; round < 50; ++round) {
        Job                      job("a", "in", "out");
        std::atomic<int>         winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 16; ++i) {
            threads.emplace_back([&]() {
                if (job.try_acquire())
                    winners++;
            });
        }
        for (auto& t : threads)
            t.join();
        EXPECT_EQ(winners.load(), 1);
    }
}

TEST(JobTest, LeaseReleasesOnException) {
    Job job("a", "in", "out");
    try {
        JobLease lease(job);
        ASSERT_TRUE(static_cast<bool>(lease));
        EXPECT_TRUE(job.in_flight());
        throw std::runtime_error("attempt blew up");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(job.in_flight());
}

TEST(JobTest, LeaseDoesNotReleaseForeignGuard) {
    Job job("a", "in", "out");
    ASSERT_TRUE(job.try_acquire());
    {
        JobLease lease(job);
        EXPECT_FALSE(static_cast<bool>(lease));
    }
    EXPECT_TRUE(job.in_flight());
    job.release();
}
