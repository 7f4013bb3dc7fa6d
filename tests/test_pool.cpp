/*
 * test_pool.cpp: Worker pool
 */

#include <gtest/gtest.h>

#include "pool.hpp"

#include <atomic>
#include <vector>

TEST(WorkerPool, RunsEveryTask)
{
    pool::WorkerPool workers(4);
    EXPECT_EQ(workers.size(), 4u);

    std::vector<int> slots(200, 0);
    for (size_t i = 0; i < slots.size(); i++)
        workers.submit([&slots, i] { slots[i] = (int)i * 2; });
    workers.wait_idle();

    for (size_t i = 0; i < slots.size(); i++)
        EXPECT_EQ(slots[i], (int)i * 2);
}

TEST(WorkerPool, ReusableAcrossRounds)
{
    pool::WorkerPool workers(2);
    std::atomic<int> count{0};
    for (int round = 0; round < 5; round++) {
        for (int i = 0; i < 10; i++)
            workers.submit([&count] { count++; });
        workers.wait_idle();
        EXPECT_EQ(count.load(), (round + 1) * 10);
    }
}

TEST(WorkerPool, DefaultSizeIsAtLeastOne)
{
    pool::WorkerPool workers;
    EXPECT_GE(workers.size(), 1u);
    workers.wait_idle();
}
