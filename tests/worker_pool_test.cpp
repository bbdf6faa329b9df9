// =============================================================================
// worker_pool_test.cpp
// =============================================================================
// Unit tests for margin::WorkerPool.
//
// Validates:
//   - Posted tasks run, on more than one thread when there are several
//   - waitIdle() returns only after every posted task has finished
//   - shutdown() drains queued tasks, then refuses new ones
//   - A throwing task does not take its worker down
// =============================================================================

#include "margin/concurrent/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

TEST(WorkerPoolTest, RunsEveryPostedTask) {
  margin::WorkerPool pool(4);
  std::atomic<int> done{0};

  for (int i = 0; i < 200; ++i) {
    ASSERT_TRUE(pool.post([&done] { ++done; }));
  }
  pool.waitIdle();

  EXPECT_EQ(done.load(), 200);
  EXPECT_EQ(pool.threadCount(), 4u);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
  margin::WorkerPool pool(0);
  EXPECT_EQ(pool.threadCount(), 1u);
}

// -----------------------------------------------------------------------------
// Two tasks that each wait for the other can only finish if they run on
// different workers at the same time.
// -----------------------------------------------------------------------------
TEST(WorkerPoolTest, TasksRunInParallel) {
  margin::WorkerPool pool(2);
  std::atomic<int> arrived{0};
  std::atomic<bool> both_seen{true};

  auto rendezvous = [&] {
    ++arrived;
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (arrived.load() < 2) {
      if (std::chrono::steady_clock::now() > deadline) {
        both_seen = false;
        return;
      }
      std::this_thread::yield();
    }
  };

  pool.post(rendezvous);
  pool.post(rendezvous);
  pool.waitIdle();

  EXPECT_TRUE(both_seen.load());
}

TEST(WorkerPoolTest, WaitIdleBlocksUntilSlowTaskFinishes) {
  margin::WorkerPool pool(1);
  std::atomic<bool> finished{false};

  pool.post([&finished] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    finished = true;
  });
  pool.waitIdle();

  EXPECT_TRUE(finished.load());
}

TEST(WorkerPoolTest, ShutdownDrainsThenRefuses) {
  margin::WorkerPool pool(1);
  std::atomic<int> done{0};

  for (int i = 0; i < 10; ++i) {
    pool.post([&done] {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++done;
    });
  }
  pool.shutdown();

  EXPECT_EQ(done.load(), 10);
  EXPECT_FALSE(pool.post([&done] { ++done; }));
  pool.waitIdle();
  EXPECT_EQ(done.load(), 10);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
  margin::WorkerPool pool(1);
  std::atomic<bool> ran_after{false};

  pool.post([] { throw std::runtime_error("boom"); });
  pool.post([&ran_after] { ran_after = true; });
  pool.waitIdle();

  EXPECT_TRUE(ran_after.load());
}
