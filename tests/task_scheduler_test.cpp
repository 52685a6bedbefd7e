// =============================================================================
// task_scheduler_test.cpp
// =============================================================================
// Unit tests for the concurrency helpers behind the engine's threads:
// optexec::TaskScheduler, optexec::EventLoopThread, optexec::OrderIdGenerator.
//
// Validates:
//   - One-shot and repeating tasks run; cancel() removes a pending task
//   - Rescheduling a key replaces the previous task
//   - A throwing task is retired without killing the worker
//   - EventLoopThread dispatches on its own thread and drains on stop()
//   - OrderIdGenerator hands out unique, non-zero ids across threads
//
// Timing: waits use promise/future or condition_variable::wait_for with
// generous timeouts so a slow CI host does not flake.
// =============================================================================

#include "optexec/concurrent/event_loop_thread.hpp"
#include "optexec/concurrent/order_id_generator.hpp"
#include "optexec/concurrent/task_scheduler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class TaskSchedulerTest : public ::testing::Test {
 protected:
  void SetUp() override { scheduler.start(); }
  void TearDown() override { scheduler.stop(); }

  optexec::TaskScheduler scheduler{"test"};
};

// -----------------------------------------------------------------------------
// 1. A one-shot task runs once and then leaves the table.
// -----------------------------------------------------------------------------
TEST_F(TaskSchedulerTest, OneShotRunsOnce) {
  std::promise<void> ran;
  auto future = ran.get_future();
  scheduler.scheduleAfter(1, 10ms, [&ran] { ran.set_value(); });

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

  // The entry is erased right after the task returns.
  for (int i = 0; i < 100 && scheduler.isScheduled(1); ++i) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_FALSE(scheduler.isScheduled(1));
}

// -----------------------------------------------------------------------------
// 2. A repeating task runs until it returns false.
// Why: the LIMIT watchdog retires itself this way once the order is terminal.
// -----------------------------------------------------------------------------
TEST_F(TaskSchedulerTest, RepeatingTaskRetiresItself) {
  std::atomic<int> runs{0};
  std::promise<void> done;
  auto future = done.get_future();
  scheduler.scheduleEvery(2, 5ms, [&runs, &done] {
    if (runs.fetch_add(1) + 1 == 3) {
      done.set_value();
      return false;
    }
    return true;
  });

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(runs.load(), 3);
}

// -----------------------------------------------------------------------------
// 3. cancel() before the deadline means the task never runs.
// -----------------------------------------------------------------------------
TEST_F(TaskSchedulerTest, CancelPreventsExecution) {
  std::atomic<bool> ran{false};
  scheduler.scheduleAfter(3, 200ms, [&ran] { ran = true; });
  EXPECT_TRUE(scheduler.isScheduled(3));

  EXPECT_TRUE(scheduler.cancel(3));
  EXPECT_FALSE(scheduler.cancel(3));
  EXPECT_EQ(scheduler.size(), 0u);

  std::this_thread::sleep_for(300ms);
  EXPECT_FALSE(ran.load());
}

// -----------------------------------------------------------------------------
// 4. Scheduling an existing key replaces the old task.
// -----------------------------------------------------------------------------
TEST_F(TaskSchedulerTest, SameKeyReplacesTask) {
  std::atomic<int> which{0};
  std::promise<void> done;
  auto future = done.get_future();

  scheduler.scheduleAfter(4, 100ms, [&which] { which = 1; });
  scheduler.scheduleAfter(4, 10ms, [&which, &done] {
    which = 2;
    done.set_value();
  });
  EXPECT_EQ(scheduler.size(), 1u);

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(which.load(), 2);
}

// -----------------------------------------------------------------------------
// 5. A task that throws is retired; later tasks still run.
// -----------------------------------------------------------------------------
TEST_F(TaskSchedulerTest, ThrowingTaskDoesNotKillWorker) {
  scheduler.scheduleEvery(5, 5ms, []() -> bool {
    throw std::runtime_error("broker offline");
  });

  std::promise<void> ran;
  auto future = ran.get_future();
  scheduler.scheduleAfter(6, 30ms, [&ran] { ran.set_value(); });

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(scheduler.isScheduled(5));
}

// -----------------------------------------------------------------------------
// 6. EventLoopThread publishes on its worker thread, not the caller's.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DispatchesOnWorkerThread) {
  optexec::EventLoopThread loop("exec");
  std::promise<std::thread::id> handler_thread;
  auto future = handler_thread.get_future();

  loop.eventBus().subscribe<optexec::SignalEvent>(
      [&handler_thread](const optexec::SignalEvent&) {
        handler_thread.set_value(std::this_thread::get_id());
      });

  loop.start();
  EXPECT_TRUE(loop.isRunning());
  loop.push(optexec::SignalEvent{});

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
  EXPECT_EQ(loop.name(), "exec");
}

// -----------------------------------------------------------------------------
// 7. stop() delivers everything that was queued before it.
// Why: shutdown pushes the last exit fills and expects them booked.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StopDrainsPendingEvents) {
  optexec::EventLoopThread loop("drain");
  std::mutex mutex;
  std::condition_variable cv;
  bool release = false;
  std::atomic<int> delivered{0};

  // The first handler blocks so the rest pile up in the queue.
  loop.eventBus().subscribe<optexec::OrderFilledEvent>(
      [&](const optexec::OrderFilledEvent& e) {
        if (e.order_id == 1) {
          std::unique_lock lock(mutex);
          cv.wait_for(lock, 2s, [&release] { return release; });
        }
        ++delivered;
      });

  loop.start();
  for (optexec::domain::OrderId id = 1; id <= 20; ++id) {
    optexec::OrderFilledEvent e;
    e.order_id = id;
    loop.push(e);
  }

  std::thread releaser([&] {
    std::this_thread::sleep_for(20ms);
    {
      std::lock_guard lock(mutex);
      release = true;
    }
    cv.notify_all();
  });

  loop.stop();
  releaser.join();
  EXPECT_EQ(delivered.load(), 20);
  EXPECT_EQ(loop.pending(), 0u);
}

// -----------------------------------------------------------------------------
// 8. Ids start at 1 and are unique across threads.
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, UniqueAcrossThreads) {
  optexec::OrderIdGenerator ids;
  EXPECT_EQ(ids.next_id(), 1u);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;
  std::vector<std::vector<optexec::domain::OrderId>> taken(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&ids, &taken, t] {
      for (int i = 0; i < kPerThread; ++i) {
        taken[t].push_back(ids.next_id());
      }
    });
  }
  for (auto& t : threads) t.join();

  std::set<optexec::domain::OrderId> unique;
  for (const auto& v : taken) {
    unique.insert(v.begin(), v.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(unique.count(optexec::domain::kNoOrderId), 0u);
}
