#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace optexec {

// -----------------------------------------------------------------------------
// TaskScheduler — keyed, cancellable timers on one worker thread
// -----------------------------------------------------------------------------
//
// @brief  Runs one-shot and repeating tasks, each identified by a key
//         (normally an order id), on a dedicated thread.
//
// @details
// Replaces "one sleeping thread per order": the LIMIT entry watchdog, the
// paper broker's limit expiry and the engine's square-off poll are all
// entries in a scheduler owned by the component that needs them. When an
// order reaches a terminal state its owner calls cancel(order_id) and the
// timer is gone; nothing leaks over a session-long process.
//
// Semantics:
//   - At most one task per key. Scheduling an existing key replaces it.
//   - A repeating task returns true to run again after its interval, false
//     to retire itself.
//   - cancel() racing a task that is already running does not interrupt it;
//     the task is simply not rescheduled. Owners therefore re-check state
//     inside the task.
//   - Tasks run without the scheduler lock held, so a task may schedule or
//     cancel (including its own key). A task must not call stop().
//   - A task that throws std::exception is logged and retired.
//
// Timing uses std::chrono::steady_clock. Business deadlines (order timeout)
// are evaluated inside the task against the injected ITimeProvider, so
// tests can drive them without waiting.
//
// Thread model: all public members are safe from any thread.
// Ownership: owns its worker thread; stop() (or the destructor) joins it
// and drops every pending task.
// -----------------------------------------------------------------------------
class TaskScheduler {
 public:
  using Key = std::uint64_t;
  using Task = std::function<void()>;
  using RepeatingTask = std::function<bool()>;
  using Clock = std::chrono::steady_clock;

  explicit TaskScheduler(std::string name = "scheduler");

  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;
  TaskScheduler(TaskScheduler&&) = delete;
  TaskScheduler& operator=(TaskScheduler&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Joins the worker; pending tasks are discarded.
  void stop();

  // Runs task once, delay from now.
  void scheduleAfter(Key key, std::chrono::milliseconds delay, Task task);

  // Runs task every interval (first run after one interval) until it
  // returns false or the key is cancelled.
  void scheduleEvery(Key key, std::chrono::milliseconds interval,
                     RepeatingTask task);

  // @return true if a task was registered under key.
  bool cancel(Key key);

  bool isScheduled(Key key) const;

  std::size_t size() const;

 private:
  struct Entry {
    std::uint64_t generation{0};
    Clock::time_point due{};
    std::chrono::milliseconds interval{0};
    RepeatingTask task;
  };

  void insert(Key key, std::chrono::milliseconds interval,
              RepeatingTask task);

  void run();

  std::string name_;

  mutable std::mutex mutex_;
  std::condition_variable wake_cv_;
  std::unordered_map<Key, Entry> tasks_;
  std::uint64_t next_generation_{1};
  bool running_{false};
  std::thread thread_;
};

}  // namespace optexec
