#pragma once

#include "optexec/concurrent/thread_safe_queue.hpp"
#include "optexec/eventbus/event_bus.hpp"
#include "optexec/events/event.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

namespace optexec {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains an inbox queue and dispatches each
//         event on its own EventBus.
//
// @details
// The engine runs two of these:
//
//   market loop     — ticks: paper broker matching, exit checks, candle
//                     aggregation, candle-close trailing, strategy.
//   execution loop  — signals and broker fill reports: order submission,
//                     fill reconciliation, exit registration.
//
// Keeping signals off the market loop matters: ExecutionController waits
// for an option LTP that only the market loop can deliver.
//
// The worker blocks on the queue for at most kIdleWait between checks of
// the running flag. stop() lets it finish the event it is dispatching, then
// dispatches whatever is still queued before joining, so a fill report
// pushed just before shutdown is not lost.
//
// Thread model: push() from any thread; subscribers run on the loop thread.
// Ownership: owns its queue, bus and thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop");

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Drains the queue, then joins.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  std::size_t pending() const { return queue_.size(); }

  bool isRunning() const { return running_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

 private:
  static constexpr std::chrono::milliseconds kIdleWait{10};

  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace optexec
