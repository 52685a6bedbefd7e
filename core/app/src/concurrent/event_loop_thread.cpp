#include "optexec/concurrent/event_loop_thread.hpp"

#include <iostream>
#include <optional>

namespace optexec {

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start: spawn the worker once
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop: clear the flag, let the worker drain, join
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

// -----------------------------------------------------------------------------
// run: dispatch until stopped, then flush the remainder
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (std::optional<Event> event = queue_.pop_for(kIdleWait)) {
      bus_.publish(*event);
    }
  }

  std::size_t drained = 0;
  while (std::optional<Event> event = queue_.try_pop()) {
    bus_.publish(*event);
    ++drained;
  }
  if (drained > 0) {
    std::cout << "[EventLoopThread:" << name_ << "] drained " << drained
              << " event(s) on stop.\n";
  }
}

}  // namespace optexec
