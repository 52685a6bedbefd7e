#include "optexec/concurrent/task_scheduler.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace optexec {

TaskScheduler::TaskScheduler(std::string name) : name_(std::move(name)) {}

TaskScheduler::~TaskScheduler() { stop(); }

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void TaskScheduler::start() {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this] { run(); });
}

void TaskScheduler::stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    tasks_.clear();
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// scheduleAfter / scheduleEvery: both reduce to a repeating entry
// -----------------------------------------------------------------------------
void TaskScheduler::scheduleAfter(Key key, std::chrono::milliseconds delay,
                                  Task task) {
  insert(key, delay, [task = std::move(task)] {
    task();
    return false;
  });
}

void TaskScheduler::scheduleEvery(Key key, std::chrono::milliseconds interval,
                                  RepeatingTask task) {
  insert(key, interval, std::move(task));
}

void TaskScheduler::insert(Key key, std::chrono::milliseconds interval,
                           RepeatingTask task) {
  {
    std::lock_guard lock(mutex_);
    Entry entry;
    entry.generation = next_generation_++;
    entry.due = Clock::now() + interval;
    entry.interval = interval;
    entry.task = std::move(task);
    tasks_[key] = std::move(entry);
  }
  wake_cv_.notify_all();
}

bool TaskScheduler::cancel(Key key) {
  std::lock_guard lock(mutex_);
  return tasks_.erase(key) > 0;
}

bool TaskScheduler::isScheduled(Key key) const {
  std::lock_guard lock(mutex_);
  return tasks_.count(key) > 0;
}

std::size_t TaskScheduler::size() const {
  std::lock_guard lock(mutex_);
  return tasks_.size();
}

// -----------------------------------------------------------------------------
// run: wait for the earliest due entry, execute it outside the lock
// -----------------------------------------------------------------------------
void TaskScheduler::run() {
  std::unique_lock lock(mutex_);

  while (running_) {
    auto earliest = tasks_.end();
    for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
      if (earliest == tasks_.end() || it->second.due < earliest->second.due) {
        earliest = it;
      }
    }

    if (earliest == tasks_.end()) {
      wake_cv_.wait(lock);
      continue;
    }

    if (earliest->second.due > Clock::now()) {
      // Woken early by insert/cancel/stop; re-evaluate in every case.
      wake_cv_.wait_until(lock, earliest->second.due);
      continue;
    }

    const Key key = earliest->first;
    const std::uint64_t generation = earliest->second.generation;
    RepeatingTask task = earliest->second.task;

    lock.unlock();
    bool again = false;
    try {
      again = task();
    } catch (const std::exception& e) {
      std::cerr << "[TaskScheduler:" << name_ << "] ERROR: task " << key
                << " threw: " << e.what() << ". Task retired.\n";
      again = false;
    }
    lock.lock();

    auto it = tasks_.find(key);
    if (it == tasks_.end() || it->second.generation != generation) {
      // Cancelled or replaced while running.
      continue;
    }
    if (again) {
      it->second.due = Clock::now() + it->second.interval;
    } else {
      tasks_.erase(it);
    }
  }
}

}  // namespace optexec
