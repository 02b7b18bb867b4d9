#include "task_scheduler.hpp"
#include "timer_service.hpp"

#include <algorithm>

namespace oneshot {

task_scheduler::task_scheduler(std::size_t num_workers) {
  num_workers = std::max<std::size_t>(num_workers, 1);
  workers_.reserve(num_workers);
  for (std::size_t i = 0; i < num_workers; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

task_scheduler::~task_scheduler() { shutdown(); }

void task_scheduler::schedule(std::coroutine_handle<> handle) {
  if (!handle || handle.done()) {
    return;
  }

  // Run inline during shutdown
  if (shutting_down_.load(std::memory_order_acquire)) {
    handle.resume();
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(handle);
  }

  // Wake one sleeping worker to process the new work
  cv_.notify_one();
}

void task_scheduler::shutdown() {
  if (shutting_down_.exchange(true, std::memory_order_acq_rel))
    return; // already shut down

  cv_.notify_all();
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }

  // Sleepers parked on the timer thread would otherwise wake into a dead
  // scheduler. Fired now they resume inline here; keep going while the
  // resumed coroutines park new timers on us.
  while (get_timer_service().fire_for(this) > 0) {
  }

  // Drain what was queued before the flag flipped
  std::deque<std::coroutine_handle<>> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    remaining.swap(queue_);
  }
  for (auto handle : remaining) {
    if (!handle.done())
      handle.resume();
  }
}

void task_scheduler::worker_loop() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    cv_.wait(lock, [this] {
      return !queue_.empty() || shutting_down_.load(std::memory_order_acquire);
    });

    if (queue_.empty()) {
      return; // shutting down with nothing left for us
    }

    auto handle = queue_.front();
    queue_.pop_front();

    // Coroutine bodies report their own exceptions through the promise
    lock.unlock();
    handle.resume();
    lock.lock();
  }
}

} // namespace oneshot
