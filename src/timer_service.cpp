#include "timer_service.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <utility>

namespace oneshot {

timer_service::timer_service() : thread_([this] { run(); }) {}

timer_service::~timer_service() { shutdown(); }

void timer_service::add_timer(std::chrono::steady_clock::time_point deadline,
                              waker w) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
      heap_.push_back(timer_entry{deadline, std::move(w)});
      std::push_heap(heap_.begin(), heap_.end(), std::greater<>{});
      w = waker{};
    }
  }

  // Already shut down: fire right away so the sleeper does not hang
  if (w) {
    w.wake();
    return;
  }
  cv_.notify_one();
}

void timer_service::shutdown() {
  if (!running_.exchange(false, std::memory_order_acq_rel))
    return; // already shut down

  cv_.notify_one();
  if (thread_.joinable())
    thread_.join();

  // Fire all remaining timers so no coroutine hangs
  std::vector<timer_entry> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    remaining.swap(heap_);
  }
  for (auto &entry : remaining) {
    entry.wake.wake();
  }
}

std::size_t timer_service::fire_for(const executor *exec) {
  std::vector<timer_entry> due;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this, exec] {
      return !firing_active_ || firing_ != exec;
    });

    auto keep = std::partition(heap_.begin(), heap_.end(),
                               [exec](const timer_entry &entry) {
                                 return entry.wake.scheduler() != exec;
                               });
    std::move(keep, heap_.end(), std::back_inserter(due));
    heap_.erase(keep, heap_.end());
    std::make_heap(heap_.begin(), heap_.end(), std::greater<>{});
  }

  // Earliest deadline first, same order the timer thread would use
  std::sort(due.begin(), due.end(),
            [](const timer_entry &a, const timer_entry &b) {
              return a.deadline < b.deadline;
            });
  for (auto &entry : due) {
    entry.wake.wake();
  }
  return due.size();
}

std::size_t timer_service::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return heap_.size();
}

void timer_service::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (running_.load(std::memory_order_acquire)) {
    if (heap_.empty()) {
      cv_.wait(lock, [this] {
        return !heap_.empty() || !running_.load(std::memory_order_acquire);
      });
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    auto &earliest = heap_.front();

    if (earliest.deadline <= now) {
      std::pop_heap(heap_.begin(), heap_.end(), std::greater<>{});
      auto entry = std::move(heap_.back());
      heap_.pop_back();

      // The woken coroutine may run inline and add another timer
      firing_ = entry.wake.scheduler();
      firing_active_ = true;
      lock.unlock();
      entry.wake.wake();
      lock.lock();
      firing_active_ = false;
      firing_ = nullptr;
      idle_cv_.notify_all();
    } else {
      cv_.wait_until(lock, earliest.deadline);
    }
  }
}

timer_service &get_timer_service() {
  static timer_service service;
  return service;
}

} // namespace oneshot
