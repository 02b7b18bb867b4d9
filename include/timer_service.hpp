#ifndef ONESHOT_TIMER_SERVICE_HPP
#define ONESHOT_TIMER_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "shared_state/waker.hpp"

namespace oneshot {

struct timer_entry {
  std::chrono::steady_clock::time_point deadline;
  waker wake;

  // Min-heap: earliest deadline has highest priority
  bool operator>(const timer_entry &other) const {
    return deadline > other.deadline;
  }
};

class timer_service {
public:
  timer_service();
  ~timer_service();

  timer_service(const timer_service &) = delete;
  timer_service &operator=(const timer_service &) = delete;

  void add_timer(std::chrono::steady_clock::time_point deadline, waker w);

  void shutdown();

  // Fire every timer that would resume on exec, now. Called by an executor
  // going away so no sleeper is left holding a pointer to it. Waits for a
  // wake already in progress towards exec. Returns how many timers fired.
  std::size_t fire_for(const executor *exec);

  std::size_t pending() const;

private:
  void run();

  std::vector<timer_entry> heap_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  // Executor of the entry the timer thread is waking outside the lock
  const executor *firing_{nullptr};
  bool firing_active_{false};
  std::atomic<bool> running_{true};
  std::thread thread_;
};

// Process-wide timer thread, created on first use
timer_service &get_timer_service();

} // namespace oneshot

#endif // ONESHOT_TIMER_SERVICE_HPP
