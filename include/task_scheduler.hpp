#ifndef ONESHOT_TASK_SCHEDULER_HPP
#define ONESHOT_TASK_SCHEDULER_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "coro_task.hpp"
#include "shared_state/waker.hpp"

namespace oneshot {

// Fixed pool of worker threads resuming coroutine handles in FIFO order.
// This is the host runtime the tests and examples run on; the notify
// primitives only ever see it through the executor interface.
class task_scheduler : public executor {
public:
  explicit task_scheduler(
      std::size_t num_workers = std::thread::hardware_concurrency());
  ~task_scheduler() override;

  task_scheduler(const task_scheduler &) = delete;
  task_scheduler &operator=(const task_scheduler &) = delete;

  void schedule(std::coroutine_handle<> handle) override;

  // Start a task on this scheduler and hand it back for get()/co_await
  template <typename T> coro_task<T> spawn(coro_task<T> task) {
    task.start(*this);
    return task;
  }

  // Stop accepting work, join the workers, fire this scheduler's pending
  // timers early and run whatever is still queued on the calling thread so
  // no coroutine is left parked.
  // Must not be called from a worker thread.
  void shutdown();

private:
  void worker_loop();

  std::vector<std::thread> workers_;
  std::deque<std::coroutine_handle<>> queue_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> shutting_down_{false};
};

} // namespace oneshot

#endif // ONESHOT_TASK_SCHEDULER_HPP
