#ifndef ONESHOT_CORO_TASK_HPP
#define ONESHOT_CORO_TASK_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>

#include "shared_state/concepts.hpp"
#include "shared_state/waker.hpp"

namespace oneshot {

// Shared state for coroutine result communication
template <typename T> struct coro_shared_state {
  std::variant<std::monostate, T, std::exception_ptr> result;
  std::atomic<bool> ready{false};
  bool finished{false};
  std::coroutine_handle<> continuation{nullptr};
  std::mutex mutex;
  std::condition_variable cv;

  void set_value(T value) {
    {
      std::lock_guard lock(mutex);
      result.template emplace<1>(std::move(value));
      ready.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  void set_exception(std::exception_ptr e) {
    {
      std::lock_guard lock(mutex);
      result.template emplace<2>(e);
      ready.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  T get() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return ready.load(std::memory_order_acquire); });
    if (std::holds_alternative<std::exception_ptr>(result)) {
      std::rethrow_exception(std::get<std::exception_ptr>(result));
    }
    return std::get<T>(std::move(result));
  }

  bool is_ready() const { return ready.load(std::memory_order_acquire); }
};

// Specialization for void
template <> struct coro_shared_state<void> {
  std::exception_ptr exception;
  std::atomic<bool> ready{false};
  bool finished{false};
  std::coroutine_handle<> continuation{nullptr};
  std::mutex mutex;
  std::condition_variable cv;

  void set_value() {
    {
      std::lock_guard lock(mutex);
      ready.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  void set_exception(std::exception_ptr e) {
    {
      std::lock_guard lock(mutex);
      exception = e;
      ready.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  void get() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return ready.load(std::memory_order_acquire); });
    if (exception) {
      std::rethrow_exception(exception);
    }
  }

  bool is_ready() const { return ready.load(std::memory_order_acquire); }
};

template <typename T> class coro_task;

// Everything except the return channel, which differs for void
template <typename T> struct coro_promise_base {
  std::shared_ptr<coro_shared_state<T>> state =
      std::make_shared<coro_shared_state<T>>();
  executor *scheduler_{nullptr};

  // The frame is released by whichever of the task object and the final
  // suspend point lets go last.
  std::atomic<int> refs{2};

  bool release() noexcept {
    return refs.fetch_sub(1, std::memory_order_acq_rel) == 1;
  }

  executor *scheduler() const noexcept { return scheduler_; }

  std::suspend_always initial_suspend() noexcept { return {}; }

  struct final_awaiter {
    bool await_ready() noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      auto state = h.promise().state;
      std::coroutine_handle<> next = std::noop_coroutine();
      {
        std::lock_guard lock(state->mutex);
        state->finished = true;
        if (state->continuation)
          next = state->continuation;
      }
      if (h.promise().release())
        h.destroy();
      return next;
    }

    void await_resume() noexcept {}
  };

  final_awaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() { state->set_exception(std::current_exception()); }
};

template <typename T> struct coro_promise : coro_promise_base<T> {
  coro_task<T> get_return_object();

  void return_value(T value) { this->state->set_value(std::move(value)); }
};

template <> struct coro_promise<void> : coro_promise_base<void> {
  coro_task<void> get_return_object();

  void return_void() { state->set_value(); }
};

// Lazily started coroutine. start() hands it to an executor; awaiting it
// from another coro_task starts it on the awaiting task's executor.
template <typename T = void> class coro_task {
public:
  using promise_type = coro_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  coro_task(const coro_task &) = delete;
  coro_task &operator=(const coro_task &) = delete;

  coro_task(coro_task &&other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)),
        state_(std::move(other.state_)),
        started_(other.started_.load()) {}

  coro_task &operator=(coro_task &&other) noexcept {
    if (this != &other) {
      drop();
      handle_ = std::exchange(other.handle_, nullptr);
      state_ = std::move(other.state_);
      started_.store(other.started_.load());
    }
    return *this;
  }

  ~coro_task() { drop(); }

  // Awaitable interface for co_await
  bool await_ready() const noexcept { return state_ && state_->is_ready(); }

  template <typename Promise>
  std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> awaiting) {
    {
      std::lock_guard lock(state_->mutex);
      if (state_->finished)
        return awaiting;
      state_->continuation = awaiting;
    }

    bool expected = false;
    if (started_.compare_exchange_strong(expected, true)) {
      if constexpr (SchedulerAwarePromise<Promise>) {
        handle_.promise().scheduler_ = awaiting.promise().scheduler();
      }
      return handle_;
    }
    return std::noop_coroutine();
  }

  T await_resume() { return state_->get(); }

  // Blocking get for non-coroutine contexts. The task must have been started.
  T get() { return state_->get(); }

  bool is_ready() const { return state_ && state_->is_ready(); }

  // Start execution on the given executor (no-op if already started)
  void start(executor &exec) {
    bool expected = false;
    if (started_.compare_exchange_strong(expected, true) && handle_) {
      handle_.promise().scheduler_ = &exec;
      exec.schedule(handle_);
    }
  }

  bool is_started() const { return started_.load(); }

private:
  friend struct coro_promise<T>;

  explicit coro_task(handle_type h)
      : handle_(h), state_(h.promise().state), started_(false) {}

  void drop() noexcept {
    if (!handle_)
      return;
    // Never started: still parked at initial_suspend, we are the only owner
    if (!started_.load()) {
      handle_.destroy();
    } else if (handle_.promise().release()) {
      handle_.destroy();
    }
    handle_ = nullptr;
  }

  handle_type handle_;
  std::shared_ptr<coro_shared_state<T>> state_;
  std::atomic<bool> started_;
};

template <typename T> coro_task<T> coro_promise<T>::get_return_object() {
  return coro_task<T>{coro_task<T>::handle_type::from_promise(*this)};
}

inline coro_task<void> coro_promise<void>::get_return_object() {
  return coro_task<void>{coro_task<void>::handle_type::from_promise(*this)};
}

} // namespace oneshot

#endif // ONESHOT_CORO_TASK_HPP
