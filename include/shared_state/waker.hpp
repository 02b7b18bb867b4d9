#ifndef ONESHOT_SHARED_STATE_WAKER_HPP
#define ONESHOT_SHARED_STATE_WAKER_HPP

#include <coroutine>

namespace oneshot {

// =============================================================================
// Executor - the host runtime's resume hook
// =============================================================================

// Anything able to resume a suspended coroutine later, possibly on another
// thread. schedule() must be callable from any thread.
class executor {
public:
  virtual ~executor() = default;

  virtual void schedule(std::coroutine_handle<> handle) = 0;
};

// =============================================================================
// Waker - resumption token for one suspended coroutine
// =============================================================================

class waker {
public:
  waker() = default;

  explicit waker(std::coroutine_handle<> handle, executor *exec = nullptr)
      : handle_(handle), executor_(exec) {}

  // Request resumption. Without an executor the coroutine is resumed inline
  // on the calling thread.
  void wake() const {
    if (!handle_)
      return;
    if (executor_) {
      executor_->schedule(handle_);
    } else {
      handle_.resume();
    }
  }

  // True if waking either token resumes the same coroutine the same way
  bool will_wake(const waker &other) const noexcept {
    return handle_ == other.handle_ && executor_ == other.executor_;
  }

  executor *scheduler() const noexcept { return executor_; }

  explicit operator bool() const noexcept { return static_cast<bool>(handle_); }

private:
  std::coroutine_handle<> handle_{nullptr};
  executor *executor_{nullptr};
};

} // namespace oneshot

#endif // ONESHOT_SHARED_STATE_WAKER_HPP
