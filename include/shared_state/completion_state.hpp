#ifndef ONESHOT_SHARED_STATE_COMPLETION_STATE_HPP
#define ONESHOT_SHARED_STATE_COMPLETION_STATE_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "concepts.hpp"
#include "policies.hpp"
#include "waker.hpp"

namespace oneshot {

// Thrown when a consumer tries to resolve a value that was already taken.
// This is a contract violation by the caller, never a transient failure.
struct already_consumed_error : std::logic_error {
  already_consumed_error()
      : std::logic_error("notify_waiter was resolved more than once") {}

  explicit already_consumed_error(const std::string &what)
      : std::logic_error(what) {}
};

// =============================================================================
// Completion State - one-shot value slot shared by producer and consumer
// =============================================================================
//
// Transitions (monotonic, never reused):
//   EMPTY --complete(v)--> COMPLETED
//   EMPTY --consumer dropped--> CANCELED
//
// All four fields are guarded by one lock. Wakes always happen after it is
// released.

template <Transferable T, LockPolicy Policy = mutex_lock_policy>
class completion_state {
  using mutex_type = typename Policy::mutex_type;
  using lock_type = typename Policy::lock_type;

  struct private_tag {};

public:
  using value_type = T;
  using lock_policy = Policy;

  explicit completion_state(private_tag) {}

  completion_state(const completion_state &) = delete;
  completion_state &operator=(const completion_state &) = delete;

  static std::shared_ptr<completion_state> create() {
    return std::make_shared<completion_state>(private_tag{});
  }

  // Deliver the value. Returns true if this call won; a late write against a
  // completed or canceled exchange is dropped silently.
  bool complete(T value) {
    waker pending;
    {
      lock_type lock(mutex_);
      if (completed_ || canceled_)
        return false;

      // Store first: if the move throws, the state is still EMPTY
      value_.emplace(std::move(value));
      completed_ = true;
      pending = std::exchange(waker_, waker{});
    }

    // Outside the lock, the woken coroutine may poll synchronously
    pending.wake();
    return true;
  }

  // Remember who to wake. Repeated registration by the same coroutine on the
  // same executor keeps the existing token.
  void register_waiter(const waker &w) {
    lock_type lock(mutex_);
    store_waker(w);
  }

  // Suspension check: the value if it is here, otherwise register w and
  // report nothing.
  std::optional<T> poll(const waker &w) {
    lock_type lock(mutex_);
    if (completed_)
      return take();

    store_waker(w);
    return std::nullopt;
  }

  // Same as poll() without leaving a wake registration behind
  std::optional<T> try_take() {
    lock_type lock(mutex_);
    if (completed_)
      return take();
    return std::nullopt;
  }

  void mark_canceled_if_incomplete() {
    lock_type lock(mutex_);
    waker_ = waker{};
    if (!completed_)
      canceled_ = true;
  }

  bool is_completed() const {
    lock_type lock(mutex_);
    return completed_;
  }

  bool is_canceled() const {
    lock_type lock(mutex_);
    return canceled_;
  }

  // Completed and not yet taken
  bool has_value() const {
    lock_type lock(mutex_);
    return value_.has_value();
  }

  // True once the delivered value has been moved out to the consumer
  bool is_consumed() const {
    lock_type lock(mutex_);
    return completed_ && !value_.has_value();
  }

private:
  // Requires the lock
  void store_waker(const waker &w) {
    if (!waker_ || !waker_.will_wake(w))
      waker_ = w;
  }

  // Requires the lock and completed_
  std::optional<T> take() {
    if (!value_)
      throw already_consumed_error{};

    std::optional<T> result{std::move(*value_)};
    value_.reset();
    return result;
  }

  mutable mutex_type mutex_;
  waker waker_;
  std::optional<T> value_;
  bool completed_{false};
  bool canceled_{false};
};

} // namespace oneshot

#endif // ONESHOT_SHARED_STATE_COMPLETION_STATE_HPP
