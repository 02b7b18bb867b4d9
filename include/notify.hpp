#ifndef ONESHOT_NOTIFY_HPP
#define ONESHOT_NOTIFY_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "shared_state/completion_state.hpp"
#include "shared_state/concepts.hpp"
#include "shared_state/crtp_base.hpp"
#include "shared_state/policies.hpp"
#include "shared_state/waker.hpp"

namespace oneshot {

template <Transferable T, LockPolicy Policy = mutex_lock_policy>
class notifier;

template <Transferable T, LockPolicy Policy = mutex_lock_policy>
class notify_waiter;

// Create the linked producer/consumer pair for one value of type T
template <Transferable T, LockPolicy Policy = mutex_lock_policy>
std::pair<notifier<T, Policy>, notify_waiter<T, Policy>> make_notify();

// =============================================================================
// Notifier - producer side of a one-shot handoff
// =============================================================================

template <Transferable T, LockPolicy Policy> class notifier {
  using state_type = completion_state<T, Policy>;

public:
  using value_type = T;

  notifier(const notifier &) = delete;
  notifier &operator=(const notifier &) = delete;
  notifier(notifier &&) noexcept = default;
  notifier &operator=(notifier &&) noexcept = default;
  ~notifier() = default;

  // Hand the value to the waiter, resuming it if it is suspended. Only the
  // first call has an effect, and nothing happens once the waiter is gone.
  // Returns whether this call delivered the value.
  bool complete(T value) {
    if (!state_)
      return false;
    return state_->complete(std::move(value));
  }

  // Advisory: the waiter may still go away right after this returns false
  bool is_canceled() const { return state_ && state_->is_canceled(); }

private:
  friend std::pair<notifier, notify_waiter<T, Policy>> make_notify<T, Policy>();

  explicit notifier(std::shared_ptr<state_type> state)
      : state_(std::move(state)) {}

  std::shared_ptr<state_type> state_;
};

// =============================================================================
// Notify Waiter - consumer side, awaitable exactly once
// =============================================================================

template <Transferable T, LockPolicy Policy>
class notify_waiter
    : public awaitable_base<notify_waiter<T, Policy>, T> {
  using state_type = completion_state<T, Policy>;

  friend class awaitable_base<notify_waiter<T, Policy>, T>;

public:
  using value_type = T;

  notify_waiter(const notify_waiter &) = delete;
  notify_waiter &operator=(const notify_waiter &) = delete;

  notify_waiter(notify_waiter &&other) noexcept
      : state_(std::move(other.state_)), result_(std::move(other.result_)) {
    other.result_.reset();
  }

  notify_waiter &operator=(notify_waiter &&other) noexcept {
    if (this != &other) {
      abandon();
      state_ = std::move(other.state_);
      result_ = std::move(other.result_);
      other.result_.reset();
    }
    return *this;
  }

  // Going away before the value arrived is how the producer learns to stop
  ~notify_waiter() { abandon(); }

  // Poll without a coroutine frame: the value, or nothing after registering
  // w to be woken on completion.
  std::optional<T> poll(const waker &w) {
    if (!state_)
      throw already_consumed_error{};
    return state_->poll(w);
  }

  // A delivered value is waiting to be taken
  bool is_ready() const { return state_ && state_->has_value(); }

  explicit operator bool() const noexcept { return state_ != nullptr; }

private:
  friend std::pair<notifier<T, Policy>, notify_waiter>
  make_notify<T, Policy>();

  explicit notify_waiter(std::shared_ptr<state_type> state)
      : state_(std::move(state)) {}

  void abandon() noexcept {
    if (state_)
      state_->mark_canceled_if_incomplete();
  }

  bool ready_impl() const { return !state_ || state_->is_completed(); }

  bool suspend_impl(const waker &w) {
    // Once registered, the producer may resume and destroy this awaiter on
    // another thread before poll() returns; keep the state alive locally
    // and touch no member on the suspending path.
    auto state = state_;
    auto value = state->poll(w);
    if (!value)
      return true;

    result_ = std::move(value);
    return false;
  }

  T resume_impl() {
    if (result_) {
      T value = std::move(*result_);
      result_.reset();
      return value;
    }

    if (!state_)
      throw already_consumed_error{};

    auto value = state_->try_take();
    if (!value)
      throw std::logic_error("notify_waiter resumed before completion");
    return std::move(*value);
  }

  std::shared_ptr<state_type> state_;
  std::optional<T> result_;
};

template <Transferable T, LockPolicy Policy>
std::pair<notifier<T, Policy>, notify_waiter<T, Policy>> make_notify() {
  auto state = completion_state<T, Policy>::create();
  return {notifier<T, Policy>{state}, notify_waiter<T, Policy>{state}};
}

// =============================================================================
// Notify Future - legacy combined handle
// =============================================================================
//
// Every copy may complete the exchange and any copy may await it, but only
// one await across all copies receives the value. Dropping copies never
// cancels anything.

template <Transferable T, LockPolicy Policy = mutex_lock_policy>
class [[deprecated("use make_notify instead")]] notify_future
    : public awaitable_base<notify_future<T, Policy>, T> {
  using state_type = completion_state<T, Policy>;

  friend class awaitable_base<notify_future<T, Policy>, T>;

public:
  using value_type = T;

  notify_future() : state_(state_type::create()) {}

  notify_future(const notify_future &other) : state_(other.state_) {}

  notify_future &operator=(const notify_future &other) {
    state_ = other.state_;
    result_.reset();
    return *this;
  }

  void set_complete(T value) { state_->complete(std::move(value)); }

  bool is_ready() const { return state_->has_value(); }

private:
  bool ready_impl() const { return state_->is_completed(); }

  bool suspend_impl(const waker &w) {
    auto state = state_;
    auto value = take_or_report([&] { return state->poll(w); });
    if (!value)
      return true;

    result_ = std::move(value);
    return false;
  }

  T resume_impl() {
    if (result_) {
      T value = std::move(*result_);
      result_.reset();
      return value;
    }

    auto value = take_or_report([this] { return state_->try_take(); });
    if (!value)
      throw std::logic_error("notify_future resumed before completion");
    return std::move(*value);
  }

  template <typename Take> static std::optional<T> take_or_report(Take take) {
    try {
      return take();
    } catch (const already_consumed_error &) {
      throw already_consumed_error(
          "notify_future was awaited by more than one task; "
          "use make_notify instead");
    }
  }

  std::shared_ptr<state_type> state_;
  std::optional<T> result_;
};

} // namespace oneshot

#endif // ONESHOT_NOTIFY_HPP
