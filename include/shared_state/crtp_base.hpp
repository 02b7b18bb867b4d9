#ifndef ONESHOT_SHARED_STATE_CRTP_BASE_HPP
#define ONESHOT_SHARED_STATE_CRTP_BASE_HPP

#include <coroutine>

#include "concepts.hpp"
#include "waker.hpp"

namespace oneshot {

// Build the resumption token for a coroutine about to suspend. Coroutines
// whose promise knows its executor are rescheduled there, anything else is
// resumed inline by whoever wakes it.
template <typename Promise>
waker make_waker(std::coroutine_handle<Promise> h) {
  if constexpr (SchedulerAwarePromise<Promise>) {
    return waker{h, h.promise().scheduler()};
  } else {
    return waker{h};
  }
}

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================

template <typename Derived, typename T> class awaitable_base {
protected:
  // Derived class must implement:
  // - bool ready_impl() const
  // - bool suspend_impl(const waker &w)   (false resumes immediately)
  // - T resume_impl()

  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() const { return derived().ready_impl(); }

  template <typename Promise>
  bool await_suspend(std::coroutine_handle<Promise> h) {
    return derived().suspend_impl(make_waker(h));
  }

  T await_resume() { return derived().resume_impl(); }
};

// Specialization for void
template <typename Derived> class awaitable_base<Derived, void> {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() const { return derived().ready_impl(); }

  template <typename Promise>
  bool await_suspend(std::coroutine_handle<Promise> h) {
    return derived().suspend_impl(make_waker(h));
  }

  void await_resume() { derived().resume_impl(); }
};

} // namespace oneshot

#endif // ONESHOT_SHARED_STATE_CRTP_BASE_HPP
