#ifndef ONESHOT_SHARED_STATE_CONCEPTS_HPP
#define ONESHOT_SHARED_STATE_CONCEPTS_HPP

#include <concepts>
#include <coroutine>
#include <type_traits>

namespace oneshot {

class executor;

// =============================================================================
// Core Type Concepts
// =============================================================================

// Values handed from producer to consumer are moved out of the shared state
template <typename T>
concept Transferable = std::move_constructible<T> && !std::is_reference_v<T> &&
                       !std::is_void_v<T>;

// =============================================================================
// Coroutine Awaitable Concepts
// =============================================================================

template <typename T>
concept Awaiter = requires(T a, std::coroutine_handle<> h) {
  { a.await_ready() } -> std::convertible_to<bool>;
  { a.await_suspend(h) };
  { a.await_resume() };
};

template <typename T>
concept AwaitableWithMemberOperator = requires(T a) {
  { a.operator co_await() } -> Awaiter;
};

template <typename T>
concept Awaitable = Awaiter<T> || AwaitableWithMemberOperator<T>;

// Promise types that know which executor their coroutine runs on
template <typename P>
concept SchedulerAwarePromise = requires(P &p) {
  { p.scheduler() } -> std::convertible_to<executor *>;
};

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = requires {
  typename P::mutex_type;
  typename P::lock_type;
} && Lockable<typename P::mutex_type>;

} // namespace oneshot

#endif // ONESHOT_SHARED_STATE_CONCEPTS_HPP
