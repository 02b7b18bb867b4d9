#ifndef ONESHOT_HPP
#define ONESHOT_HPP

// =============================================================================
// Oneshot
// =============================================================================
//
// One value, one producer, one consumer. make_notify<T>() returns a
// notifier (completes the exchange) and a notify_waiter (co_await it once).
// Dropping the waiter before a value arrives cancels the exchange, which the
// producer can observe through notifier::is_canceled().
//
// The primitive spawns no threads. It resumes the waiting coroutine through
// whatever executor the coroutine's promise reports, or inline.
//
// =============================================================================

#include "shared_state/concepts.hpp"
#include "shared_state/policies.hpp"
#include "shared_state/waker.hpp"
#include "shared_state/crtp_base.hpp"
#include "shared_state/completion_state.hpp"

#include "notify.hpp"

#endif // ONESHOT_HPP
