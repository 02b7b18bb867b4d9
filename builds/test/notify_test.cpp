#include <cassert>
#include <coroutine>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "oneshot.hpp"

using namespace oneshot;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// Records schedule() calls instead of resuming anything
class recording_executor : public executor {
public:
  void schedule(std::coroutine_handle<> handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduled_.push_back(handle);
  }

  std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduled_.size();
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::coroutine_handle<>> scheduled_;
};

waker noop_waker(recording_executor &exec) {
  return waker{std::noop_coroutine(), &exec};
}

// Move constructor throws while armed
struct fragile {
  static inline bool armed = false;

  int value{0};

  explicit fragile(int v) : value(v) {}
  fragile(fragile &&other) : value(other.value) {
    if (armed)
      throw std::runtime_error("move failed");
  }
};

// =============================================================================
// Completion State Tests
// =============================================================================

void test_completion_state() {
  TEST("completion_state starts empty") {
    auto state = completion_state<int>::create();

    assert(!state->is_completed());
    assert(!state->is_canceled());
    assert(!state->try_take().has_value());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state first write wins") {
    auto state = completion_state<int>::create();

    bool first = state->complete(1);
    bool second = state->complete(2);
    assert(first);
    assert(!second);

    auto value = state->try_take();
    assert(value.has_value());
    assert(*value == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state cancel then complete is dropped") {
    auto state = completion_state<std::string>::create();

    state->mark_canceled_if_incomplete();
    bool delivered = state->complete("late");

    assert(!delivered);
    assert(state->is_canceled());
    assert(!state->is_completed());
    assert(!state->try_take().has_value());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state cancel after complete is ignored") {
    auto state = completion_state<int>::create();

    state->complete(5);
    state->mark_canceled_if_incomplete();

    assert(state->is_completed());
    assert(!state->is_canceled());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state wakes registered waiter once") {
    recording_executor exec;
    auto state = completion_state<int>::create();

    auto value = state->poll(noop_waker(exec));
    assert(!value.has_value());
    assert(exec.count() == 0);

    state->complete(3);
    assert(exec.count() == 1);

    state->complete(4);
    assert(exec.count() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state keeps only the latest waker") {
    recording_executor first;
    recording_executor second;
    auto state = completion_state<int>::create();

    state->register_waiter(noop_waker(first));
    state->register_waiter(noop_waker(first));
    state->register_waiter(noop_waker(second));
    state->complete(9);

    assert(first.count() == 0);
    assert(second.count() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state cancel clears pending waker") {
    recording_executor exec;
    auto state = completion_state<int>::create();

    state->register_waiter(noop_waker(exec));
    state->mark_canceled_if_incomplete();
    state->complete(1);

    assert(exec.count() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state second take throws") {
    recording_executor exec;
    auto state = completion_state<int>::create();

    state->complete(7);
    auto value = state->poll(noop_waker(exec));
    assert(value.has_value());
    assert(*value == 7);
    assert(state->is_consumed());

    bool threw = false;
    try {
      auto again = state->poll(noop_waker(exec));
      (void)again;
    } catch (const already_consumed_error &) {
      threw = true;
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("completion_state throwing move leaves it completable") {
    auto state = completion_state<fragile>::create();

    fragile::armed = true;
    bool threw = false;
    try {
      state->complete(fragile{1});
    } catch (const std::runtime_error &) {
      threw = true;
    }
    fragile::armed = false;

    assert(threw);
    assert(!state->is_completed());
    assert(!state->is_canceled());

    bool delivered = state->complete(fragile{2});
    assert(delivered);
    auto value = state->try_take();
    assert(value.has_value());
    assert(value->value == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Notifier / Waiter Tests
// =============================================================================

void test_notify_pair() {
  TEST("dropping the waiter cancels") {
    auto pair = make_notify<int>();
    auto notify = std::move(pair.first);
    {
      auto waiter = std::move(pair.second);
    }

    assert(notify.is_canceled());
    bool delivered = notify.complete(1);
    assert(!delivered);
    assert(notify.is_canceled());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("live waiter is not canceled") {
    auto [notify, waiter] = make_notify<int>();

    assert(!notify.is_canceled());
    assert(!waiter.is_ready());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("dropping a resolved waiter does not cancel") {
    recording_executor exec;
    auto pair = make_notify<int>();
    auto notify = std::move(pair.first);
    {
      auto waiter = std::move(pair.second);
      notify.complete(11);
      auto value = waiter.poll(noop_waker(exec));
      assert(value.has_value());
      assert(*value == 11);
    }

    assert(!notify.is_canceled());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("moved-from waiter does not cancel") {
    auto pair = make_notify<int>();
    auto notify = std::move(pair.first);
    auto waiter = std::move(pair.second);
    {
      auto moved = std::move(waiter);
      assert(static_cast<bool>(moved));
      assert(!static_cast<bool>(waiter));
      notify.complete(2);
    }

    assert(!notify.is_canceled());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("move-assigning over a waiter cancels its exchange") {
    auto first = make_notify<int>();
    auto second = make_notify<int>();

    auto waiter = std::move(first.second);
    waiter = std::move(second.second);

    assert(first.first.is_canceled());
    assert(!second.first.is_canceled());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("waiter poll registers and then resolves") {
    recording_executor exec;
    auto [notify, waiter] = make_notify<std::string>();

    auto early = waiter.poll(noop_waker(exec));
    assert(!early.has_value());

    notify.complete("done");
    assert(exec.count() == 1);
    assert(waiter.is_ready());

    auto value = waiter.poll(noop_waker(exec));
    assert(value.has_value());
    assert(*value == "done");
    assert(!waiter.is_ready());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("spinlock_policy pair") {
    auto pair = make_notify<int, spinlock_policy>();
    auto notify = std::move(pair.first);
    auto waiter = std::move(pair.second);

    std::thread producer([&notify]() { notify.complete(42); });
    producer.join();

    recording_executor exec;
    auto value = waiter.poll(noop_waker(exec));
    assert(value.has_value());
    assert(*value == 42);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Legacy Handle Tests
// =============================================================================

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"

void test_notify_future() {
  TEST("notify_future clones share first write") {
    notify_future<int> future;
    notify_future<int> clone = future;

    clone.set_complete(1);
    future.set_complete(2);

    assert(future.is_ready());
    assert(clone.is_ready());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

#pragma GCC diagnostic pop

// =============================================================================
// Concept Tests (compile-time)
// =============================================================================

void test_concepts() {
  TEST("concepts compilation") {
    static_assert(Lockable<std::mutex>);
    static_assert(Lockable<spinlock>);

    static_assert(LockPolicy<mutex_lock_policy>);
    static_assert(LockPolicy<spinlock_policy>);

    static_assert(Transferable<int>);
    static_assert(Transferable<std::string>);
    static_assert(!Transferable<void>);
    static_assert(!Transferable<int &>);

    static_assert(Awaiter<notify_waiter<int>>);
    static_assert(Awaitable<notify_waiter<std::string, spinlock_policy>>);

    // Readiness checks take a lock, so they may throw
    static_assert(!noexcept(std::declval<notify_waiter<int> &>().await_ready()));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Oneshot Notify Tests ===" << std::endl << std::endl;

  std::cout << "--- Completion State Tests ---" << std::endl;
  test_completion_state();
  std::cout << std::endl;

  std::cout << "--- Notify Pair Tests ---" << std::endl;
  test_notify_pair();
  std::cout << std::endl;

  std::cout << "--- Legacy Handle Tests ---" << std::endl;
  test_notify_future();
  std::cout << std::endl;

  std::cout << "--- Concept Tests ---" << std::endl;
  test_concepts();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
