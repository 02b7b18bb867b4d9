#ifndef ONESHOT_SLEEP_HPP
#define ONESHOT_SLEEP_HPP

#include <chrono>

#include "shared_state/crtp_base.hpp"
#include "shared_state/waker.hpp"
#include "timer_service.hpp"

namespace oneshot {

class sleep_awaiter : public awaitable_base<sleep_awaiter, void> {
public:
  explicit sleep_awaiter(std::chrono::steady_clock::time_point deadline)
      : deadline_(deadline) {}

  bool ready_impl() const {
    return std::chrono::steady_clock::now() >= deadline_;
  }

  bool suspend_impl(const waker &w) {
    get_timer_service().add_timer(deadline_, w);
    return true;
  }

  void resume_impl() {}

private:
  std::chrono::steady_clock::time_point deadline_;
};

// Suspend the calling coroutine for a duration. It resumes on its own
// executor, or on the timer thread when it has none.
template <typename Rep, typename Period>
sleep_awaiter sleep(std::chrono::duration<Rep, Period> duration) {
  return sleep_awaiter(std::chrono::steady_clock::now() + duration);
}

} // namespace oneshot

#endif // ONESHOT_SLEEP_HPP
