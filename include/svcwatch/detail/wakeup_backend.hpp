#pragma once

#include <chrono>
#include <memory>
#include <optional>

namespace svcwatch::detail {

/// Blocking primitive behind an event_loop.
///
/// The loop sleeps in `wait()` until a timer is due or another thread calls `wakeup()`.
/// Spurious returns are allowed; the loop re-checks its queues after every return.
class wakeup_backend {
 public:
  virtual ~wakeup_backend() = default;

  wakeup_backend() = default;
  wakeup_backend(wakeup_backend const&) = delete;
  auto operator=(wakeup_backend const&) -> wakeup_backend& = delete;
  wakeup_backend(wakeup_backend&&) = delete;
  auto operator=(wakeup_backend&&) -> wakeup_backend& = delete;

  /// Block for at most `timeout` (forever if empty) or until woken.
  virtual void wait(std::optional<std::chrono::milliseconds> timeout) = 0;

  /// Wake a thread blocked in `wait()`. Safe from any thread; coalesces repeated calls.
  virtual void wakeup() noexcept = 0;
};

// epoll + eventfd; see impl/backends/epoll.ipp.
auto make_wakeup_backend() -> std::unique_ptr<wakeup_backend>;

}  // namespace svcwatch::detail
