#pragma once

#include <svcwatch/detail/timer_entry.hpp>

#include <memory>
#include <utility>

namespace svcwatch {

/// Copyable reference to a timer scheduled on an event_loop.
///
/// An empty handle behaves like a timer that already fired: it is not pending and cannot be
/// cancelled. Cancellation is thread-safe and races with expiry are resolved by the timer's
/// own state: exactly one of "callback ran" and "cancel() returned true" happens.
class timer_handle {
 public:
  timer_handle() noexcept = default;
  explicit timer_handle(std::shared_ptr<detail::timer_entry> entry) noexcept
      : entry_(std::move(entry)) {}

  /// Cancel the timer. Returns true if this call prevented the callback from running.
  auto cancel() const noexcept -> bool { return entry_ != nullptr && entry_->cancel(); }

  auto pending() const noexcept -> bool { return entry_ != nullptr && entry_->is_pending(); }
  auto fired() const noexcept -> bool { return entry_ != nullptr && entry_->is_fired(); }
  auto cancelled() const noexcept -> bool { return entry_ != nullptr && entry_->is_cancelled(); }

  explicit operator bool() const noexcept { return entry_ != nullptr; }

  friend auto operator==(timer_handle const& a, timer_handle const& b) noexcept -> bool {
    return a.entry_ == b.entry_;
  }

 private:
  std::shared_ptr<detail::timer_entry> entry_{};
};

}  // namespace svcwatch
