#pragma once

#include <svcwatch/detail/unique_function.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace svcwatch::detail {

enum class timer_state : std::uint8_t {
  pending,
  fired,
  cancelled,
};

/// One scheduled callback on an event_loop.
///
/// `id`, `expiry` and `callback` are written once by the loop before the entry is published and
/// are not touched by other threads afterwards; only `state` is shared. Whoever wins the
/// pending -> fired / pending -> cancelled exchange owns the outcome.
struct timer_entry {
  std::uint64_t id{};
  std::chrono::steady_clock::time_point expiry{};
  unique_function<void()> callback{};
  std::atomic<timer_state> state{timer_state::pending};

  timer_entry() = default;

  timer_entry(timer_entry const&) = delete;
  auto operator=(timer_entry const&) -> timer_entry& = delete;
  timer_entry(timer_entry&&) = delete;
  auto operator=(timer_entry&&) -> timer_entry& = delete;

  auto is_pending() const noexcept -> bool {
    return state.load(std::memory_order_acquire) == timer_state::pending;
  }

  auto is_fired() const noexcept -> bool {
    return state.load(std::memory_order_acquire) == timer_state::fired;
  }

  auto is_cancelled() const noexcept -> bool {
    return state.load(std::memory_order_acquire) == timer_state::cancelled;
  }

  auto mark_fired() noexcept -> bool {
    auto expected = timer_state::pending;
    return state.compare_exchange_strong(expected, timer_state::fired, std::memory_order_acq_rel,
                                         std::memory_order_acquire);
  }

  auto cancel() noexcept -> bool {
    auto expected = timer_state::pending;
    return state.compare_exchange_strong(expected, timer_state::cancelled,
                                         std::memory_order_acq_rel, std::memory_order_acquire);
  }
};

struct timer_entry_later {
  auto operator()(std::shared_ptr<timer_entry> const& lhs,
                  std::shared_ptr<timer_entry> const& rhs) const noexcept -> bool {
    if (lhs->expiry != rhs->expiry) {
      return lhs->expiry > rhs->expiry;
    }
    // Equal deadlines fire in scheduling order.
    return lhs->id > rhs->id;
  }
};

}  // namespace svcwatch::detail
