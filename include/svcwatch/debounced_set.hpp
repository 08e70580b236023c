#pragma once

#include <svcwatch/assert.hpp>
#include <svcwatch/detail/unique_function.hpp>
#include <svcwatch/timer_handle.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <variant>

namespace svcwatch {

/// Set of keys whose removal is delayed to absorb lost/found flapping.
///
/// - `put(key, true)`: emits `on_add(key)` if the key was not tracked; cancels a pending
///   removal otherwise (no signal).
/// - `put(key, false)`: schedules removal after `debounce`. If the key is presented again
///   before the deadline no `on_remove` is ever emitted for it. A zero debounce removes
///   synchronously.
/// - `clear()`: forgets everything and cancels every timer without emitting.
///
/// Not thread-safe: the owner serializes `put`, `clear` and timer expiry. The scheduler
/// passed at construction decides on which context expiries run, and the owner usually wraps
/// the expiry callback so that it takes the owner's lock first. Signals are emitted from
/// inside `put` / expiry, so they run under whatever lock the caller holds.
template <class Key, class Hash = std::hash<Key>>
class debounced_set {
 public:
  using duration = std::chrono::milliseconds;
  using clock = std::chrono::steady_clock;
  using scheduler_type =
    detail::unique_function<timer_handle(duration, detail::unique_function<void()>)>;
  using signal_type = detail::unique_function<void(Key const&)>;

  debounced_set(duration debounce, scheduler_type schedule, signal_type on_add,
                signal_type on_remove)
      : debounce_(debounce),
        schedule_(std::move(schedule)),
        on_add_(std::move(on_add)),
        on_remove_(std::move(on_remove)) {
    SVCWATCH_ENSURE(debounce_.count() >= 0, "debounced_set: negative debounce");
    SVCWATCH_ENSURE(static_cast<bool>(on_add_) && static_cast<bool>(on_remove_),
                    "debounced_set: missing signal");
    SVCWATCH_ENSURE(debounce_.count() == 0 || static_cast<bool>(schedule_),
                    "debounced_set: a non-zero debounce needs a scheduler");
  }

  debounced_set(debounced_set const&) = delete;
  auto operator=(debounced_set const&) -> debounced_set& = delete;

  ~debounced_set() { clear(); }

  void put(Key const& key, bool is_present) {
    auto it = entries_.find(key);

    if (is_present) {
      if (it == entries_.end()) {
        entries_.emplace(key, present{});
        on_add_(key);
        return;
      }
      if (auto* p = std::get_if<pending_removal_state>(&it->second)) {
        (void)p->timer.cancel();
        it->second = present{};
      }
      return;
    }

    if (it == entries_.end() || std::holds_alternative<pending_removal_state>(it->second)) {
      // Unknown key, or already on its way out: keep the original deadline.
      return;
    }

    if (debounce_.count() == 0) {
      entries_.erase(it);
      on_remove_(key);
      return;
    }

    auto const generation = next_generation_++;
    auto timer = schedule_(debounce_, [this, key, generation]() { expire(key, generation); });
    it->second = pending_removal_state{clock::now() + debounce_, std::move(timer), generation};
  }

  void clear() noexcept {
    for (auto& [key, entry] : entries_) {
      if (auto* p = std::get_if<pending_removal_state>(&entry)) {
        (void)p->timer.cancel();
      }
    }
    entries_.clear();
  }

  /// True if the key is present or pending removal.
  auto contains(Key const& key) const -> bool { return entries_.find(key) != entries_.end(); }

  auto pending_removal(Key const& key) const -> bool {
    auto it = entries_.find(key);
    return it != entries_.end() && std::holds_alternative<pending_removal_state>(it->second);
  }

  auto size() const noexcept -> std::size_t { return entries_.size(); }
  auto empty() const noexcept -> bool { return entries_.empty(); }
  auto debounce() const noexcept -> duration { return debounce_; }

 private:
  struct present {};

  struct pending_removal_state {
    clock::time_point deadline{};
    timer_handle timer{};
    // Distinguishes this removal from a later one for the same key, in case the expiry
    // callback was already running when the timer was cancelled.
    std::uint64_t generation = 0;
  };

  using entry = std::variant<present, pending_removal_state>;

  void expire(Key const& key, std::uint64_t generation) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return;
    }
    auto const* p = std::get_if<pending_removal_state>(&it->second);
    if (p == nullptr || p->generation != generation) {
      return;
    }
    entries_.erase(it);
    on_remove_(key);
  }

  duration debounce_;
  scheduler_type schedule_;
  signal_type on_add_;
  signal_type on_remove_;
  std::unordered_map<Key, entry, Hash> entries_{};
  std::uint64_t next_generation_ = 1;
};

}  // namespace svcwatch
