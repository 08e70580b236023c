#pragma once

#include <svcwatch/assert.hpp>
#include <svcwatch/event_loop.hpp>

#include <utility>

namespace svcwatch {

/// Keeps an event_loop's `run()` from returning for lack of work while the guard lives.
template <typename Executor>
class work_guard {
 public:
  using executor_type = Executor;

  explicit work_guard(executor_type const& ex) : executor_(ex), owns_(true) {
    SVCWATCH_ENSURE(executor_, "work_guard: requires a non-empty executor");
    executor_.add_work_guard();
  }

  work_guard(work_guard const&) = delete;
  auto operator=(work_guard const&) -> work_guard& = delete;

  work_guard(work_guard&& other) noexcept
      : executor_(std::move(other.executor_)), owns_(std::exchange(other.owns_, false)) {}

  auto operator=(work_guard&& other) noexcept -> work_guard& {
    if (this != &other) {
      reset();
      executor_ = std::move(other.executor_);
      owns_ = std::exchange(other.owns_, false);
    }
    return *this;
  }

  ~work_guard() { reset(); }

  auto get_executor() const noexcept -> executor_type { return executor_; }
  auto owns_work() const noexcept -> bool { return owns_; }

  void reset() noexcept {
    if (owns_) {
      executor_.remove_work_guard();
      owns_ = false;
    }
  }

 private:
  executor_type executor_;
  bool owns_ = false;
};

inline auto make_work_guard(event_loop& loop) -> work_guard<event_loop::executor_type> {
  return work_guard<event_loop::executor_type>(loop.get_executor());
}

}  // namespace svcwatch
