#pragma once

#include <svcwatch/assert.hpp>
#include <svcwatch/detail/event_loop_impl.hpp>
#include <svcwatch/detail/unique_function.hpp>
#include <svcwatch/timer_handle.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <utility>

namespace svcwatch {

template <typename Executor>
class work_guard;

/// Single-threaded execution context: posted tasks plus timers.
///
/// svcwatch uses one event_loop as the delivery context (every listener callback runs on it)
/// and as the home of the debounce timers. A thread_pool runs one event_loop per thread.
///
/// Semantics:
/// - `run*()` executes posted tasks and due timers on the calling thread.
/// - At most one thread may drive `run()`, `run_one()` or `run_for()` at a time.
/// - `run()` returns once `stop()` is requested or there is no work (no posted task, no
///   pending timer, no work_guard).
///
/// Threading:
/// - `post()`, `schedule_timer()` and `stop()` are safe to call from any thread.
class event_loop {
 public:
  class executor_type {
   public:
    executor_type() noexcept = default;
    explicit executor_type(std::shared_ptr<detail::event_loop_impl> impl) noexcept
        : impl_(std::move(impl)) {}

    void post(detail::unique_function<void()> f) const noexcept {
      ensure_impl().post(std::move(f));
    }

    void dispatch(detail::unique_function<void()> f) const noexcept {
      ensure_impl().dispatch(std::move(f));
    }

    /// Run `f` on the loop after `after` has elapsed.
    auto schedule_timer(std::chrono::milliseconds after, detail::unique_function<void()> f) const
      -> timer_handle {
      return timer_handle{ensure_impl().schedule_timer(after, std::move(f))};
    }

    auto running_in_this_thread() const noexcept -> bool {
      return impl_ != nullptr && impl_->running_in_this_thread();
    }

    /// True if the loop has been stopped (or this executor is empty).
    auto stopped() const noexcept -> bool { return impl_ == nullptr || impl_->stopped(); }

    explicit operator bool() const noexcept { return impl_ != nullptr; }

    friend auto operator==(executor_type const& a, executor_type const& b) noexcept -> bool {
      return a.impl_.get() == b.impl_.get();
    }

   private:
    template <typename>
    friend class work_guard;

    void add_work_guard() const noexcept {
      if (impl_ != nullptr) {
        impl_->add_work_guard();
      }
    }

    void remove_work_guard() const noexcept {
      if (impl_ != nullptr) {
        impl_->remove_work_guard();
      }
    }

    auto ensure_impl() const -> detail::event_loop_impl& {
      SVCWATCH_ENSURE(impl_, "event_loop::executor_type: empty impl_");
      return *impl_;
    }

    // Shared so that executors stay valid while tasks referencing them are in flight.
    std::shared_ptr<detail::event_loop_impl> impl_{};
  };

  event_loop() : impl_(std::make_shared<detail::event_loop_impl>()) {}
  ~event_loop() = default;

  event_loop(event_loop const&) = delete;
  auto operator=(event_loop const&) -> event_loop& = delete;
  event_loop(event_loop&&) = delete;
  auto operator=(event_loop&&) -> event_loop& = delete;

  /// Run until `stop()` is requested or there is no work.
  /// Returns the number of tasks and timers executed.
  auto run() -> std::size_t { return impl_->run(); }

  /// Execute the ready batch of work, waiting for at most one wakeup if nothing is ready.
  /// Returns 0 if nothing ran.
  auto run_one() -> std::size_t { return impl_->run_one(); }

  /// Run for at most `timeout`, or until stopped / out of work.
  auto run_for(std::chrono::milliseconds timeout) -> std::size_t {
    return impl_->run_for(timeout);
  }

  /// Request the loop to stop (idempotent). Pending work is kept for `restart()`.
  void stop() { impl_->stop(); }

  /// Clear the stopped state so the loop can run again.
  void restart() { impl_->restart(); }

  auto stopped() const noexcept -> bool { return impl_->stopped(); }

  auto get_executor() noexcept -> executor_type { return executor_type{impl_}; }

 private:
  std::shared_ptr<detail::event_loop_impl> impl_;
};

}  // namespace svcwatch
