#pragma once

#include <svcwatch/detail/timer_entry.hpp>
#include <svcwatch/detail/unique_function.hpp>
#include <svcwatch/detail/wakeup_backend.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace svcwatch::detail {

class event_loop_impl {
 public:
  event_loop_impl();
  ~event_loop_impl() = default;

  event_loop_impl(event_loop_impl const&) = delete;
  auto operator=(event_loop_impl const&) -> event_loop_impl& = delete;
  event_loop_impl(event_loop_impl&&) = delete;
  auto operator=(event_loop_impl&&) -> event_loop_impl& = delete;

  auto run() -> std::size_t;
  auto run_one() -> std::size_t;
  auto run_for(std::chrono::milliseconds timeout) -> std::size_t;

  void stop();
  void restart();
  auto stopped() const noexcept -> bool { return stopped_.load(std::memory_order_acquire); }

  void post(unique_function<void()> f);
  void dispatch(unique_function<void()> f);

  auto schedule_timer(std::chrono::milliseconds timeout, unique_function<void()> callback)
    -> std::shared_ptr<timer_entry>;

  void add_work_guard() noexcept;
  void remove_work_guard() noexcept;

  auto running_in_this_thread() const noexcept -> bool;

 private:
  // Opaque per-thread identity token, only meaningful for equality comparison.
  static auto this_thread_token() noexcept -> std::uintptr_t;
  void set_thread_id() noexcept;

  auto process_posted() -> std::size_t;
  auto process_timers() -> std::size_t;
  auto get_timeout() -> std::optional<std::chrono::milliseconds>;
  auto has_work() -> bool;
  void wakeup() noexcept;

  std::unique_ptr<wakeup_backend> backend_;

  std::atomic<bool> stopped_{false};

  std::priority_queue<std::shared_ptr<timer_entry>, std::vector<std::shared_ptr<timer_entry>>,
                      timer_entry_later>
    timers_;
  std::uint64_t next_timer_id_ = 1;
  std::mutex timer_mutex_;

  std::queue<unique_function<void()>> posted_operations_;
  std::mutex posted_mutex_;

  std::atomic<std::size_t> work_guard_counter_{0};
  std::atomic<std::uintptr_t> thread_token_{0};
};

}  // namespace svcwatch::detail
