#pragma once

#include <svcwatch/assert.hpp>
#include <svcwatch/event_loop.hpp>
#include <svcwatch/work_guard.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace svcwatch {

/// A fixed set of background threads, each driving its own event_loop.
///
/// svcwatch runs resolutions here, off the delivery loop and off the platform callback thread.
/// The pool is intentionally minimal: round-robin placement, no work stealing.
class thread_pool {
 public:
  /// Non-owning executor; the pool must outlive it and every task posted through it.
  class executor_type {
   public:
    executor_type() noexcept = default;
    explicit executor_type(thread_pool& pool) noexcept : pool_(&pool) {}

    void post(detail::unique_function<void()> f) const noexcept {
      SVCWATCH_ENSURE(pool_ != nullptr, "thread_pool::executor_type: empty pool_");
      pool_->pick_executor().post(std::move(f));
    }

    void dispatch(detail::unique_function<void()> f) const noexcept {
      SVCWATCH_ENSURE(pool_ != nullptr, "thread_pool::executor_type: empty pool_");
      pool_->pick_executor().dispatch(std::move(f));
    }

    explicit operator bool() const noexcept { return pool_ != nullptr; }

   private:
    thread_pool* pool_ = nullptr;
  };

  explicit thread_pool(std::size_t n_threads) {
    SVCWATCH_ENSURE(n_threads > 0, "thread_pool: n_threads must be > 0");

    loops_.reserve(n_threads);
    guards_.reserve(n_threads);
    threads_.reserve(n_threads);

    for (std::size_t i = 0; i < n_threads; ++i) {
      loops_.push_back(std::make_unique<event_loop>());
    }

    // Keep each loop alive until the pool is stopped.
    for (auto& loop : loops_) {
      guards_.push_back(make_work_guard(*loop));
    }

    for (std::size_t i = 0; i < loops_.size(); ++i) {
      threads_.emplace_back([this, i] { (void)loops_[i]->run(); });
    }
  }

  thread_pool(thread_pool const&) = delete;
  auto operator=(thread_pool const&) -> thread_pool& = delete;
  thread_pool(thread_pool&&) = delete;
  auto operator=(thread_pool&&) -> thread_pool& = delete;

  ~thread_pool() {
    stop();
    join();
  }

  auto get_executor() noexcept -> executor_type { return executor_type{*this}; }

  /// Stop all loops (idempotent). Tasks not yet started are dropped with their loop.
  void stop() noexcept {
    guards_.clear();
    for (auto& loop : loops_) {
      loop->stop();
    }
  }

  /// Join all threads (idempotent).
  void join() noexcept {
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  auto pick_executor() noexcept -> event_loop::executor_type {
    auto const i = rr_.fetch_add(1, std::memory_order_relaxed);
    return loops_[i % loops_.size()]->get_executor();
  }

  auto size() const noexcept -> std::size_t { return loops_.size(); }

 private:
  std::vector<std::unique_ptr<event_loop>> loops_{};
  std::vector<work_guard<event_loop::executor_type>> guards_{};
  std::vector<std::thread> threads_{};

  std::atomic<std::size_t> rr_{0};
};

}  // namespace svcwatch
