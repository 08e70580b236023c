#include <svcwatch/assert.hpp>
#include <svcwatch/detail/event_loop_impl.hpp>

#include <svcwatch/impl/backends/epoll.ipp>

#include <algorithm>
#include <chrono>
#include <utility>

namespace svcwatch::detail {

event_loop_impl::event_loop_impl() : backend_(make_wakeup_backend()) {}

auto event_loop_impl::this_thread_token() noexcept -> std::uintptr_t {
  // Each thread gets its own instance; its address is unique among live threads.
  static thread_local int tls_anchor = 0;
  return reinterpret_cast<std::uintptr_t>(&tls_anchor);
}

void event_loop_impl::set_thread_id() noexcept {
  thread_token_.store(this_thread_token(), std::memory_order_release);
}

auto event_loop_impl::running_in_this_thread() const noexcept -> bool {
  return thread_token_.load(std::memory_order_acquire) == this_thread_token();
}

auto event_loop_impl::run() -> std::size_t {
  set_thread_id();

  std::size_t count = 0;
  while (!stopped() && has_work()) {
    count += process_posted();
    count += process_timers();

    if (stopped() || !has_work()) {
      break;
    }

    backend_->wait(get_timeout());
  }
  return count;
}

auto event_loop_impl::run_one() -> std::size_t {
  set_thread_id();

  if (stopped()) {
    return 0;
  }

  std::size_t count = process_posted();
  if (count > 0) {
    return count;
  }
  count = process_timers();
  if (count > 0) {
    return count;
  }

  if (stopped() || !has_work()) {
    return 0;
  }

  backend_->wait(get_timeout());
  count = process_posted();
  return count + process_timers();
}

auto event_loop_impl::run_for(std::chrono::milliseconds timeout) -> std::size_t {
  set_thread_id();

  auto const deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t count = 0;

  while (!stopped() && has_work()) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }

    count += process_posted();
    count += process_timers();

    if (stopped() || !has_work()) {
      break;
    }

    auto wait_ms = std::chrono::ceil<std::chrono::milliseconds>(
      std::max(deadline - std::chrono::steady_clock::now(),
               std::chrono::steady_clock::duration::zero()));
    if (auto const timer_timeout = get_timeout()) {
      wait_ms = std::min(wait_ms, *timer_timeout);
    }
    backend_->wait(wait_ms);
  }
  return count;
}

void event_loop_impl::stop() {
  stopped_.store(true, std::memory_order_release);
  wakeup();
}

void event_loop_impl::restart() { stopped_.store(false, std::memory_order_release); }

void event_loop_impl::post(unique_function<void()> f) {
  {
    std::scoped_lock lk{posted_mutex_};
    posted_operations_.push(std::move(f));
  }
  wakeup();
}

void event_loop_impl::dispatch(unique_function<void()> f) {
  if (running_in_this_thread() && !stopped()) {
    f();
  } else {
    post(std::move(f));
  }
}

auto event_loop_impl::schedule_timer(std::chrono::milliseconds timeout,
                                     unique_function<void()> callback)
  -> std::shared_ptr<timer_entry> {
  SVCWATCH_ASSERT(timeout.count() >= 0, "event_loop_impl: negative schedule_timer timeout");
  if (timeout.count() < 0) {
    timeout = std::chrono::milliseconds{0};
  }

  auto entry = std::make_shared<timer_entry>();
  entry->expiry = std::chrono::steady_clock::now() + timeout;
  entry->callback = std::move(callback);

  {
    std::scoped_lock lk{timer_mutex_};
    entry->id = next_timer_id_++;
    timers_.push(entry);
  }

  wakeup();
  return entry;
}

void event_loop_impl::add_work_guard() noexcept {
  work_guard_counter_.fetch_add(1, std::memory_order_acq_rel);
}

void event_loop_impl::remove_work_guard() noexcept {
  auto const old = work_guard_counter_.fetch_sub(1, std::memory_order_acq_rel);
  SVCWATCH_ENSURE(old > 0,
                  "event_loop_impl: remove_work_guard() called more times than add_work_guard()");
  if (old == 1) {
    wakeup();
  }
}

auto event_loop_impl::process_timers() -> std::size_t {
  std::unique_lock lk{timer_mutex_};
  auto const now = std::chrono::steady_clock::now();
  std::size_t count = 0;

  while (!timers_.empty() && !stopped()) {
    auto entry = timers_.top();

    if (entry->is_cancelled()) {
      timers_.pop();
      continue;
    }
    if (entry->expiry > now) {
      break;
    }

    timers_.pop();

    // May lose to a concurrent cancel().
    if (!entry->mark_fired()) {
      continue;
    }

    lk.unlock();
    auto cb = std::move(entry->callback);
    if (cb) {
      cb();
    }
    ++count;
    lk.lock();
  }
  return count;
}

auto event_loop_impl::process_posted() -> std::size_t {
  std::queue<unique_function<void()>> local;
  {
    std::scoped_lock lk{posted_mutex_};
    std::swap(local, posted_operations_);
  }

  std::size_t n = 0;
  while (!local.empty()) {
    if (stopped()) {
      // Keep the remainder (in order, ahead of anything posted meanwhile) for restart().
      std::scoped_lock lk{posted_mutex_};
      while (!posted_operations_.empty()) {
        local.push(std::move(posted_operations_.front()));
        posted_operations_.pop();
      }
      std::swap(local, posted_operations_);
      break;
    }

    auto f = std::move(local.front());
    local.pop();
    if (f) {
      f();
    }
    ++n;
  }
  return n;
}

auto event_loop_impl::get_timeout() -> std::optional<std::chrono::milliseconds> {
  {
    std::scoped_lock lk{posted_mutex_};
    if (!posted_operations_.empty()) {
      return std::chrono::milliseconds{0};
    }
  }

  std::scoped_lock lk{timer_mutex_};
  while (!timers_.empty() && timers_.top()->is_cancelled()) {
    timers_.pop();
  }
  if (timers_.empty()) {
    return std::nullopt;
  }

  auto const now = std::chrono::steady_clock::now();
  auto const expiry = timers_.top()->expiry;
  if (expiry <= now) {
    return std::chrono::milliseconds{0};
  }
  // Round up so the loop never wakes a hair before the deadline and spins.
  return std::chrono::ceil<std::chrono::milliseconds>(expiry - now);
}

auto event_loop_impl::has_work() -> bool {
  if (work_guard_counter_.load(std::memory_order_acquire) > 0) {
    return true;
  }

  {
    std::scoped_lock lk{timer_mutex_};
    while (!timers_.empty() && timers_.top()->is_cancelled()) {
      timers_.pop();
    }
    if (!timers_.empty()) {
      return true;
    }
  }

  std::scoped_lock lk{posted_mutex_};
  return !posted_operations_.empty();
}

void event_loop_impl::wakeup() noexcept { backend_->wakeup(); }

}  // namespace svcwatch::detail
