#include <svcwatch/assert.hpp>
#include <svcwatch/error.hpp>
#include <svcwatch/log.hpp>
#include <svcwatch/resolve_worker.hpp>

#include <exception>
#include <utility>

namespace svcwatch {

resolve_worker::resolve_worker(any_executor background, std::mutex& mtx, resolve_fn resolve,
                               complete_fn complete)
    : background_(std::move(background)),
      mtx_(mtx),
      resolve_(std::move(resolve)),
      complete_(std::move(complete)) {
  SVCWATCH_ENSURE(background_, "resolve_worker: empty background executor");
  SVCWATCH_ENSURE(resolve_, "resolve_worker: empty resolve function");
  SVCWATCH_ENSURE(complete_, "resolve_worker: empty completion hook");
}

auto resolve_worker::submit(std::string key) -> bool {
  if (!queue_.enqueue(std::move(key))) {
    return false;
  }
  if (!active_) {
    start_locked();
  }
  return true;
}

auto resolve_worker::cancel(std::string_view key) -> bool { return queue_.erase(key); }

void resolve_worker::reset() noexcept {
  queue_.clear();
  ++epoch_;
}

void resolve_worker::start_locked() {
  active_ = true;
  background_.post([this]() { drain(); });
}

void resolve_worker::drain() {
  for (;;) {
    std::string key;
    std::uint64_t epoch = 0;
    {
      std::scoped_lock lk{mtx_};
      auto next = queue_.dequeue_next();
      if (!next) {
        break;
      }
      key = std::move(*next);
      epoch = epoch_;
      in_flight_ = key;
      ++started_;
    }

    SVCWATCH_LOG_DEBUG("resolving {}", key);
    auto r = invoke_resolver(key);

    std::scoped_lock lk{mtx_};
    in_flight_.reset();
    if (epoch != epoch_) {
      SVCWATCH_LOG_DEBUG("dropping stale resolution of {}", key);
      continue;
    }
    try {
      complete_(key, std::move(r));
    } catch (std::exception const& e) {
      // The drain must reach finish_drain() or the worker never runs again.
      SVCWATCH_LOG_ERROR("committing the resolution of {} failed: {}", key, e.what());
    }
  }
  finish_drain();
}

void resolve_worker::finish_drain() {
  std::scoped_lock lk{mtx_};
  active_ = false;
  // A key submitted between the empty check above and here saw `active_ == true`.
  if (!queue_.empty()) {
    start_locked();
  }
}

auto resolve_worker::invoke_resolver(std::string const& key) -> result<resolve_result> {
  try {
    return resolve_(key);
  } catch (std::exception const& e) {
    SVCWATCH_LOG_WARN("resolver threw while resolving {}: {}", key, e.what());
    return unexpected(make_error_code(error::resolver_exception));
  }
}

}  // namespace svcwatch
