#pragma once

#include <svcwatch/detail/unique_function.hpp>
#include <svcwatch/executor.hpp>
#include <svcwatch/resolve_queue.hpp>
#include <svcwatch/result.hpp>
#include <svcwatch/service_record.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace svcwatch {

/// Resolves queued service keys one at a time on a background executor.
///
/// At most one resolution is in flight. A drain task is posted when the first key arrives
/// while the worker is idle; it pops keys until the queue is empty and then exits. The exit
/// path marks the worker idle and re-checks the queue under the same lock, so a key submitted
/// while the task was finishing starts a new task instead of waiting for the next submit.
///
/// Locking:
/// - Every member function except the drain itself requires the caller to hold `mtx`
///   (the coordinator's lock, passed at construction).
/// - The resolver runs without the lock held. The completion hook runs with it held.
///
/// Lifetime: the background executor must be stopped and joined before the worker is
/// destroyed; the drain task refers to the worker by address.
class resolve_worker {
 public:
  using resolve_fn = detail::unique_function<result<resolve_result>(std::string const&)>;
  using complete_fn = detail::unique_function<void(std::string const&, result<resolve_result>)>;

  resolve_worker(any_executor background, std::mutex& mtx, resolve_fn resolve,
                 complete_fn complete);

  resolve_worker(resolve_worker const&) = delete;
  auto operator=(resolve_worker const&) -> resolve_worker& = delete;

  /// Queue `key` for resolution and start the drain if the worker is idle.
  /// Returns false if the key was already queued.
  auto submit(std::string key) -> bool;

  /// Drop a queued key. A resolution already in flight is not interrupted.
  auto cancel(std::string_view key) -> bool;

  /// Drop every queued key and discard the result of the resolution in flight, if any.
  void reset() noexcept;

  auto queue() const noexcept -> resolve_queue const& { return queue_; }
  auto active() const noexcept -> bool { return active_; }
  auto in_flight() const noexcept -> std::optional<std::string> const& { return in_flight_; }
  auto resolutions_started() const noexcept -> std::uint64_t { return started_; }

 private:
  void start_locked();
  void drain();
  void finish_drain();
  auto invoke_resolver(std::string const& key) -> result<resolve_result>;

  any_executor background_;
  std::mutex& mtx_;
  resolve_fn resolve_;
  complete_fn complete_;

  resolve_queue queue_{};
  bool active_ = false;
  std::optional<std::string> in_flight_{};
  std::uint64_t epoch_ = 0;
  std::uint64_t started_ = 0;
};

}  // namespace svcwatch
