#pragma once

#include <svcwatch/detail/lifecycle.hpp>
#include <svcwatch/discovery_listener.hpp>
#include <svcwatch/discovery_options.hpp>
#include <svcwatch/discovery_platform.hpp>
#include <svcwatch/event_loop.hpp>
#include <svcwatch/result.hpp>
#include <svcwatch/service_record.hpp>
#include <svcwatch/service_resolver.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace svcwatch {

namespace detail {
class discovery_core;
}  // namespace detail

/// Keeps the set of live services of one type, resolved and debounced.
///
/// Platform found/lost events are debounced (a loss is only reported once the service stayed
/// away for `options.debounce`), newly found services are resolved one at a time on a
/// background thread, and every change is reported to the listener on the `delivery` loop.
///
/// Threading:
/// - `start()`, `stop()`, `services()` and `find()` are safe from any thread, including
///   listener callbacks.
/// - The platform reports back through the `discovery_events&` passed to its commands; those
///   callbacks are safe from any thread.
/// - Listener callbacks run only while the `delivery` loop is driven.
///
/// Lifetime: platform, resolver and listener must outlive this object, and the platform must
/// stop reporting events before it is destroyed. Destruction waits for a resolution in flight
/// and drops every notification not yet delivered.
class discovery_resolver {
 public:
  /// Throws std::invalid_argument if `options` does not validate.
  discovery_resolver(discovery_options options, discovery_platform& platform,
                     service_resolver& resolver, discovery_listener& listener,
                     event_loop::executor_type delivery);
  ~discovery_resolver();

  discovery_resolver(discovery_resolver const&) = delete;
  auto operator=(discovery_resolver const&) -> discovery_resolver& = delete;
  discovery_resolver(discovery_resolver&&) = delete;
  auto operator=(discovery_resolver&&) -> discovery_resolver& = delete;

  /// Begin discovery. Idempotent; during a stop in flight it only records the intent.
  void start();

  /// End discovery and synchronously forget every service, queued resolution and pending
  /// notification. Idempotent; during a start in flight it only records the intent.
  void stop();

  /// True between start() and stop(), whatever the platform has confirmed so far.
  auto started() const -> bool;
  auto phase() const -> detail::discovery_phase;

  /// Snapshot of the resolved services, ordered by full name.
  auto services() const -> std::vector<service_record_ptr>;

  /// Resolved record for `key` (see make_service_key), or `error::not_found`.
  auto find(std::string_view key) const -> result<service_record_ptr>;

  /// Platform-facing callbacks; the same object the platform commands receive.
  auto events() noexcept -> discovery_events&;

  auto options() const noexcept -> discovery_options const&;

 private:
  std::shared_ptr<detail::discovery_core> core_;
};

}  // namespace svcwatch
