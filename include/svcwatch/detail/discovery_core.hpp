#pragma once

#include <svcwatch/debounced_set.hpp>
#include <svcwatch/detail/lifecycle.hpp>
#include <svcwatch/discovery_event.hpp>
#include <svcwatch/discovery_listener.hpp>
#include <svcwatch/discovery_options.hpp>
#include <svcwatch/discovery_platform.hpp>
#include <svcwatch/event_loop.hpp>
#include <svcwatch/notification_coalescer.hpp>
#include <svcwatch/resolve_worker.hpp>
#include <svcwatch/result.hpp>
#include <svcwatch/service_record.hpp>
#include <svcwatch/service_resolver.hpp>
#include <svcwatch/thread_pool.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace svcwatch::detail {

/// State and logic behind discovery_resolver.
///
/// Shared-owned so that debounce timers and deliveries already queued on the delivery loop
/// can tell whether the coordinator still exists (they hold a weak_ptr). Everything below
/// `mtx_` is guarded by it; the notifier has its own lock, always taken after `mtx_`.
class discovery_core final : public discovery_events,
                             public std::enable_shared_from_this<discovery_core> {
  struct private_tag {};

 public:
  static auto create(discovery_options options, discovery_platform& platform,
                     service_resolver& resolver, discovery_listener& listener,
                     event_loop::executor_type delivery) -> std::shared_ptr<discovery_core>;

  discovery_core(private_tag, discovery_options options, discovery_platform& platform,
                 service_resolver& resolver, discovery_listener& listener,
                 event_loop::executor_type delivery);
  ~discovery_core();

  discovery_core(discovery_core const&) = delete;
  auto operator=(discovery_core const&) -> discovery_core& = delete;

  void start();
  void stop();

  /// Stop accepting platform events, drop undelivered notifications and join the worker.
  void shutdown() noexcept;

  auto started() const -> bool;
  auto phase() const -> discovery_phase;
  auto services() const -> std::vector<service_record_ptr>;
  auto find(std::string_view key) const -> result<service_record_ptr>;
  auto options() const noexcept -> discovery_options const& { return options_; }

  void on_discovery_started() override;
  void on_discovery_stopped() override;
  void on_start_discovery_failed(std::error_code ec) override;
  void on_stop_discovery_failed(std::error_code ec) override;
  void on_service_found(discovered_service const& service) override;
  void on_service_lost(discovered_service const& service) override;

 private:
  // Called with mtx_ held.
  void clear_locked() noexcept;
  void on_present(std::string const& key);
  void on_absent(std::string const& key);
  void commit(std::string const& key, result<resolve_result> r);
  void signal(discovery_event ev);

  auto schedule_removal(std::chrono::milliseconds after, unique_function<void()> expire)
    -> timer_handle;
  void issue(lifecycle_command cmd);
  void deliver(discovery_event& ev);

  discovery_options const options_;
  discovery_platform& platform_;
  service_resolver& resolver_;
  discovery_listener& listener_;
  event_loop::executor_type delivery_;

  mutable std::mutex mtx_{};
  bool closed_ = false;
  lifecycle lifecycle_{};
  std::unordered_map<std::string, service_record_ptr> services_{};
  // Provisional record of every tracked key, reported by service_found and, when the key is
  // lost before it resolves, by service_lost.
  std::unordered_map<std::string, service_record_ptr> announced_{};
  debounced_set<std::string> presence_;

  std::optional<notification_coalescer<discovery_event>> notifier_{};

  thread_pool pool_{1};
  resolve_worker worker_;
};

}  // namespace svcwatch::detail
