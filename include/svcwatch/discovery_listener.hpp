#pragma once

#include <svcwatch/service_record.hpp>

#include <string_view>
#include <system_error>

namespace svcwatch {

/// Receiver of coordinator notifications.
///
/// Every callback runs on the coordinator's delivery event_loop, one at a time. Callbacks may
/// call `discovery_resolver::start()` / `stop()`. Exceptions derived from std::exception are
/// logged and do not stop the delivery of later events.
class discovery_listener {
 public:
  virtual ~discovery_listener() = default;

  virtual void on_discovery_started() = 0;
  virtual void on_discovery_stopped() = 0;
  virtual void on_start_discovery_failed(std::error_code ec) = 0;
  virtual void on_stop_discovery_failed(std::error_code ec) = 0;

  virtual void on_service_found(service_record_ptr const& record) = 0;
  virtual void on_service_lost(service_record_ptr const& record) = 0;
  virtual void on_service_resolved(service_record_ptr const& record) = 0;
  virtual void on_resolve_failed(std::string_view key, std::error_code ec) = 0;
};

}  // namespace svcwatch
