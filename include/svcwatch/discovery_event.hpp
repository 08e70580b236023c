#pragma once

#include <svcwatch/service_record.hpp>

#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace svcwatch {

struct discovery_started {};
struct discovery_stopped {};

struct start_discovery_failed {
  std::error_code ec;
};

struct stop_discovery_failed {
  std::error_code ec;
};

/// Announced by the platform; carries the provisional (unresolved) record.
struct service_found {
  service_record_ptr record;
};

/// Removed after the debounce delay; carries the last known record.
struct service_lost {
  service_record_ptr record;
};

struct service_resolved {
  service_record_ptr record;
};

struct resolve_failed {
  std::string key;
  std::error_code ec;
};

/// One listener notification, as queued between the producing thread and the delivery loop.
using discovery_event =
  std::variant<discovery_started, discovery_stopped, start_discovery_failed,
               stop_discovery_failed, service_found, service_lost, service_resolved,
               resolve_failed>;

auto event_name(discovery_event const& ev) noexcept -> std::string_view;

}  // namespace svcwatch
