#pragma once

#include <svcwatch/result.hpp>

#include <chrono>
#include <string>

namespace svcwatch {

struct discovery_options {
  /// DNS-SD service type to browse, e.g. "_http._tcp.". Required.
  std::string service_type{};

  /// How long a lost service may stay tentatively present. Zero reports losses at once.
  std::chrono::milliseconds debounce{0};

  /// Per-attempt limit handed to the resolver.
  std::chrono::milliseconds resolve_timeout{1000};

  /// Returns `error::invalid_argument` if any field is out of range.
  auto validate() const -> void_result;
};

}  // namespace svcwatch
