#pragma once

#include <system_error>
#include <type_traits>

namespace svcwatch {

enum class error {
  /// A resolution attempt did not complete within its per-attempt timeout.
  timed_out = 1,

  /// Invalid argument / malformed configuration.
  invalid_argument,

  /// The requested service is not present in the canonical table.
  not_found,

  /// The discovery platform failed to begin discovery.
  start_discovery_failed,

  /// The discovery platform failed to end discovery.
  stop_discovery_failed,

  /// The resolver failed without a more specific error code.
  resolve_failed,

  /// The resolver threw instead of returning an error code.
  resolver_exception,

  /// The resolver returned SRV/A/TXT data that cannot form a service record.
  malformed_record,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace svcwatch

namespace std {

template <>
struct is_error_code_enum<svcwatch::error> : std::true_type {};

}  // namespace std
