#pragma once

#include <svcwatch/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace svcwatch {

/// SRV answer as returned by a resolver.
struct srv_record {
  std::string fqdn;    // owner name, e.g. "kitchen._http._tcp.local"
  std::string target;  // host name the service runs on
  std::uint16_t port = 0;
  std::uint16_t priority = 0;
  std::uint16_t weight = 0;
};

/// Raw output of one successful resolution: SRV plus address and TXT answers.
struct resolve_result {
  srv_record srv;
  std::vector<std::string> addresses;
  std::unordered_map<std::string, std::string> txt;
};

/// A service instance as announced by the discovery platform, before resolution.
struct discovered_service {
  std::string name;  // instance name, e.g. "kitchen"
  std::string type;  // service type, e.g. "_http._tcp."
  std::string host;  // empty when the platform does not report it
  std::uint16_t port = 0;
};

/// Connection details of one service.
///
/// Records are shared as `std::shared_ptr<service_record const>` and never mutated after
/// construction; a newer resolution replaces the pointer, not the contents.
struct service_record {
  std::string service_name;
  std::string full_name;
  std::string host;
  std::uint16_t port = 0;
  std::vector<std::string> addresses;
  std::unordered_map<std::string, std::string> attributes;

  friend auto operator==(service_record const&, service_record const&) -> bool = default;
};

using service_record_ptr = std::shared_ptr<service_record const>;

/// Stable identity of a service: `name + "." + type + "local"`.
///
/// Platforms report types with a trailing dot ("_http._tcp."), giving "a._http._tcp.local".
/// A type without the trailing dot gets one so the key is still a well-formed name.
auto make_service_key(std::string_view name, std::string_view type) -> std::string;

/// First DNS label of `fqdn` (everything before the first '.'), or `fqdn` itself.
auto first_label(std::string_view fqdn) noexcept -> std::string_view;

/// Build a record from resolver output. Fails with `error::malformed_record` when the SRV
/// owner name is empty.
auto make_service_record(resolve_result const& r) -> result<service_record>;

/// Build the provisional record reported by `on_service_found`.
auto make_service_record(discovered_service const& s) -> service_record;

}  // namespace svcwatch
