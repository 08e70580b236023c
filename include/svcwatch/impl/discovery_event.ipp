#include <svcwatch/discovery_event.hpp>

namespace svcwatch {

namespace {

struct event_name_visitor {
  auto operator()(discovery_started const&) const noexcept -> std::string_view {
    return "discovery_started";
  }
  auto operator()(discovery_stopped const&) const noexcept -> std::string_view {
    return "discovery_stopped";
  }
  auto operator()(start_discovery_failed const&) const noexcept -> std::string_view {
    return "start_discovery_failed";
  }
  auto operator()(stop_discovery_failed const&) const noexcept -> std::string_view {
    return "stop_discovery_failed";
  }
  auto operator()(service_found const&) const noexcept -> std::string_view {
    return "service_found";
  }
  auto operator()(service_lost const&) const noexcept -> std::string_view {
    return "service_lost";
  }
  auto operator()(service_resolved const&) const noexcept -> std::string_view {
    return "service_resolved";
  }
  auto operator()(resolve_failed const&) const noexcept -> std::string_view {
    return "resolve_failed";
  }
};

}  // namespace

auto event_name(discovery_event const& ev) noexcept -> std::string_view {
  return std::visit(event_name_visitor{}, ev);
}

}  // namespace svcwatch
