#include <svcwatch/detail/discovery_core.hpp>
#include <svcwatch/discovery_resolver.hpp>
#include <svcwatch/log.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace svcwatch {

namespace {

auto validated(discovery_options options) -> discovery_options {
  if (auto r = options.validate(); !r) {
    throw std::invalid_argument("discovery_resolver: " + r.error().message());
  }
  return options;
}

}  // namespace

discovery_resolver::discovery_resolver(discovery_options options, discovery_platform& platform,
                                       service_resolver& resolver, discovery_listener& listener,
                                       event_loop::executor_type delivery)
    : core_(detail::discovery_core::create(validated(std::move(options)), platform, resolver,
                                           listener, std::move(delivery))) {
  SVCWATCH_LOG_INFO("discovery_resolver for {} (debounce {}ms, resolve timeout {}ms)",
                    core_->options().service_type, core_->options().debounce.count(),
                    core_->options().resolve_timeout.count());
}

discovery_resolver::~discovery_resolver() {
  // Timers or deliveries already running on the loop may still hold the core briefly; after
  // shutdown they find it closed.
  core_->shutdown();
}

void discovery_resolver::start() { core_->start(); }

void discovery_resolver::stop() { core_->stop(); }

auto discovery_resolver::started() const -> bool { return core_->started(); }

auto discovery_resolver::phase() const -> detail::discovery_phase { return core_->phase(); }

auto discovery_resolver::services() const -> std::vector<service_record_ptr> {
  return core_->services();
}

auto discovery_resolver::find(std::string_view key) const -> result<service_record_ptr> {
  return core_->find(key);
}

auto discovery_resolver::events() noexcept -> discovery_events& { return *core_; }

auto discovery_resolver::options() const noexcept -> discovery_options const& {
  return core_->options();
}

}  // namespace svcwatch
