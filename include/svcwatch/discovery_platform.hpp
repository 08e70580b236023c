#pragma once

#include <svcwatch/service_record.hpp>

#include <string>
#include <system_error>

namespace svcwatch {

/// Callbacks a discovery_platform reports to. Implemented by discovery_resolver.
///
/// May be called from any thread; found/lost events of one discovery session are expected
/// from a single thread at a time.
class discovery_events {
 public:
  virtual void on_discovery_started() = 0;
  virtual void on_discovery_stopped() = 0;
  virtual void on_start_discovery_failed(std::error_code ec) = 0;
  virtual void on_stop_discovery_failed(std::error_code ec) = 0;
  virtual void on_service_found(discovered_service const& service) = 0;
  virtual void on_service_lost(discovered_service const& service) = 0;

 protected:
  ~discovery_events() = default;
};

/// The platform's browse API (e.g. an mDNS responder), seen as two asynchronous commands.
///
/// A command returns once it is issued; its outcome arrives later through `events`:
/// `begin_discovery` completes with `on_discovery_started` or `on_start_discovery_failed`,
/// `end_discovery` with `on_discovery_stopped` or `on_stop_discovery_failed`. The
/// coordinator never has more than one command in flight. Completion may also be reported
/// from inside the command call itself.
class discovery_platform {
 public:
  virtual ~discovery_platform() = default;

  virtual void begin_discovery(std::string const& service_type, discovery_events& events) = 0;
  virtual void end_discovery(discovery_events& events) = 0;
};

}  // namespace svcwatch
