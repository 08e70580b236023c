#include <svcwatch/detail/lifecycle.hpp>
#include <svcwatch/log.hpp>

namespace svcwatch::detail {

auto to_string(discovery_phase p) noexcept -> std::string_view {
  switch (p) {
    case discovery_phase::stopped:
      return "stopped";
    case discovery_phase::starting:
      return "starting";
    case discovery_phase::started:
      return "started";
    case discovery_phase::stopping:
      return "stopping";
  }
  return "unknown";
}

auto lifecycle::request_start() noexcept -> lifecycle_command {
  target_started_ = true;
  if (phase_ != discovery_phase::stopped) {
    // Running already, or the in-flight command reconciles on completion.
    return lifecycle_command::none;
  }
  phase_ = discovery_phase::starting;
  return lifecycle_command::begin_discovery;
}

auto lifecycle::request_stop() noexcept -> lifecycle_command {
  target_started_ = false;
  if (phase_ != discovery_phase::started) {
    return lifecycle_command::none;
  }
  phase_ = discovery_phase::stopping;
  return lifecycle_command::end_discovery;
}

auto lifecycle::on_started() noexcept -> lifecycle_command {
  if (phase_ != discovery_phase::starting) {
    SVCWATCH_LOG_WARN("lifecycle: unexpected discovery-started while {}", to_string(phase_));
    return lifecycle_command::none;
  }
  if (target_started_) {
    phase_ = discovery_phase::started;
    return lifecycle_command::none;
  }
  phase_ = discovery_phase::stopping;
  return lifecycle_command::end_discovery;
}

auto lifecycle::on_stopped() noexcept -> lifecycle_command {
  if (phase_ != discovery_phase::stopping) {
    SVCWATCH_LOG_WARN("lifecycle: unexpected discovery-stopped while {}", to_string(phase_));
    return lifecycle_command::none;
  }
  if (!target_started_) {
    phase_ = discovery_phase::stopped;
    return lifecycle_command::none;
  }
  phase_ = discovery_phase::starting;
  return lifecycle_command::begin_discovery;
}

void lifecycle::on_start_failed() noexcept {
  if (phase_ != discovery_phase::starting) {
    SVCWATCH_LOG_WARN("lifecycle: unexpected start failure while {}", to_string(phase_));
    return;
  }
  phase_ = discovery_phase::stopped;
}

void lifecycle::on_stop_failed() noexcept {
  if (phase_ != discovery_phase::stopping) {
    SVCWATCH_LOG_WARN("lifecycle: unexpected stop failure while {}", to_string(phase_));
    return;
  }
  phase_ = discovery_phase::started;
}

void lifecycle::rollback(lifecycle_command cmd) noexcept {
  switch (cmd) {
    case lifecycle_command::begin_discovery:
      phase_ = discovery_phase::stopped;
      return;
    case lifecycle_command::end_discovery:
      phase_ = discovery_phase::started;
      return;
    case lifecycle_command::none:
      return;
  }
}

}  // namespace svcwatch::detail
