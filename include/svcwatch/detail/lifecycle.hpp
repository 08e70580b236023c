#pragma once

#include <cstdint>
#include <string_view>

namespace svcwatch::detail {

enum class discovery_phase : std::uint8_t {
  stopped,
  starting,
  started,
  stopping,
};

/// Platform command the caller must issue after a transition (outside its lock).
enum class lifecycle_command : std::uint8_t {
  none,
  begin_discovery,
  end_discovery,
};

auto to_string(discovery_phase p) noexcept -> std::string_view;

/// Desired vs. actual discovery state.
///
/// `phase` follows the platform (at most one command in flight: `starting`/`stopping`),
/// `target` follows the caller. Requests made while a command is in flight only move the
/// target; the completion reconciles by returning the opposite command when the target
/// changed meanwhile.
///
/// Not thread-safe; the coordinator calls it under its lock.
class lifecycle {
 public:
  auto request_start() noexcept -> lifecycle_command;
  auto request_stop() noexcept -> lifecycle_command;

  auto on_started() noexcept -> lifecycle_command;
  auto on_stopped() noexcept -> lifecycle_command;
  void on_start_failed() noexcept;
  void on_stop_failed() noexcept;

  /// Undo the phase change of `cmd` when issuing it failed.
  void rollback(lifecycle_command cmd) noexcept;

  auto phase() const noexcept -> discovery_phase { return phase_; }

  /// True once start() was requested and not cancelled by stop().
  auto started() const noexcept -> bool { return target_started_; }

  auto transitioning() const noexcept -> bool {
    return phase_ == discovery_phase::starting || phase_ == discovery_phase::stopping;
  }

 private:
  discovery_phase phase_ = discovery_phase::stopped;
  bool target_started_ = false;
};

}  // namespace svcwatch::detail
