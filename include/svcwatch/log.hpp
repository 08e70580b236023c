#pragma once

#include <svcwatch/detail/unique_function.hpp>

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace svcwatch {

enum class log_level : std::uint8_t {
  debug,
  info,
  warn,
  error,
  off,
};

auto to_string(log_level level) noexcept -> std::string_view;

/// Process-wide diagnostic sink.
///
/// Messages below the threshold are discarded before formatting. The default sink writes
/// `[svcwatch] <LEVEL> <message>` lines to stderr; tests and embedders replace it with
/// `set_sink()`. The sink is called under the logger's mutex, one line at a time.
class logger {
 public:
  using sink_type = detail::unique_function<void(log_level, std::string_view)>;

  static auto instance() -> logger&;

  void set_level(log_level level) noexcept { level_.store(level, std::memory_order_relaxed); }
  auto level() const noexcept -> log_level { return level_.load(std::memory_order_relaxed); }

  auto enabled(log_level level) const noexcept -> bool {
    return level != log_level::off && level >= this->level();
  }

  /// Replace the sink; an empty sink restores the stderr default.
  void set_sink(sink_type sink);

  void write(log_level level, std::string_view message) noexcept;

  template <typename... Args>
  void log(log_level level, fmt::format_string<Args...> fmt_str, Args&&... args) noexcept {
    if (!enabled(level)) {
      return;
    }
    try {
      write(level, fmt::format(fmt_str, std::forward<Args>(args)...));
    } catch (std::exception const& e) {
      write(log_level::error, e.what());
    }
  }

 private:
  logger() = default;

  std::atomic<log_level> level_{log_level::warn};
  std::mutex mtx_{};
  sink_type sink_{};
};

}  // namespace svcwatch

#define SVCWATCH_LOG_DEBUG(...) \
  ::svcwatch::logger::instance().log(::svcwatch::log_level::debug, __VA_ARGS__)
#define SVCWATCH_LOG_INFO(...) \
  ::svcwatch::logger::instance().log(::svcwatch::log_level::info, __VA_ARGS__)
#define SVCWATCH_LOG_WARN(...) \
  ::svcwatch::logger::instance().log(::svcwatch::log_level::warn, __VA_ARGS__)
#define SVCWATCH_LOG_ERROR(...) \
  ::svcwatch::logger::instance().log(::svcwatch::log_level::error, __VA_ARGS__)
