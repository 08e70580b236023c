#include <svcwatch/log.hpp>

#include <cstdio>
#include <exception>

#include <fmt/core.h>

namespace svcwatch {

auto to_string(log_level level) noexcept -> std::string_view {
  switch (level) {
    case log_level::debug:
      return "DEBUG";
    case log_level::info:
      return "INFO";
    case log_level::warn:
      return "WARN";
    case log_level::error:
      return "ERROR";
    case log_level::off:
      return "OFF";
  }
  return "UNKNOWN";
}

auto logger::instance() -> logger& {
  static logger instance;
  return instance;
}

void logger::set_sink(sink_type sink) {
  std::scoped_lock lk{mtx_};
  sink_ = std::move(sink);
}

void logger::write(log_level level, std::string_view message) noexcept {
  std::scoped_lock lk{mtx_};
  try {
    if (sink_) {
      sink_(level, message);
      return;
    }
    fmt::print(stderr, "[svcwatch] {} {}\n", to_string(level), message);
  } catch (std::exception const& e) {
    std::fprintf(stderr, "[svcwatch] log sink failed: %s\n", e.what());
  }
}

}  // namespace svcwatch
