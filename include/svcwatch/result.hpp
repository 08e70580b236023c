#pragma once

#include <svcwatch/error.hpp>
#include <svcwatch/expected.hpp>

#include <system_error>
#include <variant>

namespace svcwatch {

/// Result of a fallible svcwatch operation.
template <class T>
using result = expected<T, std::error_code>;

/// Result type for operations that produce no value.
using void_result = expected<std::monostate, std::error_code>;

[[nodiscard]] inline auto ok() noexcept -> void_result { return std::monostate{}; }
[[nodiscard]] inline auto fail(std::error_code ec) noexcept -> void_result {
  return unexpected(ec);
}

}  // namespace svcwatch
