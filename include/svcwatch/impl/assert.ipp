#include <svcwatch/assert.hpp>

#include <cstdio>
#include <cstdlib>

#include <fmt/core.h>

namespace svcwatch::detail {

// Deliberately bypasses the logger: the sink may be the thing that is broken.
void check_failed(char const* kind, char const* expr, char const* msg, char const* file,
                  int line, char const* func) noexcept {
  try {
    fmt::print(stderr, "[svcwatch] {} failure\n", kind);
    if (expr != nullptr) {
      fmt::print(stderr, "  expression: {}\n", expr);
    }
    if (msg != nullptr) {
      fmt::print(stderr, "  message   : {}\n", msg);
    }
    fmt::print(stderr, "  location  : {}:{}\n  function  : {}\n", file, line, func);
  } catch (...) {
    std::fputs("[svcwatch] check failure (diagnostic formatting failed)\n", stderr);
  }
  std::fflush(stderr);
  std::abort();
}

}  // namespace svcwatch::detail
