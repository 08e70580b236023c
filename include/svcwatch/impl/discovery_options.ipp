#include <svcwatch/discovery_options.hpp>
#include <svcwatch/error.hpp>
#include <svcwatch/log.hpp>

namespace svcwatch {

auto discovery_options::validate() const -> void_result {
  if (service_type.empty()) {
    SVCWATCH_LOG_WARN("discovery_options: empty service_type");
    return fail(error::invalid_argument);
  }
  if (debounce.count() < 0) {
    SVCWATCH_LOG_WARN("discovery_options: negative debounce ({}ms)", debounce.count());
    return fail(error::invalid_argument);
  }
  if (resolve_timeout.count() <= 0) {
    SVCWATCH_LOG_WARN("discovery_options: resolve_timeout must be positive ({}ms)",
                      resolve_timeout.count());
    return fail(error::invalid_argument);
  }
  return ok();
}

}  // namespace svcwatch
