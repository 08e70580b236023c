#pragma once

#include <svcwatch/result.hpp>
#include <svcwatch/service_record.hpp>

#include <chrono>
#include <string>

namespace svcwatch {

/// Wire-level DNS-SD resolution of one service key.
///
/// Called from the background worker, never concurrently with itself. May block up to
/// `timeout`; a timeout is reported as `error::timed_out`. Exceptions are tolerated and
/// reported to the listener as `error::resolver_exception`.
class service_resolver {
 public:
  virtual ~service_resolver() = default;

  virtual auto resolve(std::string const& service_key, std::chrono::milliseconds timeout)
    -> result<resolve_result> = 0;
};

}  // namespace svcwatch
