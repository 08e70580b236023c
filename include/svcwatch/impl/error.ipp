#include <svcwatch/error.hpp>

#include <string>

namespace svcwatch {

namespace detail {

class error_category_impl : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "svcwatch"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error>(ev)) {
      case error::timed_out:
        return "timed out";
      case error::invalid_argument:
        return "invalid argument";
      case error::not_found:
        return "service not found";

      // Discovery platform
      case error::start_discovery_failed:
        return "start discovery failed";
      case error::stop_discovery_failed:
        return "stop discovery failed";

      // Resolution
      case error::resolve_failed:
        return "resolve failed";
      case error::resolver_exception:
        return "resolver threw an exception";
      case error::malformed_record:
        return "malformed service record";
      default:
        return "unknown error";
    }
  }
};

auto error_category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), detail::error_category()};
}

}  // namespace svcwatch
