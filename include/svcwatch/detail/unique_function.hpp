#pragma once

#include <svcwatch/assert.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace svcwatch::detail {

#if defined(__cpp_lib_move_only_function) && __cpp_lib_move_only_function >= 202110L

template <typename Signature>
using unique_function = std::move_only_function<Signature>;

#else

/// Move-only type-erased callable.
///
/// Unlike std::function it accepts move-only closures (a callback owning a unique_ptr or a
/// promise). Callables are always heap allocated; svcwatch posts at most a handful per event.
template <typename>
class unique_function;

template <typename R, typename... Args>
class unique_function<R(Args...)> {
 public:
  unique_function() noexcept = default;
  unique_function(std::nullptr_t) noexcept {}

  template <typename F>
    requires(!std::is_same_v<std::decay_t<F>, unique_function>) &&
            std::is_invocable_r_v<R, std::decay_t<F>&, Args...>
  unique_function(F&& f) : impl_(std::make_unique<model<std::decay_t<F>>>(std::forward<F>(f))) {}

  unique_function(unique_function&&) noexcept = default;
  auto operator=(unique_function&&) noexcept -> unique_function& = default;

  unique_function(unique_function const&) = delete;
  auto operator=(unique_function const&) -> unique_function& = delete;

  ~unique_function() = default;

  explicit operator bool() const noexcept { return impl_ != nullptr; }

  auto operator()(Args... args) -> R {
    SVCWATCH_ASSERT(impl_ != nullptr, "unique_function: invoking an empty function");
    return impl_->invoke(std::forward<Args>(args)...);
  }

 private:
  struct concept_base {
    virtual ~concept_base() = default;
    virtual auto invoke(Args... args) -> R = 0;
  };

  template <typename F>
  struct model final : concept_base {
    template <typename U>
    explicit model(U&& u) : fn(std::forward<U>(u)) {}

    auto invoke(Args... args) -> R override {
      if constexpr (std::is_void_v<R>) {
        std::invoke(fn, std::forward<Args>(args)...);
      } else {
        return std::invoke(fn, std::forward<Args>(args)...);
      }
    }

    F fn;
  };

  std::unique_ptr<concept_base> impl_{};
};

#endif

}  // namespace svcwatch::detail
