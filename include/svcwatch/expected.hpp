#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

#include <version>
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#endif

namespace svcwatch {

// `std::expected` when the standard library ships it (C++23), otherwise the subset svcwatch
// needs: construction from a value or an `unexpected`, observers, and `value_or`.
// `T = void` is not supported by the fallback; use `void_result` from result.hpp.
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L

template <class E>
using unexpected = std::unexpected<E>;

template <class T, class E>
using expected = std::expected<T, E>;

#else

template <class E>
class bad_expected_access : public std::exception {
 public:
  explicit bad_expected_access(E e) : err_(std::move(e)) {}

  auto error() const& noexcept -> E const& { return err_; }

  auto what() const noexcept -> char const* override { return "bad expected access"; }

 private:
  E err_;
};

template <class E>
class unexpected {
 public:
  constexpr explicit unexpected(E e) : error_(std::move(e)) {}

  constexpr auto error() const& noexcept -> E const& { return error_; }
  constexpr auto error() && noexcept -> E&& { return std::move(error_); }

  friend constexpr auto operator==(unexpected const& a, unexpected const& b) -> bool {
    return a.error_ == b.error_;
  }

 private:
  E error_;
};

template <class E>
unexpected(E) -> unexpected<E>;

template <class T, class E>
class expected {
  static_assert(!std::is_void_v<T>, "svcwatch::expected fallback does not support void");

 public:
  using value_type = T;
  using error_type = E;

  constexpr expected() : storage_(std::in_place_index<0>) {}
  constexpr expected(T const& v) : storage_(std::in_place_index<0>, v) {}
  constexpr expected(T&& v) : storage_(std::in_place_index<0>, std::move(v)) {}

  template <class G>
    requires std::is_constructible_v<E, G const&>
  constexpr expected(unexpected<G> const& u) : storage_(std::in_place_index<1>, u.error()) {}

  template <class G>
    requires std::is_constructible_v<E, G&&>
  constexpr expected(unexpected<G>&& u)
      : storage_(std::in_place_index<1>, std::move(u).error()) {}

  constexpr auto has_value() const noexcept -> bool { return storage_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr auto value() & -> T& {
    check();
    return std::get<0>(storage_);
  }
  constexpr auto value() const& -> T const& {
    check();
    return std::get<0>(storage_);
  }
  constexpr auto value() && -> T&& {
    check();
    return std::move(std::get<0>(storage_));
  }

  template <class U>
  constexpr auto value_or(U&& fallback) const& -> T {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
  }

  constexpr auto error() const& noexcept -> E const& { return std::get<1>(storage_); }
  constexpr auto error() && noexcept -> E&& { return std::move(std::get<1>(storage_)); }

  constexpr auto operator*() & noexcept -> T& { return std::get<0>(storage_); }
  constexpr auto operator*() const& noexcept -> T const& { return std::get<0>(storage_); }
  constexpr auto operator*() && noexcept -> T&& { return std::move(std::get<0>(storage_)); }

  constexpr auto operator->() noexcept -> T* { return &std::get<0>(storage_); }
  constexpr auto operator->() const noexcept -> T const* { return &std::get<0>(storage_); }

 private:
  constexpr void check() const {
    if (!has_value()) {
      throw bad_expected_access<E>(std::get<1>(storage_));
    }
  }

  std::variant<T, E> storage_;
};

#endif

}  // namespace svcwatch
