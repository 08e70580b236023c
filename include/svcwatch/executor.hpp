#pragma once

#include <svcwatch/assert.hpp>
#include <svcwatch/detail/unique_function.hpp>

#include <concepts>
#include <memory>
#include <utility>

// Minimal executor abstraction shared by the event loop, the thread pool and the components
// that schedule work onto them.
//
// Semantics:
// - post(fn): enqueue fn for later execution; never runs fn inline.
// - dispatch(fn): may run fn inline when the caller is already on the executor's thread.
// - Both are noexcept: an executor that cannot schedule handles it itself.

namespace svcwatch {

template <class Ex>
concept executor = requires(Ex const& ex, detail::unique_function<void()> fn) {
  { ex.post(std::move(fn)) } noexcept;
  { ex.dispatch(std::move(fn)) } noexcept;
};

/// Type-erased, copyable handle to any `executor`.
class any_executor {
 public:
  any_executor() = default;

  template <executor Ex>
    requires(!std::same_as<Ex, any_executor>)
  explicit any_executor(Ex ex) : impl_(std::make_shared<model<Ex>>(std::move(ex))) {}

  void post(detail::unique_function<void()> fn) const noexcept {
    SVCWATCH_ENSURE(impl_, "any_executor: empty impl_");
    impl_->post(std::move(fn));
  }

  void dispatch(detail::unique_function<void()> fn) const noexcept {
    SVCWATCH_ENSURE(impl_, "any_executor: empty impl_");
    impl_->dispatch(std::move(fn));
  }

  explicit operator bool() const noexcept { return static_cast<bool>(impl_); }

 private:
  struct concept_base {
    virtual ~concept_base() = default;
    virtual void post(detail::unique_function<void()>) noexcept = 0;
    virtual void dispatch(detail::unique_function<void()>) noexcept = 0;
  };

  template <class Ex>
  struct model final : concept_base {
    explicit model(Ex ex) : ex_(std::move(ex)) {}

    void post(detail::unique_function<void()> fn) noexcept override { ex_.post(std::move(fn)); }
    void dispatch(detail::unique_function<void()> fn) noexcept override {
      ex_.dispatch(std::move(fn));
    }

    Ex ex_;
  };

  std::shared_ptr<concept_base> impl_{};
};

}  // namespace svcwatch
