#pragma once

#include <svcwatch/assert.hpp>
#include <svcwatch/detail/unique_function.hpp>
#include <svcwatch/executor.hpp>
#include <svcwatch/log.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace svcwatch {

/// Batches events signalled from any thread and delivers them in order on one executor.
///
/// Semantics:
/// - `signal(ev)` appends `ev` to the batch. If no delivery is scheduled, one is posted to
///   the delivery executor; otherwise the event rides along with the scheduled one.
/// - A delivery takes the whole batch, clears the "scheduled" flag first, and then hands
///   the events to the sink in signal order. Events signalled while the sink runs schedule
///   the next delivery, so none is ever stranded.
/// - `invalidate()` drops the undelivered batch; events signalled before it are never
///   delivered, including ones already taken by a delivery in progress.
/// - `close()` invalidates and turns every later `signal()` into a no-op.
///
/// The delivery task holds the shared state, so a delivery queued on the executor stays
/// valid after the coalescer itself is gone; it then finds the coalescer closed.
template <class Event>
class notification_coalescer {
 public:
  using sink_type = detail::unique_function<void(Event&)>;

  notification_coalescer(any_executor delivery, sink_type sink)
      : state_(std::make_shared<state>(std::move(delivery), std::move(sink))) {
    SVCWATCH_ENSURE(state_->delivery, "notification_coalescer: empty delivery executor");
    SVCWATCH_ENSURE(state_->sink, "notification_coalescer: empty sink");
  }

  notification_coalescer(notification_coalescer const&) = delete;
  auto operator=(notification_coalescer const&) -> notification_coalescer& = delete;

  ~notification_coalescer() { close(); }

  void signal(Event ev) {
    bool schedule = false;
    {
      std::scoped_lock lk{state_->m};
      if (state_->closed) {
        return;
      }
      state_->batch.push_back(entry{state_->epoch, std::move(ev)});
      if (!state_->scheduled) {
        state_->scheduled = true;
        ++state_->deliveries;
        schedule = true;
      }
    }
    if (schedule) {
      auto st = state_;
      st->delivery.post([st]() mutable { notification_coalescer::deliver(std::move(st)); });
    }
  }

  void invalidate() noexcept {
    std::scoped_lock lk{state_->m};
    ++state_->epoch;
    state_->batch.clear();
  }

  void close() noexcept {
    std::scoped_lock lk{state_->m};
    state_->closed = true;
    ++state_->epoch;
    state_->batch.clear();
  }

  /// True while a delivery is posted but has not yet taken the batch.
  auto scheduled() const -> bool {
    std::scoped_lock lk{state_->m};
    return state_->scheduled;
  }

  /// Number of deliveries posted so far.
  auto deliveries() const -> std::size_t {
    std::scoped_lock lk{state_->m};
    return state_->deliveries;
  }

 private:
  struct entry {
    std::uint64_t epoch;
    Event event;
  };

  struct state {
    state(any_executor delivery_, sink_type sink_)
        : delivery(std::move(delivery_)), sink(std::move(sink_)) {}

    any_executor delivery;
    // Only the delivery task calls the sink, one at a time.
    sink_type sink;

    mutable std::mutex m{};
    std::vector<entry> batch{};
    std::uint64_t epoch = 0;
    bool scheduled = false;
    bool closed = false;
    std::size_t deliveries = 0;

    auto current(std::uint64_t e) -> bool {
      std::scoped_lock lk{m};
      return !closed && e == epoch;
    }
  };

  static void deliver(std::shared_ptr<state> st) {
    std::vector<entry> batch;
    {
      std::scoped_lock lk{st->m};
      st->scheduled = false;
      batch.swap(st->batch);
    }

    for (auto& e : batch) {
      if (!st->current(e.epoch)) {
        continue;
      }
      try {
        st->sink(e.event);
      } catch (std::exception const& ex) {
        SVCWATCH_LOG_ERROR("listener threw: {}", ex.what());
      }
    }
  }

  std::shared_ptr<state> state_;
};

}  // namespace svcwatch
