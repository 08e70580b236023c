#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace svcwatch {

/// FIFO of service keys awaiting resolution; each key appears at most once.
///
/// Not thread-safe: the resolve_worker accesses it under the coordinator's lock.
class resolve_queue {
 public:
  /// Append `key` unless it is already queued. Returns true if it was appended.
  auto enqueue(std::string key) -> bool;

  /// Remove and return the oldest key.
  auto dequeue_next() -> std::optional<std::string>;

  /// Remove `key` wherever it sits. Returns true if it was queued.
  auto erase(std::string_view key) -> bool;

  void clear() noexcept;

  auto contains(std::string_view key) const -> bool;
  auto size() const noexcept -> std::size_t { return order_.size(); }
  auto empty() const noexcept -> bool { return order_.empty(); }

 private:
  std::list<std::string> order_{};
  // Keys view the strings owned by `order_`; list nodes never move.
  std::unordered_map<std::string_view, std::list<std::string>::iterator> index_{};
};

}  // namespace svcwatch
