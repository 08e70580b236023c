#include <svcwatch/resolve_queue.hpp>

#include <iterator>
#include <utility>

namespace svcwatch {

auto resolve_queue::enqueue(std::string key) -> bool {
  if (index_.find(key) != index_.end()) {
    return false;
  }
  order_.push_back(std::move(key));
  auto it = std::prev(order_.end());
  index_.emplace(std::string_view{*it}, it);
  return true;
}

auto resolve_queue::dequeue_next() -> std::optional<std::string> {
  if (order_.empty()) {
    return std::nullopt;
  }
  index_.erase(std::string_view{order_.front()});
  std::string key = std::move(order_.front());
  order_.pop_front();
  return key;
}

auto resolve_queue::erase(std::string_view key) -> bool {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return false;
  }
  auto node = it->second;
  index_.erase(it);
  order_.erase(node);
  return true;
}

void resolve_queue::clear() noexcept {
  index_.clear();
  order_.clear();
}

auto resolve_queue::contains(std::string_view key) const -> bool {
  return index_.find(key) != index_.end();
}

}  // namespace svcwatch
