#include <svcwatch/detail/wakeup_backend.hpp>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <system_error>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace svcwatch::detail {

namespace {

void close_if_valid(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void drain_eventfd(int eventfd) noexcept {
  std::uint64_t value = 0;
  for (;;) {
    auto const n = ::read(eventfd, &value, sizeof(value));
    if (n > 0) {
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
}

}  // namespace

class wakeup_backend_epoll final : public wakeup_backend {
 public:
  wakeup_backend_epoll() {
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
      throw std::system_error(errno, std::generic_category(), "epoll_create1 failed");
    }

    eventfd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (eventfd_ < 0) {
      close_if_valid(epoll_fd_);
      throw std::system_error(errno, std::generic_category(), "eventfd failed");
    }

    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLET;
    ev.data.fd = eventfd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, eventfd_, &ev) < 0) {
      close_if_valid(eventfd_);
      close_if_valid(epoll_fd_);
      throw std::system_error(errno, std::generic_category(), "epoll_ctl(add eventfd) failed");
    }
  }

  ~wakeup_backend_epoll() override {
    close_if_valid(eventfd_);
    close_if_valid(epoll_fd_);
  }

  void wait(std::optional<std::chrono::milliseconds> timeout) override {
    int timeout_ms = -1;
    if (timeout.has_value()) {
      timeout_ms = static_cast<int>(timeout->count());
    }

    epoll_event events[4]{};
    int const nfds = ::epoll_wait(epoll_fd_, events, 4, timeout_ms);
    if (nfds < 0) {
      if (errno == EINTR) {
        return;
      }
      throw std::system_error(errno, std::generic_category(), "epoll_wait failed");
    }

    for (int i = 0; i < nfds; ++i) {
      if (events[i].data.fd == eventfd_) {
        drain_eventfd(eventfd_);
        // Clear the dedupe flag after draining so a wakeup raced into this batch is not lost.
        wakeup_pending_.store(false, std::memory_order_release);
      }
    }
  }

  void wakeup() noexcept override {
    if (wakeup_pending_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    std::uint64_t value = 1;
    for (;;) {
      auto const n = ::write(eventfd_, &value, sizeof(value));
      if (n >= 0) {
        return;
      }
      if (errno == EINTR) {
        continue;
      }
      // Allow a later wakeup to retry.
      wakeup_pending_.store(false, std::memory_order_release);
      return;
    }
  }

 private:
  int epoll_fd_ = -1;
  int eventfd_ = -1;
  std::atomic<bool> wakeup_pending_{false};
};

auto make_wakeup_backend() -> std::unique_ptr<wakeup_backend> {
  return std::make_unique<wakeup_backend_epoll>();
}

}  // namespace svcwatch::detail
