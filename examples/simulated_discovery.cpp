// simulated_discovery.cpp
//
// Purpose:
//   Runnable example wiring a discovery_resolver to an in-process platform that announces a
//   few HTTP services, flaps one of them and withdraws another.
//
// Preconditions:
//   - Notifications are delivered on the svcwatch::event_loop driven by main().
//
// Notes:
//   - The platform and resolver are simulations; no network traffic is generated.

#include <svcwatch/svcwatch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

constexpr char const* http_type = "_http._tcp.";

class simulated_platform final : public svcwatch::discovery_platform {
 public:
  ~simulated_platform() override { join(); }

  void begin_discovery(std::string const& service_type, svcwatch::discovery_events& events) override {
    join();
    stopping_.store(false, std::memory_order_release);
    announcer_ = std::thread{[this, service_type, &events] { announce(service_type, events); }};
  }

  void end_discovery(svcwatch::discovery_events& events) override {
    stopping_.store(true, std::memory_order_release);
    join();
    events.on_discovery_stopped();
  }

  void join() {
    if (announcer_.joinable()) {
      announcer_.join();
    }
  }

 private:
  void announce(std::string const& type, svcwatch::discovery_events& events) {
    auto service = [&](char const* name) {
      return svcwatch::discovered_service{name, type, {}, 0};
    };

    events.on_discovery_started();
    events.on_service_found(service("kitchen"));
    events.on_service_found(service("hallway"));
    events.on_service_found(service("garage"));

    // Short flap: lost and back within the debounce window.
    sleep_unless_stopping(100ms);
    events.on_service_lost(service("hallway"));
    sleep_unless_stopping(50ms);
    events.on_service_found(service("hallway"));

    // Real withdrawal.
    sleep_unless_stopping(100ms);
    events.on_service_lost(service("garage"));
  }

  void sleep_unless_stopping(std::chrono::milliseconds d) {
    auto const deadline = std::chrono::steady_clock::now() + d;
    while (!stopping_.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(5ms);
    }
  }

  std::atomic<bool> stopping_{false};
  std::thread announcer_{};
};

class simulated_resolver final : public svcwatch::service_resolver {
 public:
  auto resolve(std::string const& key, std::chrono::milliseconds timeout)
    -> svcwatch::result<svcwatch::resolve_result> override {
    std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(20ms, timeout));

    svcwatch::resolve_result r;
    r.srv.fqdn = key;
    r.srv.target = std::string{svcwatch::first_label(key)} + ".local.";
    r.srv.port = 8080;
    r.addresses = {"192.0.2.10"};
    r.txt = {{"path", "/"}};
    return r;
  }
};

class printing_listener final : public svcwatch::discovery_listener {
 public:
  void on_discovery_started() override { std::cout << "discovery started\n"; }
  void on_discovery_stopped() override { std::cout << "discovery stopped\n"; }
  void on_start_discovery_failed(std::error_code ec) override {
    std::cerr << "start failed: " << ec.message() << "\n";
  }
  void on_stop_discovery_failed(std::error_code ec) override {
    std::cerr << "stop failed: " << ec.message() << "\n";
  }
  void on_service_found(svcwatch::service_record_ptr const& r) override {
    std::cout << "found    " << r->full_name << "\n";
  }
  void on_service_lost(svcwatch::service_record_ptr const& r) override {
    std::cout << "lost     " << r->full_name << "\n";
  }
  void on_service_resolved(svcwatch::service_record_ptr const& r) override {
    std::cout << "resolved " << r->full_name << " -> " << r->host << ":" << r->port << "\n";
  }
  void on_resolve_failed(std::string_view key, std::error_code ec) override {
    std::cerr << "resolve failed for " << key << ": " << ec.message() << "\n";
  }
};

}  // namespace

int main() {
  svcwatch::logger::instance().set_level(svcwatch::log_level::info);

  svcwatch::event_loop loop;
  auto guard = svcwatch::make_work_guard(loop);
  simulated_platform platform;
  simulated_resolver resolver;
  printing_listener listener;

  svcwatch::discovery_options options;
  options.service_type = http_type;
  options.debounce = 200ms;
  options.resolve_timeout = 500ms;

  {
    svcwatch::discovery_resolver coordinator{options, platform, resolver, listener,
                                             loop.get_executor()};
    coordinator.start();

    (void)loop.run_for(800ms);

    std::cout << "live services:\n";
    for (auto const& r : coordinator.services()) {
      std::cout << "  " << r->full_name << " " << r->host << ":" << r->port << "\n";
    }

    coordinator.stop();
    (void)loop.run_for(100ms);
  }
  return 0;
}
