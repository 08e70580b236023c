#include <svcwatch/svcwatch.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

constexpr char const* http_type = "_http._tcp.";

class instant_platform final : public svcwatch::discovery_platform {
 public:
  void begin_discovery(std::string const&, svcwatch::discovery_events& events) override {
    events.on_discovery_started();
  }
  void end_discovery(svcwatch::discovery_events& events) override {
    events.on_discovery_stopped();
  }
};

class instant_resolver final : public svcwatch::service_resolver {
 public:
  auto resolve(std::string const& key, std::chrono::milliseconds)
    -> svcwatch::result<svcwatch::resolve_result> override {
    resolutions.fetch_add(1, std::memory_order_relaxed);
    svcwatch::resolve_result r;
    r.srv.fqdn = key;
    r.srv.target = "host.local.";
    r.srv.port = 80;
    return r;
  }

  std::atomic<std::uint64_t> resolutions{0};
};

class counting_listener final : public svcwatch::discovery_listener {
 public:
  void on_discovery_started() override {}
  void on_discovery_stopped() override {}
  void on_start_discovery_failed(std::error_code) override { ++failures; }
  void on_stop_discovery_failed(std::error_code) override { ++failures; }
  void on_service_found(svcwatch::service_record_ptr const&) override { ++found; }
  void on_service_lost(svcwatch::service_record_ptr const&) override { ++lost; }
  void on_service_resolved(svcwatch::service_record_ptr const&) override { ++resolved; }
  void on_resolve_failed(std::string_view, std::error_code) override { ++failures; }

  std::uint64_t found = 0;
  std::uint64_t lost = 0;
  std::uint64_t resolved = 0;
  std::uint64_t failures = 0;
};

}  // namespace

int main(int argc, char* argv[]) {
  int services = 16;
  int flaps = 1000;
  if (argc >= 3) {
    services = std::stoi(argv[1]);
    flaps = std::stoi(argv[2]);
  }
  if (services <= 0) {
    std::cerr << "svcwatch_flap_churn: services must be > 0\n";
    return 1;
  }
  if (flaps <= 0) {
    std::cerr << "svcwatch_flap_churn: flaps must be > 0\n";
    return 1;
  }

  svcwatch::event_loop loop;
  instant_platform platform;
  instant_resolver resolver;
  counting_listener listener;

  svcwatch::discovery_options options;
  options.service_type = http_type;
  options.debounce = 50ms;

  svcwatch::discovery_resolver coordinator{options, platform, resolver, listener,
                                           loop.get_executor()};
  coordinator.start();

  std::vector<svcwatch::discovered_service> announced;
  announced.reserve(static_cast<std::size_t>(services));
  for (int i = 0; i < services; ++i) {
    announced.push_back({"svc" + std::to_string(i), http_type, {}, 0});
  }

  auto& events = coordinator.events();
  auto const total_events =
    static_cast<std::uint64_t>(services) * static_cast<std::uint64_t>(flaps) * 2;

  auto const start = std::chrono::steady_clock::now();
  for (int f = 0; f < flaps; ++f) {
    for (auto const& s : announced) {
      events.on_service_found(s);
      events.on_service_lost(s);
    }
  }
  for (auto const& s : announced) {
    events.on_service_found(s);
  }
  auto const flapped = std::chrono::steady_clock::now();

  auto const deadline = flapped + 5s;
  while (listener.resolved < static_cast<std::uint64_t>(services) &&
         std::chrono::steady_clock::now() < deadline) {
    (void)loop.run_for(1ms);
  }
  (void)loop.run_for(2 * options.debounce);
  auto const end = std::chrono::steady_clock::now();

  if (listener.failures != 0 || listener.lost != 0 ||
      listener.found != static_cast<std::uint64_t>(services)) {
    std::cerr << "svcwatch_flap_churn: unexpected notifications (found=" << listener.found
              << " lost=" << listener.lost << " failures=" << listener.failures << ")\n";
    return 1;
  }

  auto const flap_s = std::chrono::duration<double>(flapped - start).count();
  auto const settle_s = std::chrono::duration<double>(end - flapped).count();
  auto const ops_s = flap_s > 0.0 ? static_cast<double>(total_events) / flap_s : 0.0;

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "svcwatch_flap_churn"
            << " services=" << services << " flaps=" << flaps << " events=" << total_events
            << " flap_s=" << flap_s << " settle_s=" << settle_s << " events_s=" << ops_s
            << " resolutions=" << resolver.resolutions.load(std::memory_order_relaxed) << "\n";

  coordinator.stop();
  return 0;
}
