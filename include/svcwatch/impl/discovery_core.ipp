#include <svcwatch/detail/discovery_core.hpp>
#include <svcwatch/error.hpp>
#include <svcwatch/log.hpp>

#include <algorithm>
#include <exception>
#include <utility>

namespace svcwatch::detail {

namespace {

struct listener_dispatch {
  discovery_listener& listener;

  void operator()(discovery_started&) const { listener.on_discovery_started(); }
  void operator()(discovery_stopped&) const { listener.on_discovery_stopped(); }
  void operator()(start_discovery_failed& e) const { listener.on_start_discovery_failed(e.ec); }
  void operator()(stop_discovery_failed& e) const { listener.on_stop_discovery_failed(e.ec); }
  void operator()(service_found& e) const { listener.on_service_found(e.record); }
  void operator()(service_lost& e) const { listener.on_service_lost(e.record); }
  void operator()(service_resolved& e) const { listener.on_service_resolved(e.record); }
  void operator()(resolve_failed& e) const { listener.on_resolve_failed(e.key, e.ec); }
};

}  // namespace

auto discovery_core::create(discovery_options options, discovery_platform& platform,
                            service_resolver& resolver, discovery_listener& listener,
                            event_loop::executor_type delivery)
  -> std::shared_ptr<discovery_core> {
  auto core = std::make_shared<discovery_core>(private_tag{}, std::move(options), platform,
                                               resolver, listener, delivery);

  // The sink must not keep the core alive: the coalescer state outlives it in queued tasks.
  std::weak_ptr<discovery_core> weak = core;
  core->notifier_.emplace(any_executor{delivery}, [weak](discovery_event& ev) {
    if (auto self = weak.lock()) {
      self->deliver(ev);
    }
  });
  return core;
}

discovery_core::discovery_core(private_tag, discovery_options options,
                               discovery_platform& platform, service_resolver& resolver,
                               discovery_listener& listener, event_loop::executor_type delivery)
    : options_(std::move(options)),
      platform_(platform),
      resolver_(resolver),
      listener_(listener),
      delivery_(std::move(delivery)),
      presence_(
        options_.debounce,
        [this](std::chrono::milliseconds after, unique_function<void()> expire) {
          return schedule_removal(after, std::move(expire));
        },
        [this](std::string const& key) { on_present(key); },
        [this](std::string const& key) { on_absent(key); }),
      worker_(
        any_executor{pool_.get_executor()}, mtx_,
        [this](std::string const& key) { return resolver_.resolve(key, options_.resolve_timeout); },
        [this](std::string const& key, result<resolve_result> r) { commit(key, std::move(r)); }) {
  SVCWATCH_ENSURE(delivery_, "discovery_core: empty delivery executor");
}

discovery_core::~discovery_core() { shutdown(); }

void discovery_core::shutdown() noexcept {
  {
    std::scoped_lock lk{mtx_};
    if (closed_) {
      return;
    }
    closed_ = true;
    worker_.reset();
    presence_.clear();
    services_.clear();
    announced_.clear();
    if (notifier_) {
      notifier_->close();
    }
  }
  // A resolution in flight finishes and is dropped by the worker's epoch check.
  pool_.stop();
  pool_.join();
}

void discovery_core::start() {
  lifecycle_command cmd = lifecycle_command::none;
  {
    std::scoped_lock lk{mtx_};
    if (closed_) {
      return;
    }
    cmd = lifecycle_.request_start();
    SVCWATCH_LOG_DEBUG("start: phase={} command={}", to_string(lifecycle_.phase()),
                       cmd == lifecycle_command::begin_discovery ? "begin" : "none");
  }
  issue(cmd);
}

void discovery_core::stop() {
  lifecycle_command cmd = lifecycle_command::none;
  {
    std::scoped_lock lk{mtx_};
    if (closed_) {
      return;
    }
    // After a failed stop the target is already stopped but the platform is still running;
    // the retry must still reach request_stop().
    bool const was_started = lifecycle_.started();
    cmd = lifecycle_.request_stop();
    SVCWATCH_LOG_DEBUG("stop: phase={} command={}", to_string(lifecycle_.phase()),
                       cmd == lifecycle_command::end_discovery ? "end" : "none");
    if (was_started) {
      clear_locked();
    }
  }
  issue(cmd);
}

auto discovery_core::started() const -> bool {
  std::scoped_lock lk{mtx_};
  return lifecycle_.started();
}

auto discovery_core::phase() const -> discovery_phase {
  std::scoped_lock lk{mtx_};
  return lifecycle_.phase();
}

auto discovery_core::services() const -> std::vector<service_record_ptr> {
  std::vector<service_record_ptr> out;
  {
    std::scoped_lock lk{mtx_};
    out.reserve(services_.size());
    for (auto const& [key, rec] : services_) {
      out.push_back(rec);
    }
  }
  std::sort(out.begin(), out.end(),
            [](auto const& a, auto const& b) { return a->full_name < b->full_name; });
  return out;
}

auto discovery_core::find(std::string_view key) const -> result<service_record_ptr> {
  std::scoped_lock lk{mtx_};
  auto it = services_.find(std::string{key});
  if (it == services_.end()) {
    return unexpected(make_error_code(error::not_found));
  }
  return it->second;
}

void discovery_core::on_discovery_started() {
  lifecycle_command cmd = lifecycle_command::none;
  {
    std::scoped_lock lk{mtx_};
    if (closed_) {
      return;
    }
    auto const before = lifecycle_.phase();
    cmd = lifecycle_.on_started();
    SVCWATCH_LOG_DEBUG("discovery started: phase={}", to_string(lifecycle_.phase()));
    if (before == discovery_phase::starting && lifecycle_.phase() == discovery_phase::started) {
      signal(discovery_started{});
    }
  }
  issue(cmd);
}

void discovery_core::on_discovery_stopped() {
  lifecycle_command cmd = lifecycle_command::none;
  {
    std::scoped_lock lk{mtx_};
    if (closed_) {
      return;
    }
    auto const before = lifecycle_.phase();
    cmd = lifecycle_.on_stopped();
    SVCWATCH_LOG_DEBUG("discovery stopped: phase={}", to_string(lifecycle_.phase()));
    if (before == discovery_phase::stopping && lifecycle_.phase() == discovery_phase::stopped) {
      signal(discovery_stopped{});
    }
  }
  issue(cmd);
}

void discovery_core::on_start_discovery_failed(std::error_code ec) {
  std::scoped_lock lk{mtx_};
  if (closed_) {
    return;
  }
  SVCWATCH_LOG_WARN("start discovery failed for {}: {}", options_.service_type, ec.message());
  lifecycle_.on_start_failed();
  signal(start_discovery_failed{ec});
}

void discovery_core::on_stop_discovery_failed(std::error_code ec) {
  std::scoped_lock lk{mtx_};
  if (closed_) {
    return;
  }
  SVCWATCH_LOG_WARN("stop discovery failed for {}: {}", options_.service_type, ec.message());
  lifecycle_.on_stop_failed();
  signal(stop_discovery_failed{ec});
}

void discovery_core::on_service_found(discovered_service const& service) {
  auto key = make_service_key(service.name, service.type);

  std::scoped_lock lk{mtx_};
  if (closed_ || !lifecycle_.started()) {
    SVCWATCH_LOG_DEBUG("ignoring found {} while not started", key);
    return;
  }
  SVCWATCH_LOG_DEBUG("found {}", key);
  if (!presence_.contains(key)) {
    announced_.insert_or_assign(
      key, std::make_shared<service_record const>(make_service_record(service)));
  }
  presence_.put(key, true);
}

void discovery_core::on_service_lost(discovered_service const& service) {
  auto key = make_service_key(service.name, service.type);

  std::scoped_lock lk{mtx_};
  if (closed_ || !lifecycle_.started()) {
    SVCWATCH_LOG_DEBUG("ignoring lost {} while not started", key);
    return;
  }
  SVCWATCH_LOG_DEBUG("lost {} (debounce {}ms)", key, options_.debounce.count());
  presence_.put(key, false);
}

void discovery_core::clear_locked() noexcept {
  worker_.reset();
  presence_.clear();
  services_.clear();
  announced_.clear();
  notifier_->invalidate();
}

void discovery_core::on_present(std::string const& key) {
  auto it = announced_.find(key);
  SVCWATCH_ASSERT(it != announced_.end());
  signal(service_found{it->second});
  (void)worker_.submit(key);
}

void discovery_core::on_absent(std::string const& key) {
  (void)worker_.cancel(key);

  service_record_ptr last;
  if (auto it = services_.find(key); it != services_.end()) {
    last = std::move(it->second);
    services_.erase(it);
  }
  if (auto it = announced_.find(key); it != announced_.end()) {
    if (!last) {
      last = std::move(it->second);
    }
    announced_.erase(it);
  }

  if (!lifecycle_.started() || !last) {
    return;
  }
  SVCWATCH_LOG_DEBUG("removed {}", key);
  signal(service_lost{std::move(last)});
}

void discovery_core::commit(std::string const& key, result<resolve_result> r) {
  if (!lifecycle_.started()) {
    SVCWATCH_LOG_DEBUG("discarding resolution of {}: not started", key);
    return;
  }
  if (!presence_.contains(key)) {
    SVCWATCH_LOG_DEBUG("discarding resolution of {}: no longer present", key);
    return;
  }
  if (!r) {
    SVCWATCH_LOG_WARN("resolving {} failed: {}", key, r.error().message());
    signal(resolve_failed{key, r.error()});
    return;
  }

  auto rec = make_service_record(*r);
  if (!rec) {
    SVCWATCH_LOG_WARN("resolving {} returned an unusable record", key);
    signal(resolve_failed{key, rec.error()});
    return;
  }

  auto ptr = std::make_shared<service_record const>(std::move(*rec));
  services_.insert_or_assign(key, ptr);
  SVCWATCH_LOG_DEBUG("resolved {} -> {}:{}", key, ptr->host, ptr->port);
  signal(service_resolved{std::move(ptr)});
}

void discovery_core::signal(discovery_event ev) {
  SVCWATCH_ASSERT(notifier_.has_value());
  notifier_->signal(std::move(ev));
}

auto discovery_core::schedule_removal(std::chrono::milliseconds after,
                                      unique_function<void()> expire) -> timer_handle {
  std::weak_ptr<discovery_core> weak = weak_from_this();
  return delivery_.schedule_timer(after, [weak, expire = std::move(expire)]() mutable {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    std::scoped_lock lk{self->mtx_};
    if (self->closed_) {
      return;
    }
    expire();
  });
}

void discovery_core::issue(lifecycle_command cmd) {
  if (cmd == lifecycle_command::none) {
    return;
  }
  try {
    if (cmd == lifecycle_command::begin_discovery) {
      SVCWATCH_LOG_INFO("begin discovery of {}", options_.service_type);
      platform_.begin_discovery(options_.service_type, *this);
    } else {
      SVCWATCH_LOG_INFO("end discovery of {}", options_.service_type);
      platform_.end_discovery(*this);
    }
  } catch (std::exception const& e) {
    SVCWATCH_LOG_ERROR("discovery platform threw: {}", e.what());
    std::scoped_lock lk{mtx_};
    lifecycle_.rollback(cmd);
    throw;
  }
}

void discovery_core::deliver(discovery_event& ev) {
  SVCWATCH_LOG_DEBUG("delivering {}", event_name(ev));
  std::visit(listener_dispatch{listener_}, ev);
}

}  // namespace svcwatch::detail
