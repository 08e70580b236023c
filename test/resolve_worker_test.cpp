#include <gtest/gtest.h>

#include <svcwatch/error.hpp>
#include <svcwatch/resolve_worker.hpp>
#include <svcwatch/thread_pool.hpp>

#include "test_util.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace {

using namespace std::chrono_literals;

struct completion {
  std::string key;
  std::error_code ec;
};

struct harness {
  harness() = default;

  ~harness() {
    // The drain task refers to the worker; it must be gone first.
    resolver.release();
    pool.stop();
    pool.join();
  }

  void submit(std::string key) {
    std::scoped_lock lk{mtx};
    (void)worker.submit(std::move(key));
  }

  auto wait_done(std::size_t n, std::chrono::milliseconds timeout = 2s) -> bool {
    std::unique_lock lk{mtx};
    return cv.wait_for(lk, timeout, [&] { return done.size() >= n; });
  }

  auto keys_done() -> std::vector<std::string> {
    std::scoped_lock lk{mtx};
    std::vector<std::string> out;
    for (auto const& c : done) {
      out.push_back(c.key);
    }
    return out;
  }

  svcwatch::test::mock_resolver resolver;
  svcwatch::thread_pool pool{1};
  std::mutex mtx;
  std::condition_variable cv;
  std::vector<completion> done;
  std::string fail_commit_of{};

  svcwatch::resolve_worker worker{
    svcwatch::any_executor{pool.get_executor()}, mtx,
    [this](std::string const& key) { return resolver.resolve(key, 100ms); },
    [this](std::string const& key, svcwatch::result<svcwatch::resolve_result> r) {
      if (key == fail_commit_of) {
        throw std::runtime_error("commit failed");
      }
      done.push_back(completion{key, r ? std::error_code{} : r.error()});
      cv.notify_all();
    }};
};

TEST(resolve_worker, resolves_keys_in_submission_order) {
  harness h;
  h.submit("a");
  h.submit("b");
  h.submit("c");

  ASSERT_TRUE(h.wait_done(3));
  EXPECT_EQ(h.keys_done(), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(h.resolver.calls(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(resolve_worker, goes_idle_when_the_queue_is_drained) {
  harness h;
  h.submit("a");
  ASSERT_TRUE(h.wait_done(1));

  auto const deadline = std::chrono::steady_clock::now() + 2s;
  for (;;) {
    {
      std::scoped_lock lk{h.mtx};
      if (!h.worker.active()) {
        EXPECT_TRUE(h.worker.queue().empty());
        EXPECT_FALSE(h.worker.in_flight().has_value());
        break;
      }
    }
    ASSERT_LT(std::chrono::steady_clock::now(), deadline);
    std::this_thread::sleep_for(1ms);
  }
}

TEST(resolve_worker, duplicate_submit_while_queued_is_collapsed) {
  harness h;
  h.resolver.hold();
  h.submit("a");
  ASSERT_TRUE(h.resolver.wait_for_calls(1));

  {
    std::scoped_lock lk{h.mtx};
    EXPECT_EQ(h.worker.in_flight(), std::optional<std::string>{"a"});
    EXPECT_TRUE(h.worker.submit("b"));
    EXPECT_FALSE(h.worker.submit("b"));
    EXPECT_EQ(h.worker.queue().size(), 1u);
  }

  h.resolver.release();
  ASSERT_TRUE(h.wait_done(2));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(h.keys_done(), (std::vector<std::string>{"a", "b"}));
}

TEST(resolve_worker, at_most_one_resolution_in_flight_under_concurrent_submits) {
  harness h;
  h.resolver.set_delay(std::chrono::milliseconds{1});

  constexpr int threads = 4;
  constexpr int per_thread = 25;
  std::vector<std::thread> producers;
  for (int t = 0; t < threads; ++t) {
    producers.emplace_back([&h, t] {
      for (int i = 0; i < per_thread; ++i) {
        h.submit("t" + std::to_string(t) + "-k" + std::to_string(i));
      }
    });
  }
  for (auto& p : producers) {
    p.join();
  }

  ASSERT_TRUE(h.wait_done(threads * per_thread, 5s));
  EXPECT_EQ(h.resolver.max_in_flight(), 1);

  std::scoped_lock lk{h.mtx};
  EXPECT_EQ(h.worker.resolutions_started(), static_cast<std::uint64_t>(threads * per_thread));
}

TEST(resolve_worker, failure_does_not_stop_the_drain) {
  harness h;
  h.resolver.set_handler([](std::string const& key) -> svcwatch::result<svcwatch::resolve_result> {
    if (key == "bad") {
      return svcwatch::unexpected(svcwatch::make_error_code(svcwatch::error::timed_out));
    }
    return svcwatch::test::make_resolve_result(key);
  });

  h.submit("a");
  h.submit("bad");
  h.submit("c");
  ASSERT_TRUE(h.wait_done(3));

  std::scoped_lock lk{h.mtx};
  ASSERT_EQ(h.done.size(), 3u);
  EXPECT_FALSE(h.done[0].ec);
  EXPECT_EQ(h.done[1].ec, svcwatch::error::timed_out);
  EXPECT_FALSE(h.done[2].ec);
}

TEST(resolve_worker, throwing_resolver_reports_resolver_exception) {
  harness h;
  h.resolver.set_handler([](std::string const&) -> svcwatch::result<svcwatch::resolve_result> {
    throw std::runtime_error("socket exploded");
  });

  h.submit("a");
  h.submit("b");
  ASSERT_TRUE(h.wait_done(2));

  std::scoped_lock lk{h.mtx};
  EXPECT_EQ(h.done[0].ec, svcwatch::error::resolver_exception);
  EXPECT_EQ(h.done[1].ec, svcwatch::error::resolver_exception);
}

TEST(resolve_worker, cancel_drops_a_queued_key) {
  harness h;
  h.resolver.hold();
  h.submit("a");
  ASSERT_TRUE(h.resolver.wait_for_calls(1));
  h.submit("b");
  h.submit("c");
  {
    std::scoped_lock lk{h.mtx};
    EXPECT_TRUE(h.worker.cancel("b"));
    EXPECT_FALSE(h.worker.cancel("a"));  // in flight, not queued
  }
  h.resolver.release();

  ASSERT_TRUE(h.wait_done(2));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(h.keys_done(), (std::vector<std::string>{"a", "c"}));
}

TEST(resolve_worker, reset_discards_the_result_in_flight) {
  harness h;
  h.resolver.hold();
  h.submit("a");
  ASSERT_TRUE(h.resolver.wait_for_calls(1));
  h.submit("b");
  {
    std::scoped_lock lk{h.mtx};
    h.worker.reset();
    EXPECT_TRUE(h.worker.queue().empty());
  }
  h.resolver.release();

  // The worker keeps working after a reset.
  h.submit("c");
  ASSERT_TRUE(h.wait_done(1));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(h.keys_done(), std::vector<std::string>{"c"});
}

TEST(resolve_worker, submit_after_each_drain_never_stalls) {
  harness h;
  for (int i = 0; i < 200; ++i) {
    h.submit("k" + std::to_string(i));
    ASSERT_TRUE(h.wait_done(static_cast<std::size_t>(i) + 1)) << "stalled at " << i;
  }
  EXPECT_EQ(h.resolver.max_in_flight(), 1);
}

TEST(resolve_worker, passes_the_timeout_to_the_resolver) {
  harness h;
  h.submit("a");
  ASSERT_TRUE(h.wait_done(1));
  EXPECT_EQ(h.resolver.last_timeout(), 100ms);
}

TEST(resolve_worker, throwing_completion_is_logged_and_the_drain_continues) {
  svcwatch::test::log_capture logs{svcwatch::log_level::error};
  harness h;
  h.fail_commit_of = "a";

  h.submit("a");
  h.submit("b");
  ASSERT_TRUE(h.wait_done(1));
  EXPECT_EQ(h.keys_done(), std::vector<std::string>{"b"});
  EXPECT_TRUE(logs.contains("commit failed"));

  // Still usable once it has gone idle.
  ASSERT_TRUE(svcwatch::test::wait_until([&] {
    std::scoped_lock lk{h.mtx};
    return !h.worker.active();
  }));
  h.submit("c");
  ASSERT_TRUE(h.wait_done(2));
  EXPECT_EQ(h.keys_done(), (std::vector<std::string>{"b", "c"}));
}

}  // namespace
