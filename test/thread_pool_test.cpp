#include <gtest/gtest.h>

#include <svcwatch/executor.hpp>
#include <svcwatch/thread_pool.hpp>

#include "test_util.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

static_assert(svcwatch::executor<svcwatch::thread_pool::executor_type>);

// svcwatch resolves on a pool of one thread; these tests cover that configuration.

TEST(thread_pool, single_thread_runs_tasks_in_order_off_the_caller_thread) {
  svcwatch::thread_pool pool{1};
  svcwatch::any_executor ex{pool.get_executor()};
  EXPECT_EQ(pool.size(), 1u);

  std::mutex m;
  std::vector<int> order;
  std::vector<std::thread::id> ids;

  for (int i = 0; i < 10; ++i) {
    ex.post([&, i] {
      std::scoped_lock lk{m};
      order.push_back(i);
      ids.push_back(std::this_thread::get_id());
    });
  }

  ASSERT_TRUE(svcwatch::test::wait_until([&] {
    std::scoped_lock lk{m};
    return order.size() == 10;
  }));

  std::scoped_lock lk{m};
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
  for (auto const& id : ids) {
    EXPECT_EQ(id, ids.front());
  }
  EXPECT_NE(ids.front(), std::this_thread::get_id());
}

TEST(thread_pool, task_posted_from_a_task_runs_after_it) {
  svcwatch::thread_pool pool{1};
  svcwatch::any_executor ex{pool.get_executor()};
  std::mutex m;
  std::vector<int> order;

  ex.post([&] {
    ex.post([&] {
      std::scoped_lock lk{m};
      order.push_back(2);
    });
    std::scoped_lock lk{m};
    order.push_back(1);
  });

  ASSERT_TRUE(svcwatch::test::wait_until([&] {
    std::scoped_lock lk{m};
    return order.size() == 2;
  }));
  std::scoped_lock lk{m};
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(thread_pool, stop_while_draining_finishes_the_running_task_and_drops_the_rest) {
  svcwatch::thread_pool pool{1};
  auto ex = pool.get_executor();

  std::atomic<bool> running{false};
  std::atomic<bool> release{false};
  std::atomic<bool> finished{false};
  std::atomic<int> later{0};

  ex.post([&] {
    running.store(true, std::memory_order_release);
    while (!release.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(1ms);
    }
    finished.store(true, std::memory_order_release);
  });
  ex.post([&] { later.fetch_add(1, std::memory_order_relaxed); });

  ASSERT_TRUE(svcwatch::test::wait_until([&] { return running.load(std::memory_order_acquire); }));
  ex.post([&] { later.fetch_add(1, std::memory_order_relaxed); });

  pool.stop();
  release.store(true, std::memory_order_release);
  pool.join();

  EXPECT_TRUE(finished.load(std::memory_order_acquire));
  EXPECT_EQ(later.load(std::memory_order_relaxed), 0);
}

TEST(thread_pool, stop_and_join_are_idempotent) {
  svcwatch::thread_pool pool{1};
  pool.stop();
  pool.join();
  pool.stop();
  pool.join();
}

}  // namespace
