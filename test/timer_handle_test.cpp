#include <gtest/gtest.h>

#include <svcwatch/event_loop.hpp>
#include <svcwatch/timer_handle.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace {

using namespace std::chrono_literals;

TEST(timer_handle_basic, default_constructed_handle_is_empty) {
  svcwatch::timer_handle handle;
  EXPECT_FALSE(handle);
  EXPECT_FALSE(handle.pending());
  EXPECT_FALSE(handle.fired());
  EXPECT_FALSE(handle.cancelled());
  EXPECT_FALSE(handle.cancel());
}

TEST(timer_handle_basic, handle_from_executor_is_pending) {
  svcwatch::event_loop loop;
  auto ex = loop.get_executor();

  auto handle = ex.schedule_timer(100ms, [] {});
  EXPECT_TRUE(handle);
  EXPECT_TRUE(handle.pending());
  EXPECT_FALSE(handle.fired());
  EXPECT_FALSE(handle.cancelled());
}

TEST(timer_handle_lifetime, copies_share_the_timer) {
  svcwatch::event_loop loop;
  auto ex = loop.get_executor();

  auto handle1 = ex.schedule_timer(100ms, [] {});
  auto handle2 = handle1;
  EXPECT_EQ(handle1, handle2);

  EXPECT_TRUE(handle1.cancel());
  EXPECT_TRUE(handle1.cancelled());
  EXPECT_TRUE(handle2.cancelled());
}

TEST(timer_handle_lifetime, fired_state_is_visible_after_run) {
  svcwatch::event_loop loop;
  auto ex = loop.get_executor();
  std::atomic<int> fire_count{0};

  auto handle =
    ex.schedule_timer(10ms, [&fire_count] { fire_count.fetch_add(1, std::memory_order_relaxed); });
  auto copy = handle;

  loop.run_for(200ms);

  EXPECT_EQ(fire_count.load(std::memory_order_relaxed), 1);
  EXPECT_TRUE(handle.fired());
  EXPECT_TRUE(copy.fired());
  EXPECT_FALSE(handle.pending());
}

TEST(timer_handle_lifetime, handle_destruction_does_not_cancel_timer) {
  svcwatch::event_loop loop;
  auto ex = loop.get_executor();
  std::atomic<bool> fired{false};

  {
    auto handle =
      ex.schedule_timer(10ms, [&fired] { fired.store(true, std::memory_order_relaxed); });
    EXPECT_TRUE(handle.pending());
  }

  loop.run_for(200ms);
  EXPECT_TRUE(fired.load(std::memory_order_relaxed));
}

TEST(timer_handle_cancel, cancel_prevents_execution) {
  svcwatch::event_loop loop;
  auto ex = loop.get_executor();
  std::atomic<bool> fired{false};

  auto handle =
    ex.schedule_timer(50ms, [&fired] { fired.store(true, std::memory_order_relaxed); });
  EXPECT_TRUE(handle.cancel());
  EXPECT_TRUE(handle.cancelled());

  loop.run_for(150ms);
  EXPECT_FALSE(fired.load(std::memory_order_relaxed));
}

TEST(timer_handle_cancel, cancel_after_fire_is_a_no_op) {
  svcwatch::event_loop loop;
  auto ex = loop.get_executor();

  auto handle = ex.schedule_timer(10ms, [] {});
  loop.run_for(200ms);

  EXPECT_TRUE(handle.fired());
  EXPECT_FALSE(handle.cancel());
  EXPECT_TRUE(handle.fired());
  EXPECT_FALSE(handle.cancelled());
}

TEST(timer_handle_cancel, double_cancel_is_safe) {
  svcwatch::event_loop loop;
  auto handle = loop.get_executor().schedule_timer(100ms, [] {});

  EXPECT_TRUE(handle.cancel());
  EXPECT_FALSE(handle.cancel());
  EXPECT_TRUE(handle.cancelled());
}

TEST(timer_handle_lifetime, handle_outlives_loop_safely) {
  std::shared_ptr<svcwatch::timer_handle> handle_ptr;
  {
    svcwatch::event_loop loop;
    handle_ptr = std::make_shared<svcwatch::timer_handle>(
      loop.get_executor().schedule_timer(500ms, [] {}));
  }
  EXPECT_TRUE(handle_ptr->pending());
  EXPECT_TRUE(handle_ptr->cancel());
}

}  // namespace
