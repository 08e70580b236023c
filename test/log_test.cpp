#include <gtest/gtest.h>

#include <svcwatch/log.hpp>

#include "test_util.hpp"

#include <stdexcept>
#include <string>

namespace {

using svcwatch::log_level;

TEST(log_test, messages_below_threshold_are_dropped) {
  svcwatch::test::log_capture logs{log_level::warn};

  SVCWATCH_LOG_DEBUG("debug {}", 1);
  SVCWATCH_LOG_INFO("info {}", 2);
  SVCWATCH_LOG_WARN("warn {}", 3);
  SVCWATCH_LOG_ERROR("error {}", 4);

  auto const lines = logs.lines();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].first, log_level::warn);
  EXPECT_EQ(lines[0].second, "warn 3");
  EXPECT_EQ(lines[1].first, log_level::error);
  EXPECT_EQ(lines[1].second, "error 4");
}

TEST(log_test, off_disables_everything) {
  svcwatch::test::log_capture logs{log_level::off};
  SVCWATCH_LOG_ERROR("should not appear");
  EXPECT_TRUE(logs.lines().empty());
  EXPECT_FALSE(svcwatch::logger::instance().enabled(log_level::error));
}

TEST(log_test, debug_threshold_passes_all_levels) {
  svcwatch::test::log_capture logs{log_level::debug};
  SVCWATCH_LOG_DEBUG("a");
  SVCWATCH_LOG_INFO("b");
  EXPECT_EQ(logs.lines().size(), 2u);
  EXPECT_TRUE(logs.contains("a"));
}

TEST(log_test, formats_arguments_with_fmt) {
  svcwatch::test::log_capture logs{log_level::info};
  std::string const key = "kitchen._http._tcp.local";
  SVCWATCH_LOG_INFO("resolved {} on port {}", key, 8080);
  EXPECT_TRUE(logs.contains("resolved kitchen._http._tcp.local on port 8080"));
}

TEST(log_test, throwing_sink_does_not_escape) {
  svcwatch::logger::instance().set_level(log_level::info);
  svcwatch::logger::instance().set_sink(
    [](log_level, std::string_view) { throw std::runtime_error("sink down"); });

  EXPECT_NO_THROW(SVCWATCH_LOG_INFO("hello"));

  svcwatch::logger::instance().set_sink({});
  svcwatch::logger::instance().set_level(log_level::warn);
}

TEST(log_test, level_names) {
  EXPECT_EQ(svcwatch::to_string(log_level::debug), "DEBUG");
  EXPECT_EQ(svcwatch::to_string(log_level::info), "INFO");
  EXPECT_EQ(svcwatch::to_string(log_level::warn), "WARN");
  EXPECT_EQ(svcwatch::to_string(log_level::error), "ERROR");
  EXPECT_EQ(svcwatch::to_string(log_level::off), "OFF");
}

}  // namespace
