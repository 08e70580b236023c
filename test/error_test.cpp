#include <gtest/gtest.h>

#include <svcwatch/error.hpp>
#include <svcwatch/result.hpp>

#include <system_error>

TEST(error_test, error_category_name_and_messages) {
  auto ec = svcwatch::make_error_code(svcwatch::error::not_found);
  EXPECT_STREQ(ec.category().name(), "svcwatch");
  EXPECT_EQ(ec.message(), "service not found");
  EXPECT_EQ(svcwatch::make_error_code(svcwatch::error::resolver_exception).message(),
            "resolver threw an exception");
}

TEST(error_test, make_error_code_is_equatable) {
  auto ec1 = svcwatch::make_error_code(svcwatch::error::timed_out);
  auto ec2 = svcwatch::make_error_code(svcwatch::error::timed_out);
  auto ec3 = svcwatch::make_error_code(svcwatch::error::malformed_record);

  EXPECT_EQ(ec1, ec2);
  EXPECT_NE(ec1, ec3);
  EXPECT_TRUE(ec1);
}

TEST(error_test, enum_converts_implicitly_to_error_code) {
  std::error_code ec = svcwatch::error::start_discovery_failed;
  EXPECT_EQ(ec, svcwatch::error::start_discovery_failed);
  EXPECT_NE(ec, std::make_error_code(std::errc::timed_out));
}

TEST(error_test, void_result_helpers) {
  auto good = svcwatch::ok();
  EXPECT_TRUE(good);

  auto bad = svcwatch::fail(svcwatch::error::invalid_argument);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), svcwatch::error::invalid_argument);
}
