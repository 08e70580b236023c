#include <gtest/gtest.h>

#include <svcwatch/error.hpp>
#include <svcwatch/result.hpp>
#include <svcwatch/service_record.hpp>

#include "test_util.hpp"

#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace {

auto lookup(std::string const& key) -> svcwatch::result<svcwatch::service_record_ptr> {
  if (key.empty()) {
    return svcwatch::unexpected(make_error_code(svcwatch::error::not_found));
  }
  svcwatch::service_record rec;
  rec.full_name = key;
  return std::make_shared<svcwatch::service_record const>(std::move(rec));
}

TEST(result_test, resolve_result_carries_the_answer) {
  svcwatch::result<svcwatch::resolve_result> r =
    svcwatch::test::make_resolve_result("kitchen._http._tcp.local");
  ASSERT_TRUE(r);
  EXPECT_EQ(r->srv.port, 8080);
  EXPECT_EQ(r->srv.target, "kitchen.local.");

  // The coordinator moves the answer out before building the record.
  auto answer = std::move(*r);
  EXPECT_EQ(answer.addresses.size(), 1u);
}

TEST(result_test, resolver_failure_keeps_the_error_code) {
  svcwatch::result<svcwatch::resolve_result> r{
    svcwatch::unexpected(make_error_code(svcwatch::error::timed_out))};
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), svcwatch::error::timed_out);
  EXPECT_EQ(r.error().message(), "timed out");

  svcwatch::result<svcwatch::resolve_result> io{
    svcwatch::unexpected(std::make_error_code(std::errc::host_unreachable))};
  ASSERT_FALSE(io);
  EXPECT_EQ(io.error(), std::errc::host_unreachable);
}

TEST(result_test, malformed_answer_propagates_as_malformed_record) {
  svcwatch::resolve_result answer;
  answer.srv.target = "host.local.";

  svcwatch::result<svcwatch::resolve_result> r{answer};
  ASSERT_TRUE(r);
  auto rec = svcwatch::make_service_record(*r);
  ASSERT_FALSE(rec);
  EXPECT_EQ(rec.error(), svcwatch::error::malformed_record);
  EXPECT_EQ(rec.error().category().name(), std::string{"svcwatch"});
}

TEST(result_test, shared_record_result) {
  auto found = lookup("kitchen._http._tcp.local");
  ASSERT_TRUE(found);
  EXPECT_EQ((*found)->full_name, "kitchen._http._tcp.local");

  auto missing = lookup("");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), svcwatch::error::not_found);
  EXPECT_EQ(missing.value_or(nullptr), nullptr);
}

TEST(result_test, value_on_error_throws_with_the_code) {
  auto missing = lookup("");
  try {
    (void)missing.value();
    ADD_FAILURE() << "expected bad_expected_access";
  }
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  catch (std::bad_expected_access<std::error_code> const& e) {
    EXPECT_EQ(e.error(), svcwatch::error::not_found);
  }
#else
  catch (svcwatch::bad_expected_access<std::error_code> const& e) {
    EXPECT_EQ(e.error(), svcwatch::error::not_found);
  }
#endif
}

TEST(result_test, void_result_helpers) {
  auto good = svcwatch::ok();
  EXPECT_TRUE(good);

  auto bad = svcwatch::fail(svcwatch::error::invalid_argument);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), svcwatch::error::invalid_argument);
}

}  // namespace
