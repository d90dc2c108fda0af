#include "ke/assert_throw.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify that KE_ASSERT_THROW() works as expected.
 */
TEST(assert_throw, basic) {
  ASSERT_THROW(ke::assert_throw_impl("foo", "bar()", "bar.cc", 20), std::logic_error);

  ASSERT_THROW(KE_ASSERT_THROW(false), std::logic_error);
  ASSERT_NO_THROW(KE_ASSERT_THROW(true));

  try {
    KE_ASSERT_THROW(1 + 1 == 3);
    FAIL() << "KE_ASSERT_THROW() should have raised";
  } catch (std::logic_error const& ex) {
    using namespace ::testing;
    EXPECT_THAT(ex.what(), HasSubstr("(1 + 1 == 3)"));
    EXPECT_THAT(ex.what(), HasSubstr("assert_throw_ut.cpp"));
  }
}
