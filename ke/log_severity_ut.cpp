#include "ke/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(log_severity, base) {
  ASSERT_LT(ke::severity::LOWEST, ke::severity::HIGHEST);

  using s = ke::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error << " "
     << s::critical << " " << s::alert << " " << s::fatal;
  ASSERT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}

/**
 * @test Verify that ke::parse_severity() accepts the names produced by the streaming operator.
 */
TEST(log_severity, parse) {
  using s = ke::severity;
  EXPECT_EQ(ke::parse_severity("trace"), s::trace);
  EXPECT_EQ(ke::parse_severity("info"), s::info);
  EXPECT_EQ(ke::parse_severity("WARNING"), s::warning);
  EXPECT_EQ(ke::parse_severity("Fatal"), s::fatal);
  EXPECT_THROW(ke::parse_severity("verbose"), std::invalid_argument);
  EXPECT_THROW(ke::parse_severity(""), std::invalid_argument);
}

/**
 * @test Verify that ke::parse_severity() rejects names with bytes outside the ASCII range.
 */
TEST(log_severity, parse_non_ascii) {
  EXPECT_THROW(ke::parse_severity("d\xC3\xA9bug"), std::invalid_argument);
  EXPECT_THROW(ke::parse_severity("\xFF\xFE"), std::invalid_argument);
}
