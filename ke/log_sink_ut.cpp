#include "ke/log_sink.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that the ke::make_log_sink works as expected.
 */
TEST(log_sink, basic) {
  std::string value;
  ke::severity sev;
  auto ls = ke::make_log_sink([&value, &sev](ke::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(ke::severity::info, std::string("testing 1 2 3"));
  ASSERT_EQ(sev, ke::severity::info);
  ASSERT_EQ(value, "testing 1 2 3");
}

/**
 * @test Verify that ke::make_ostream_log_sink writes one line per message.
 */
TEST(log_sink, ostream) {
  std::ostringstream os;
  auto ls = ke::make_ostream_log_sink(os);
  ls->log(ke::severity::info, std::string("first"));
  ls->log(ke::severity::error, std::string("second"));
  ASSERT_EQ(os.str(), "first\nsecond\n");
}
