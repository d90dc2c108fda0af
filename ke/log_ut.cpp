#include "ke/log.hpp"

#include <gmock/gmock.h>

namespace {
using captured_logs = std::vector<std::pair<ke::severity, std::string>>;

std::shared_ptr<ke::log_sink> capture_to(captured_logs& logs) {
  return ke::make_log_sink([&logs](ke::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that the KE_LOG_I() and the supporting classes all work in the normal case.
 */
TEST(log, basic) {
  ke::log lg;
  // ... without sinks the messages are simply dropped ...
  ASSERT_NO_THROW(KE_LOG_I(error, lg) << "lock " << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(KE_LOG_I(error, lg) << "became the leader of " << "my-lock");
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, ke::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] became the leader of my-lock"));
  ASSERT_THAT(logs[0].second, HasSubstr("log_ut.cpp"));
}

/**
 * @test Verify that messages below the run-time threshold are not formatted.
 */
TEST(log, run_time_disable) {
  ke::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(ke::severity::warning);
  ASSERT_NO_THROW(KE_LOG_I(info, lg) << "waiting " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);

  ASSERT_NO_THROW(KE_LOG_I(warning, lg) << "waiting " << f());
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(cnt, 1);
}

/**
 * @test Verify that messages below KE_MIN_SEVERITY are disabled at compile-time.
 */
TEST(log, compile_time_disable) {
  ke::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... use a level that is enabled at runtime, but disabled at compile-time ...
  lg.min_severity(ke::severity::trace);
  ASSERT_NO_THROW(KE_LOG_I(debug, lg) << "state transition " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
}

/**
 * @test Verify that the KE_LOG() macro and the supporting singleton work as expected.
 */
TEST(log, instance_basic) {
  ke::log& lg = ke::log::instance();
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(KE_LOG(info) << "trying to become the leader");
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, ke::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] trying to become the leader"));
  ASSERT_NO_THROW(lg.clear_sinks());
}

/**
 * @test Verify that each sink receives its own copy of the message.
 */
TEST(log, multiple_sinks) {
  ke::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(ke::make_log_sink([&logs](ke::severity sev, std::string&& msg) {
    logs.emplace_back(sev, std::string("(2) ") + msg);
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(KE_LOG_I(notice, lg) << "found existing lock");
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_THAT(logs[0].second, StartsWith("[notice] found existing lock"));
  ASSERT_THAT(logs[1].second, StartsWith("(2) [notice] found existing lock"));
}

/**
 * @test Complete code coverage for the ke::logger<true> class.
 */
TEST(log, logger_disabled) {
  ke::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  ke::logger<true> logger(ke::severity::error, __func__, __FILE__, __LINE__, lg);

  ASSERT_EQ((bool)logger, false);
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(logger.get()), ke::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}
