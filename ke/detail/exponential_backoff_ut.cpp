#include <ke/detail/exponential_backoff.hpp>

#include <gtest/gtest.h>

#include <vector>

TEST(exponential_backoff, validation) {
  using namespace std::chrono_literals;
  EXPECT_THROW(ke::detail::exponential_backoff(1s, 500ms, 0.2), std::invalid_argument);
  EXPECT_THROW(ke::detail::exponential_backoff(0s, 16s, 0.2), std::invalid_argument);
  EXPECT_THROW(ke::detail::exponential_backoff(1s, 16s, -0.1), std::invalid_argument);
  EXPECT_THROW(ke::detail::exponential_backoff(1s, 16s, 1.0), std::invalid_argument);

  EXPECT_NO_THROW(ke::detail::exponential_backoff(1s, 1s, 0.0));
  EXPECT_NO_THROW(ke::detail::exponential_backoff(1s, 16s, 0.2));
}

/**
 * @test Verify that the nominal delays double up to the ceiling and stay there.
 */
TEST(exponential_backoff, doubles_until_ceiling) {
  using namespace std::chrono_literals;
  ke::detail::exponential_backoff backoff(1s, 16s, 0.2, 42);

  std::vector<long> actual;
  for (int i = 0; i != 8; ++i) {
    actual.push_back(static_cast<long>(backoff.current_delay().count()));
    backoff.record_failure();
  }
  std::vector<long> expected{1000, 2000, 4000, 8000, 16000, 16000, 16000, 16000};
  EXPECT_EQ(actual, expected);
}

/**
 * @test Verify that a ceiling which is not a power of two of the initial delay is never exceeded.
 */
TEST(exponential_backoff, ceiling_is_strict) {
  using namespace std::chrono_literals;
  ke::detail::exponential_backoff backoff(10ms, 50ms, 0.0, 42);
  EXPECT_EQ(backoff.record_failure().count(), 20);
  EXPECT_EQ(backoff.record_failure().count(), 40);
  EXPECT_EQ(backoff.record_failure().count(), 50);
  EXPECT_EQ(backoff.record_failure().count(), 50);
  EXPECT_EQ(backoff.jittered_delay().count(), 50);
}

/**
 * @test Verify that every jittered delay is within 20% of the nominal delay, for every cycle.
 */
TEST(exponential_backoff, jitter_bounds) {
  using namespace std::chrono_literals;
  ke::detail::exponential_backoff backoff(1s, 16s, 0.2);

  bool saw_different = false;
  for (int cycle = 0; cycle != 10; ++cycle) {
    auto nominal = backoff.current_delay();
    auto previous = backoff.jittered_delay();
    for (int sample = 0; sample != 200; ++sample) {
      auto d = backoff.jittered_delay();
      EXPECT_GE(d.count(), nominal.count() * 8 / 10) << "cycle=" << cycle;
      EXPECT_LE(d.count(), nominal.count() * 12 / 10) << "cycle=" << cycle;
      saw_different = saw_different or d != previous;
    }
    backoff.record_failure();
  }
  EXPECT_TRUE(saw_different);
}
