#include "ke/cancellation.hpp"

#include <gtest/gtest.h>

#include <thread>

/**
 * @test Verify that ke::cancellation times out when nobody cancels it.
 */
TEST(cancellation, timeout) {
  using namespace std::chrono_literals;
  ke::cancellation c;
  EXPECT_FALSE(c.cancelled());
  EXPECT_FALSE(c.wait_for(10ms));
  EXPECT_FALSE(c.cancelled());
}

/**
 * @test Verify that ke::cancellation wakes up a blocked thread.
 */
TEST(cancellation, wakes_up_waiter) {
  using namespace std::chrono_literals;
  ke::cancellation c;

  auto start = std::chrono::steady_clock::now();
  std::thread t([&c]() {
    std::this_thread::sleep_for(20ms);
    c.cancel();
  });
  EXPECT_TRUE(c.wait_for(60s));
  auto elapsed = std::chrono::steady_clock::now() - start;
  t.join();
  EXPECT_LT(elapsed, 30s);
  EXPECT_TRUE(c.cancelled());
}

/**
 * @test Verify that a cancelled object does not block at all.
 */
TEST(cancellation, sticky) {
  using namespace std::chrono_literals;
  ke::cancellation c;
  c.cancel();
  c.cancel();
  EXPECT_TRUE(c.cancelled());
  EXPECT_TRUE(c.wait_for(60s));
}
