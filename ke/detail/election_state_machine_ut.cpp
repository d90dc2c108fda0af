#include "ke/detail/election_state_machine.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify the transitions of a candidate that waits once and then wins.
 */
TEST(election_state_machine, basic) {
  using s = ke::detail::election_state;
  ke::detail::election_state_machine machine;

  ASSERT_EQ(machine.current(), s::init);
  EXPECT_FALSE(machine.change_state("test", s::acquiring));
  EXPECT_TRUE(machine.change_state("test", s::checking_existing));
  EXPECT_FALSE(machine.change_state("test", s::init));
  EXPECT_TRUE(machine.change_state("test", s::acquiring));
  EXPECT_FALSE(machine.change_state("test", s::already_leader));
  EXPECT_TRUE(machine.change_state("test", s::waiting));
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_TRUE(machine.change_state("test", s::acquiring));
  EXPECT_TRUE(machine.change_state("test", s::leader));
  EXPECT_EQ(machine.current(), s::leader);

  // ... terminal states are final ...
  EXPECT_FALSE(machine.change_state("test", s::acquiring));
  EXPECT_FALSE(machine.change_state("test", s::failed));
  EXPECT_FALSE(machine.change_state("test", s::cancelled));
  EXPECT_EQ(machine.current(), s::leader);
}

/**
 * @test Verify that a restarted leader goes directly to already_leader.
 */
TEST(election_state_machine, already_leader) {
  using s = ke::detail::election_state;
  ke::detail::election_state_machine machine;
  EXPECT_TRUE(machine.change_state("test", s::checking_existing));
  EXPECT_TRUE(machine.change_state("test", s::already_leader));
  EXPECT_FALSE(machine.change_state("test", s::acquiring));
}

/**
 * @test Verify that cancellation and failures are accepted from any non-terminal state.
 */
TEST(election_state_machine, abort_from_any_state) {
  using s = ke::detail::election_state;
  {
    ke::detail::election_state_machine machine;
    EXPECT_TRUE(machine.change_state("test", s::failed));
    EXPECT_FALSE(machine.change_state("test", s::cancelled));
  }
  {
    ke::detail::election_state_machine machine;
    EXPECT_TRUE(machine.change_state("test", s::checking_existing));
    EXPECT_TRUE(machine.change_state("test", s::acquiring));
    EXPECT_TRUE(machine.change_state("test", s::waiting));
    EXPECT_TRUE(machine.change_state("test", s::cancelled));
    EXPECT_FALSE(machine.change_state("test", s::acquiring));
  }
}

/**
 * @test Verify that the iostream operator for ke::detail::election_state works as expected.
 */
TEST(election_state, streaming) {
  using s = ke::detail::election_state;
  std::ostringstream os;
  os << s::init << " " << s::checking_existing << " " << s::already_leader << " " << s::acquiring << " " << s::leader
     << " " << s::waiting << " " << s::cancelled << " " << s::failed;
  EXPECT_EQ(os.str(), "init checking_existing already_leader acquiring leader waiting cancelled failed");
}

TEST(election_state, is_terminal) {
  using s = ke::detail::election_state;
  EXPECT_FALSE(ke::detail::is_terminal(s::init));
  EXPECT_FALSE(ke::detail::is_terminal(s::checking_existing));
  EXPECT_FALSE(ke::detail::is_terminal(s::acquiring));
  EXPECT_FALSE(ke::detail::is_terminal(s::waiting));
  EXPECT_TRUE(ke::detail::is_terminal(s::already_leader));
  EXPECT_TRUE(ke::detail::is_terminal(s::leader));
  EXPECT_TRUE(ke::detail::is_terminal(s::cancelled));
  EXPECT_TRUE(ke::detail::is_terminal(s::failed));
}
