#include "ke/leader.hpp"
#include <ke/detail/exponential_backoff.hpp>
#include <ke/detail/fake_token_store.hpp>
#include <ke/errors.hpp>

#include <gmock/gmock.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

/// Define helper types and functions used in these tests
namespace {
using namespace std::chrono_literals;

/// Forward all calls to a fake store that outlives the election.
class shared_store : public ke::token_store {
public:
  explicit shared_store(std::shared_ptr<ke::detail::fake_token_store> fake)
      : fake_(std::move(fake)) {
  }

  grpc::Status get_token(std::string const& name, ke::k8s::ConfigMap& token) override {
    return fake_->get_token(name, token);
  }
  grpc::Status create_token(std::string const& name, ke::k8s::OwnerReference const& owner) override {
    return fake_->create_token(name, owner);
  }
  grpc::Status get_peer(std::string const& name, ke::k8s::Pod& pod) override {
    return fake_->get_peer(name, pod);
  }
  grpc::Status delete_peer(std::string const& name) override {
    return fake_->delete_peer(name);
  }

private:
  std::shared_ptr<ke::detail::fake_token_store> fake_;
};

/// Setup the environment of a pod named @a pod_name, or an environment without a name if it is empty.
class leader_environment {
public:
  explicit leader_environment(std::string const& pod_name)
      : fake(std::make_shared<ke::detail::fake_token_store>("team-a"))
      , factory_calls(0)
      , config() {
    config.namespace_file = ::testing::TempDir() + "ke_leader_ut_namespace";
    config.pod_name_variable = "KE_LEADER_UT_POD_NAME";
    std::ofstream(config.namespace_file) << "team-a\n";
    if (pod_name.empty()) {
      unsetenv(config.pod_name_variable.c_str());
    } else {
      setenv(config.pod_name_variable.c_str(), pod_name.c_str(), 1);
    }
  }
  ~leader_environment() {
    unsetenv(config.pod_name_variable.c_str());
    std::remove(config.namespace_file.c_str());
  }

  ke::detail::token_store_factory factory() {
    return [this](std::string const& ns) {
      ++factory_calls;
      EXPECT_EQ(ns, "team-a");
      return std::unique_ptr<ke::token_store>(new shared_store(fake));
    };
  }

  ke::election_result run(std::string const& lock_name, int max_waits = 100) {
    ke::detail::exponential_backoff backoff(1s, 16s, 0.2, 7);
    int waits = 0;
    return ke::detail::become_leader(
        lock_name, config, factory(), backoff,
        [&waits, max_waits](std::chrono::milliseconds) { return ++waits >= max_waits; });
  }

  ke::election_result run(std::string const& lock_name, ke::cancellation& cancel) {
    ke::detail::exponential_backoff backoff(1s, 16s, 0.2, 7);
    return ke::detail::become_leader(
        lock_name, config, factory(), backoff, [&cancel](std::chrono::milliseconds d) { return cancel.wait_for(d); },
        [&cancel]() { return cancel.cancelled(); });
  }

  std::shared_ptr<ke::detail::fake_token_store> fake;
  int factory_calls;
  ke::identity_config config;
};
} // anonymous namespace

/// @test Verify that a pod becomes the leader when there is no lock.
TEST(leader, end_to_end) {
  leader_environment env("operator-0");
  env.fake->add_pod("operator-0", "uid-operator-0", "Running");

  EXPECT_EQ(env.run("my-lock"), ke::election_result::elected);
  EXPECT_EQ(env.factory_calls, 1);

  ke::k8s::ConfigMap token;
  ASSERT_TRUE(env.fake->get_token("my-lock", token).ok());
  ASSERT_EQ(token.metadata().owner_references_size(), 1);
  EXPECT_EQ(token.metadata().owner_references(0).name(), "operator-0");
  EXPECT_EQ(token.metadata().owner_references(0).uid(), "uid-operator-0");
  EXPECT_EQ(token.metadata().owner_references(0).kind(), "Pod");

  // ... running again (as if the container restarted) keeps the lock ...
  EXPECT_EQ(env.run("my-lock"), ke::election_result::already_leader);
  EXPECT_EQ(env.fake->create_calls(), 1);
}

/// @test Verify that a second pod waits while the first one is the leader.
TEST(leader, second_pod_waits) {
  leader_environment env("operator-1");
  env.fake->add_pod("operator-0", "uid-operator-0", "Running");
  env.fake->add_pod("operator-1", "uid-operator-1", "Running");
  ASSERT_TRUE(env.fake->create_token("my-lock", ke::make_owner_reference({"team-a", "operator-0", "uid-operator-0"}))
                  .ok());

  EXPECT_EQ(env.run("my-lock", 3), ke::election_result::cancelled);
  EXPECT_TRUE(env.fake->deleted_peers().empty());
}

/// @test Verify that a missing POD_NAME fails before contacting the API server.
TEST(leader, missing_pod_name) {
  leader_environment env("");
  EXPECT_THROW(env.run("my-lock"), ke::configuration_error);
  EXPECT_EQ(env.factory_calls, 0);
  EXPECT_EQ(env.fake->create_calls(), 0);
}

/// @test Verify that a missing namespace file fails before contacting the API server.
TEST(leader, missing_namespace) {
  leader_environment env("operator-0");
  env.config.namespace_file = ::testing::TempDir() + "ke_leader_ut_does_not_exist";
  EXPECT_THROW(env.run("my-lock"), ke::configuration_error);
  EXPECT_EQ(env.factory_calls, 0);
}

/// @test Verify that a pod that cannot find itself is a configuration error.
TEST(leader, own_pod_not_found) {
  leader_environment env("operator-0");
  EXPECT_THROW(env.run("my-lock"), ke::configuration_error);
  EXPECT_EQ(env.factory_calls, 1);
  EXPECT_EQ(env.fake->create_calls(), 0);
}

/// @test Verify that a cancelled election does not contact the API server.
TEST(leader, cancelled_before_start) {
  leader_environment env("operator-0");
  env.fake->add_pod("operator-0", "uid-operator-0", "Running");
  ke::cancellation cancel;
  cancel.cancel();

  EXPECT_EQ(env.run("my-lock", cancel), ke::election_result::cancelled);
  EXPECT_EQ(env.factory_calls, 0);
  EXPECT_EQ(env.fake->create_calls(), 0);
  EXPECT_FALSE(env.fake->has_token("my-lock"));
}

/// @test Verify that the public entry point returns immediately when cancelled, without any configuration.
TEST(leader, public_entry_point_cancelled) {
  ke::cancellation cancel;
  cancel.cancel();
  EXPECT_EQ(ke::become_leader("my-lock", cancel), ke::election_result::cancelled);
}

TEST(election_result, streaming) {
  std::ostringstream os;
  os << ke::election_result::elected << " " << ke::election_result::already_leader << " "
     << ke::election_result::cancelled;
  EXPECT_EQ(os.str(), "elected already_leader cancelled");
  EXPECT_TRUE(ke::is_leader(ke::election_result::elected));
  EXPECT_TRUE(ke::is_leader(ke::election_result::already_leader));
  EXPECT_FALSE(ke::is_leader(ke::election_result::cancelled));
}
