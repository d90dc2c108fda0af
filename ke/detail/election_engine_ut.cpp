#include "ke/detail/election_engine.hpp"
#include <ke/cancellation.hpp>
#include <ke/detail/exponential_backoff.hpp>
#include <ke/detail/fake_token_store.hpp>
#include <ke/detail/mocked_token_store.hpp>
#include <ke/errors.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <thread>
#include <vector>

/// Define helper types and functions used in these tests
namespace {
using namespace std::chrono_literals;
using ke::detail::election_engine;
using ke::detail::election_state;
using ke::election_result;

ke::peer_identity make_identity(std::string const& name) {
  ke::peer_identity self;
  self.ns = "team-a";
  self.name = name;
  self.uid = "uid-" + name;
  return self;
}

ke::detail::exponential_backoff make_backoff() {
  return ke::detail::exponential_backoff(1s, 16s, 0.2, 42);
}

ke::k8s::ConfigMap make_token(std::vector<std::string> const& owners) {
  ke::k8s::ConfigMap token;
  token.mutable_metadata()->set_name("my-lock");
  token.mutable_metadata()->set_namespace_("team-a");
  for (auto const& name : owners) {
    auto& ref = *token.mutable_metadata()->add_owner_references();
    ref.set_api_version("v1");
    ref.set_kind("Pod");
    ref.set_name(name);
    ref.set_uid("uid-" + name);
  }
  return token;
}

/// Records the delays and cancels the election after @a count waits.
struct recording_sleeper {
  explicit recording_sleeper(std::size_t count)
      : cancel_after(count) {
  }

  election_engine::sleep_function function() {
    return [this](std::chrono::milliseconds d) {
      delays.push_back(d);
      if (on_wait) {
        on_wait(delays.size());
      }
      return delays.size() >= cancel_after;
    };
  }

  std::size_t cancel_after;
  std::vector<std::chrono::milliseconds> delays;
  std::function<void(std::size_t)> on_wait;
};
} // anonymous namespace

/// @test Verify that a candidate creates a missing lock and becomes the leader.
TEST(election_engine, no_existing_lock) {
  ke::detail::fake_token_store store("team-a");
  auto backoff = make_backoff();
  recording_sleeper sleeper(1);
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());

  EXPECT_EQ(engine.state(), election_state::init);
  EXPECT_EQ(engine.run(), election_result::elected);
  EXPECT_EQ(engine.state(), election_state::leader);
  EXPECT_EQ(store.create_calls(), 1);
  EXPECT_TRUE(sleeper.delays.empty());

  ke::k8s::ConfigMap token;
  ASSERT_TRUE(store.get_token("my-lock", token).ok());
  ASSERT_EQ(token.metadata().owner_references_size(), 1);
  auto const& owner = token.metadata().owner_references(0);
  EXPECT_EQ(owner.kind(), "Pod");
  EXPECT_EQ(owner.name(), "candidate-0");
  EXPECT_EQ(owner.uid(), "uid-candidate-0");
}

/// @test Verify that a restarted leader keeps the lock without creating anything.
TEST(election_engine, restarted_leader) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_token("my-lock", _))
      .WillOnce(DoAll(SetArgReferee<1>(make_token({"candidate-0"})), Return(grpc::Status::OK)));
  EXPECT_CALL(store, create_token(_, _)).Times(0);
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  auto backoff = make_backoff();
  recording_sleeper sleeper(1);
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());
  EXPECT_EQ(engine.run(), election_result::already_leader);
  EXPECT_EQ(engine.state(), election_state::already_leader);
  EXPECT_TRUE(sleeper.delays.empty());
}

/// @test Verify that a candidate waits while the leader is alive, and wins once the leader is gone.
TEST(election_engine, wait_for_running_leader) {
  ke::detail::fake_token_store store("team-a");
  store.add_pod("leader-0", "uid-leader-0", "Running");
  store.put_token(make_token({"leader-0"}));

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  // ... the leader goes away (and the garbage collector removes the lock) during the third wait ...
  sleeper.on_wait = [&store](std::size_t n) {
    if (n == 3) {
      ASSERT_TRUE(store.delete_peer("leader-0").ok());
    }
  };
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());

  EXPECT_EQ(engine.run(), election_result::elected);
  EXPECT_EQ(store.create_calls(), 4);
  ASSERT_EQ(sleeper.delays.size(), 3U);
  std::vector<long> nominal{1000, 2000, 4000};
  for (std::size_t i = 0; i != nominal.size(); ++i) {
    EXPECT_GE(sleeper.delays[i].count(), nominal[i] * 8 / 10) << "i=" << i;
    EXPECT_LE(sleeper.delays[i].count(), nominal[i] * 12 / 10) << "i=" << i;
  }
}

/// @test Verify the backoff sequence, and that it never resets while waiting.
TEST(election_engine, backoff_sequence) {
  ke::detail::fake_token_store store("team-a");
  store.add_pod("leader-0", "uid-leader-0", "Running");
  store.put_token(make_token({"leader-0"}));

  auto backoff = make_backoff();
  recording_sleeper sleeper(9);
  std::vector<long> nominal;
  sleeper.on_wait = [&backoff, &nominal](std::size_t) {
    nominal.push_back(static_cast<long>(backoff.current_delay().count()));
  };
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());

  EXPECT_EQ(engine.run(), election_result::cancelled);
  EXPECT_EQ(engine.state(), election_state::cancelled);
  std::vector<long> expected{1000, 2000, 4000, 8000, 16000, 16000, 16000, 16000, 16000};
  EXPECT_EQ(nominal, expected);
  ASSERT_EQ(sleeper.delays.size(), expected.size());
  for (std::size_t i = 0; i != expected.size(); ++i) {
    EXPECT_GE(sleeper.delays[i].count(), expected[i] * 8 / 10) << "i=" << i;
    EXPECT_LE(sleeper.delays[i].count(), expected[i] * 12 / 10) << "i=" << i;
  }
  // ... a cancelled election does not make more attempts ...
  EXPECT_EQ(store.create_calls(), 9);
  EXPECT_TRUE(store.has_token("my-lock"));
}

/// @test Verify that an evicted leader is deleted exactly once, and the candidate takes over.
TEST(election_engine, evicted_leader) {
  ke::detail::fake_token_store store("team-a");
  auto& leader = store.add_pod("leader-0", "uid-leader-0", "Failed");
  leader.mutable_status()->set_reason("Evicted");
  store.put_token(make_token({"leader-0"}));

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());

  EXPECT_EQ(engine.run(), election_result::elected);
  EXPECT_EQ(store.deleted_peers(), std::vector<std::string>{"leader-0"});
  EXPECT_EQ(sleeper.delays.size(), 1U);
  EXPECT_EQ(store.create_calls(), 2);
}

/// @test Verify that an election cancelled before it runs makes no API calls.
TEST(election_engine, cancelled_before_run) {
  using namespace ::testing;
  StrictMock<ke::detail::mocked_token_store> store;

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  ke::cancellation cancel;
  cancel.cancel();
  election_engine engine(
      store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function(),
      [&cancel]() { return cancel.cancelled(); });

  EXPECT_EQ(engine.run(), election_result::cancelled);
  EXPECT_EQ(engine.state(), election_state::cancelled);
  EXPECT_TRUE(sleeper.delays.empty());
}

/// @test Verify that a cancellation after a wait completes stops the election before the next attempt.
TEST(election_engine, cancelled_after_wait) {
  ke::detail::fake_token_store store("team-a");
  store.add_pod("leader-0", "uid-leader-0", "Running");
  store.put_token(make_token({"leader-0"}));

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  ke::cancellation cancel;
  // ... the full delay elapses, but the application shuts down before the candidate tries again ...
  sleeper.on_wait = [&store, &cancel](std::size_t n) {
    if (n == 2) {
      ASSERT_TRUE(store.delete_peer("leader-0").ok());
      cancel.cancel();
    }
  };
  election_engine engine(
      store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function(),
      [&cancel]() { return cancel.cancelled(); });

  EXPECT_EQ(engine.run(), election_result::cancelled);
  EXPECT_EQ(engine.state(), election_state::cancelled);
  EXPECT_EQ(store.create_calls(), 2);
  EXPECT_FALSE(store.has_token("my-lock"));
}

/// @test Verify that malformed locks never trigger a delete.
TEST(election_engine, malformed_lock) {
  using namespace ::testing;
  for (auto const& owners : {std::vector<std::string>{}, std::vector<std::string>{"leader-0", "leader-1"}}) {
    ke::detail::mocked_token_store store;
    EXPECT_CALL(store, get_token("my-lock", _))
        .WillRepeatedly(DoAll(SetArgReferee<1>(make_token(owners)), Return(grpc::Status::OK)));
    EXPECT_CALL(store, create_token("my-lock", _))
        .WillRepeatedly(Return(grpc::Status(grpc::StatusCode::ALREADY_EXISTS, "exists")));
    EXPECT_CALL(store, get_peer(_, _)).Times(0);
    EXPECT_CALL(store, delete_peer(_)).Times(0);

    auto backoff = make_backoff();
    recording_sleeper sleeper(3);
    election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());
    EXPECT_EQ(engine.run(), election_result::cancelled);
    EXPECT_EQ(sleeper.delays.size(), 3U);
  }
}

/// @test Verify that a lock released between the failed create and the refresh is simply retried.
TEST(election_engine, lock_released_after_conflict) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  auto not_found = grpc::Status(grpc::StatusCode::NOT_FOUND, "not found");
  EXPECT_CALL(store, get_token("my-lock", _)).WillRepeatedly(Return(not_found));
  EXPECT_CALL(store, create_token("my-lock", _))
      .WillOnce(Return(grpc::Status(grpc::StatusCode::ALREADY_EXISTS, "exists")))
      .WillOnce(Return(grpc::Status::OK));
  EXPECT_CALL(store, get_peer(_, _)).Times(0);
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());
  EXPECT_EQ(engine.run(), election_result::elected);
  EXPECT_EQ(sleeper.delays.size(), 1U);
}

/// @test Verify that unexpected errors reading the lock abort the election.
TEST(election_engine, get_token_error) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_token("my-lock", _))
      .WillOnce(Return(grpc::Status(grpc::StatusCode::UNKNOWN, "connection refused")));
  EXPECT_CALL(store, create_token(_, _)).Times(0);

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());
  try {
    engine.run();
    FAIL() << "expected an api error";
  } catch (ke::api_error const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr("connection refused"));
    EXPECT_THAT(ex.what(), HasSubstr("lock=my-lock"));
  }
  EXPECT_EQ(engine.state(), election_state::failed);
}

/// @test Verify that unexpected errors creating the lock abort the election.
TEST(election_engine, create_token_error) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_token("my-lock", _)).WillOnce(Return(grpc::Status(grpc::StatusCode::NOT_FOUND, "")));
  EXPECT_CALL(store, create_token("my-lock", _))
      .WillOnce(Return(grpc::Status(grpc::StatusCode::UNKNOWN, "configmaps is forbidden")));

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());
  EXPECT_THROW(engine.run(), ke::api_error);
  EXPECT_EQ(engine.state(), election_state::failed);
  EXPECT_TRUE(sleeper.delays.empty());
}

/// @test Verify that errors looking up the current leader abort the election.
TEST(election_engine, leader_lookup_error) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_token("my-lock", _))
      .WillRepeatedly(DoAll(SetArgReferee<1>(make_token({"leader-0"})), Return(grpc::Status::OK)));
  EXPECT_CALL(store, create_token("my-lock", _))
      .WillOnce(Return(grpc::Status(grpc::StatusCode::ALREADY_EXISTS, "exists")));
  EXPECT_CALL(store, get_peer("leader-0", _)).WillOnce(Return(grpc::Status(grpc::StatusCode::UNKNOWN, "timeout")));

  auto backoff = make_backoff();
  recording_sleeper sleeper(100);
  election_engine engine(store, make_identity("candidate-0"), "my-lock", backoff, sleeper.function());
  EXPECT_THROW(engine.run(), ke::api_error);
  EXPECT_EQ(engine.state(), election_state::failed);
}

/// @test Verify that exactly one of many concurrent candidates wins.
TEST(election_engine, concurrent_candidates) {
  int const candidate_count = 16;
  ke::detail::fake_token_store store("team-a");

  std::atomic<int> elected(0);
  std::atomic<int> cancelled(0);
  std::atomic<bool> go(false);
  std::vector<std::thread> threads;
  for (int i = 0; i != candidate_count; ++i) {
    auto name = "candidate-" + std::to_string(i);
    store.add_pod(name, "uid-" + name, "Running");
    threads.emplace_back([&store, &elected, &cancelled, &go, name]() {
      auto backoff = make_backoff();
      election_engine engine(
          store, make_identity(name), "my-lock", backoff, [](std::chrono::milliseconds) { return true; });
      while (not go.load()) {
        std::this_thread::yield();
      }
      auto r = engine.run();
      if (r == election_result::elected) {
        ++elected;
      } else if (r == election_result::cancelled) {
        ++cancelled;
      }
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(elected.load(), 1);
  EXPECT_EQ(cancelled.load(), candidate_count - 1);
  EXPECT_EQ(store.create_calls(), candidate_count);
  EXPECT_TRUE(store.deleted_peers().empty());
}
