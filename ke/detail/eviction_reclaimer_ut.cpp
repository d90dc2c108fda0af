#include "ke/detail/eviction_reclaimer.hpp"
#include <ke/detail/mocked_token_store.hpp>
#include <ke/errors.hpp>

#include <gmock/gmock.h>

namespace {
ke::k8s::ConfigMap make_token(std::initializer_list<std::pair<char const*, char const*>> owners) {
  ke::k8s::ConfigMap token;
  token.mutable_metadata()->set_name("my-lock");
  for (auto const& o : owners) {
    auto& ref = *token.mutable_metadata()->add_owner_references();
    ref.set_api_version("v1");
    ref.set_kind(o.first);
    ref.set_name(o.second);
    ref.set_uid(std::string("uid-") + o.second);
  }
  return token;
}

ke::k8s::Pod make_pod(std::string const& phase, std::string const& reason, std::string const& deletion_timestamp) {
  ke::k8s::Pod pod;
  pod.mutable_metadata()->set_name("leader-0");
  pod.mutable_metadata()->set_uid("uid-leader-0");
  pod.mutable_metadata()->set_deletion_timestamp(deletion_timestamp);
  pod.mutable_status()->set_phase(phase);
  pod.mutable_status()->set_reason(reason);
  return pod;
}
} // anonymous namespace

/// @test Verify the conditions recognized as an eviction.
TEST(eviction_reclaimer, is_evicted) {
  using ke::detail::is_evicted;
  EXPECT_TRUE(is_evicted(make_pod("Failed", "Evicted", "")));
  EXPECT_FALSE(is_evicted(make_pod("Failed", "OOMKilled", "")));
  EXPECT_FALSE(is_evicted(make_pod("Running", "Evicted", "")));
  EXPECT_FALSE(is_evicted(make_pod("Succeeded", "", "")));
}

/// @test Verify that locks with zero or multiple owners are left alone.
TEST(eviction_reclaimer, malformed_owner_count) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer(_, _)).Times(0);
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({})));
  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({{"Pod", "leader-0"}, {"Pod", "leader-1"}})));
}

/// @test Verify that locks owned by something other than a pod are left alone.
TEST(eviction_reclaimer, malformed_owner_kind) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer(_, _)).Times(0);
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({{"ReplicaSet", "leader-0"}})));
}

/// @test Verify that a deleted holder is left to the garbage collector.
TEST(eviction_reclaimer, holder_not_found) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer("leader-0", _)).WillOnce(Return(grpc::Status(grpc::StatusCode::NOT_FOUND, "gone")));
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({{"Pod", "leader-0"}})));
}

/// @test Verify that unexpected errors fetching the holder are propagated.
TEST(eviction_reclaimer, holder_lookup_error) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer("leader-0", _)).WillOnce(Return(grpc::Status(grpc::StatusCode::UNKNOWN, "timeout")));
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  EXPECT_THROW(ke::detail::reclaim(store, make_token({{"Pod", "leader-0"}})), ke::api_error);
}

/// @test Verify that an evicted holder is deleted exactly once.
TEST(eviction_reclaimer, evicted_holder_deleted) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer("leader-0", _))
      .WillOnce(DoAll(SetArgReferee<1>(make_pod("Failed", "Evicted", "")), Return(grpc::Status::OK)));
  EXPECT_CALL(store, delete_peer("leader-0")).WillOnce(Return(grpc::Status::OK));

  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({{"Pod", "leader-0"}})));
}

/// @test Verify that failures deleting an evicted holder are not propagated.
TEST(eviction_reclaimer, evicted_holder_delete_fails) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer("leader-0", _))
      .WillOnce(DoAll(SetArgReferee<1>(make_pod("Failed", "Evicted", "")), Return(grpc::Status::OK)));
  EXPECT_CALL(store, delete_peer("leader-0"))
      .WillOnce(Return(grpc::Status(grpc::StatusCode::UNKNOWN, "pods is forbidden")));

  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({{"Pod", "leader-0"}})));
}

/// @test Verify that an evicted holder already being deleted is left alone.
TEST(eviction_reclaimer, evicted_holder_being_deleted) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer("leader-0", _))
      .WillOnce(DoAll(SetArgReferee<1>(make_pod("Failed", "Evicted", "2017-09-01T10:00:00Z")), Return(grpc::Status::OK)));
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({{"Pod", "leader-0"}})));
}

/// @test Verify that a live holder is left alone.
TEST(eviction_reclaimer, running_holder) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer("leader-0", _))
      .WillOnce(DoAll(SetArgReferee<1>(make_pod("Running", "", "")), Return(grpc::Status::OK)));
  EXPECT_CALL(store, delete_peer(_)).Times(0);

  EXPECT_NO_THROW(ke::detail::reclaim(store, make_token({{"Pod", "leader-0"}})));
}
