//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
#include "ke/detail/kube_token_store.hpp"
#include <ke/detail/mocked_http_client.hpp>

#include <gmock/gmock.h>

/// Define helper types and functions used in these tests
namespace {
using ke::detail::http_request;
using ke::detail::http_response;
using ke::detail::mocked_http_client;

http_response make_response(long code, std::string body) {
  http_response r;
  r.status_code = code;
  r.body = std::move(body);
  return r;
}

char const configmap_json[] = R"""({
  "kind": "ConfigMap",
  "apiVersion": "v1",
  "metadata": {
    "name": "my-lock",
    "namespace": "team-a",
    "uid": "0b4b0bd6-9b0b-11e7-8f3b-42010a800002",
    "resourceVersion": "5821",
    "creationTimestamp": "2017-09-17T12:00:00Z",
    "ownerReferences": [
      {
        "apiVersion": "v1",
        "kind": "Pod",
        "name": "operator-0",
        "uid": "5b3c1f2a-9b0a-11e7-8f3b-42010a800002",
        "controller": false
      }
    ]
  }
})""";

char const pod_json[] = R"""({
  "kind": "Pod",
  "apiVersion": "v1",
  "metadata": {
    "name": "operator-0",
    "namespace": "team-a",
    "uid": "5b3c1f2a-9b0a-11e7-8f3b-42010a800002",
    "labels": {"app": "operator"},
    "deletionTimestamp": "2017-09-17T12:05:00Z"
  },
  "spec": {"containers": [{"name": "operator", "image": "operator:1.0"}]},
  "status": {
    "phase": "Failed",
    "reason": "Evicted",
    "message": "The node was low on resource: memory."
  }
})""";

char const conflict_json[] = R"""({
  "kind": "Status",
  "apiVersion": "v1",
  "metadata": {},
  "status": "Failure",
  "message": "configmaps \"my-lock\" already exists",
  "reason": "AlreadyExists",
  "details": {"name": "my-lock", "kind": "configmaps"},
  "code": 409
})""";

/// Create a store using @a client, the store takes ownership but the test keeps a pointer to set expectations.
std::unique_ptr<ke::detail::kube_token_store> make_store(mocked_http_client*& client) {
  auto c = std::make_unique<mocked_http_client>();
  client = c.get();
  return std::make_unique<ke::detail::kube_token_store>("team-a", std::move(c));
}
} // anonymous namespace

/// @test Verify that get_token() fetches and decodes the ConfigMap.
TEST(kube_token_store, get_token) {
  using namespace ::testing;
  mocked_http_client* client;
  auto store = make_store(client);
  EXPECT_CALL(*client, perform(_, _)).WillOnce(Invoke([](http_request const& req, http_response& res) {
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/api/v1/namespaces/team-a/configmaps/my-lock");
    EXPECT_EQ(req.body, "");
    res = make_response(200, configmap_json);
    return grpc::Status::OK;
  }));

  ke::k8s::ConfigMap token;
  auto status = store->get_token("my-lock", token);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(token.metadata().name(), "my-lock");
  EXPECT_EQ(token.metadata().namespace_(), "team-a");
  ASSERT_EQ(token.metadata().owner_references_size(), 1);
  EXPECT_EQ(token.metadata().owner_references(0).kind(), "Pod");
  EXPECT_EQ(token.metadata().owner_references(0).name(), "operator-0");
  EXPECT_EQ(token.metadata().owner_references(0).uid(), "5b3c1f2a-9b0a-11e7-8f3b-42010a800002");
}

/// @test Verify that a missing ConfigMap is reported as NOT_FOUND.
TEST(kube_token_store, get_token_not_found) {
  using namespace ::testing;
  mocked_http_client* client;
  auto store = make_store(client);
  EXPECT_CALL(*client, perform(_, _))
      .WillOnce(DoAll(
          SetArgReferee<1>(make_response(
              404, R"""({"kind":"Status","message":"configmaps \"my-lock\" not found","reason":"NotFound","code":404})""")),
          Return(grpc::Status::OK)));

  ke::k8s::ConfigMap token;
  auto status = store->get_token("my-lock", token);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(status.error_message(), "configmaps \"my-lock\" not found");
}

/// @test Verify the ConfigMap created by create_token().
TEST(kube_token_store, create_token) {
  using namespace ::testing;
  mocked_http_client* client;
  auto store = make_store(client);
  EXPECT_CALL(*client, perform(_, _)).WillOnce(Invoke([](http_request const& req, http_response& res) {
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/api/v1/namespaces/team-a/configmaps");

    ke::k8s::ConfigMap body;
    EXPECT_TRUE(ke::detail::parse_json(req.body, body).ok()) << req.body;
    EXPECT_EQ(body.api_version(), "v1");
    EXPECT_EQ(body.kind(), "ConfigMap");
    EXPECT_EQ(body.metadata().name(), "my-lock");
    EXPECT_EQ(body.metadata().namespace_(), "team-a");
    EXPECT_EQ(body.metadata().owner_references_size(), 1);
    // ... the API server expects the Kubernetes field names ...
    EXPECT_THAT(req.body, HasSubstr("\"ownerReferences\""));
    EXPECT_THAT(req.body, HasSubstr("\"apiVersion\""));

    res = make_response(201, req.body);
    return grpc::Status::OK;
  }));

  ke::k8s::OwnerReference owner;
  owner.set_api_version("v1");
  owner.set_kind("Pod");
  owner.set_name("operator-0");
  owner.set_uid("5b3c1f2a");
  EXPECT_TRUE(store->create_token("my-lock", owner).ok());
}

/// @test Verify that losing the race to create the ConfigMap is reported as ALREADY_EXISTS.
TEST(kube_token_store, create_token_conflict) {
  using namespace ::testing;
  mocked_http_client* client;
  auto store = make_store(client);
  EXPECT_CALL(*client, perform(_, _))
      .WillOnce(DoAll(SetArgReferee<1>(make_response(409, conflict_json)), Return(grpc::Status::OK)));

  auto status = store->create_token("my-lock", ke::k8s::OwnerReference());
  EXPECT_EQ(status.error_code(), grpc::StatusCode::ALREADY_EXISTS);
  EXPECT_EQ(status.error_message(), "configmaps \"my-lock\" already exists");
}

/// @test Verify that get_peer() decodes the status fields used to detect evictions.
TEST(kube_token_store, get_peer) {
  using namespace ::testing;
  mocked_http_client* client;
  auto store = make_store(client);
  EXPECT_CALL(*client, perform(_, _)).WillOnce(Invoke([](http_request const& req, http_response& res) {
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/api/v1/namespaces/team-a/pods/operator-0");
    res = make_response(200, pod_json);
    return grpc::Status::OK;
  }));

  ke::k8s::Pod pod;
  auto status = store->get_peer("operator-0", pod);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(pod.metadata().uid(), "5b3c1f2a-9b0a-11e7-8f3b-42010a800002");
  EXPECT_EQ(pod.metadata().deletion_timestamp(), "2017-09-17T12:05:00Z");
  EXPECT_EQ(pod.status().phase(), "Failed");
  EXPECT_EQ(pod.status().reason(), "Evicted");
}

/// @test Verify the request made by delete_peer().
TEST(kube_token_store, delete_peer) {
  using namespace ::testing;
  mocked_http_client* client;
  auto store = make_store(client);
  EXPECT_CALL(*client, perform(_, _)).WillOnce(Invoke([](http_request const& req, http_response& res) {
    EXPECT_EQ(req.method, "DELETE");
    EXPECT_EQ(req.path, "/api/v1/namespaces/team-a/pods/operator-0");
    res = make_response(200, pod_json);
    return grpc::Status::OK;
  }));
  EXPECT_TRUE(store->delete_peer("operator-0").ok());
}

/// @test Verify that transport failures, authorization failures and garbage are reported as UNKNOWN.
TEST(kube_token_store, unknown_errors) {
  using namespace ::testing;
  mocked_http_client* client;
  auto store = make_store(client);
  EXPECT_CALL(*client, perform(_, _))
      .WillOnce(Return(grpc::Status(grpc::StatusCode::UNAVAILABLE, "Couldn't connect to server")))
      .WillOnce(DoAll(SetArgReferee<1>(make_response(403, "forbidden")), Return(grpc::Status::OK)))
      .WillOnce(DoAll(SetArgReferee<1>(make_response(200, "<html>")), Return(grpc::Status::OK)));

  ke::k8s::Pod pod;
  auto status = store->get_peer("operator-0", pod);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNKNOWN);
  EXPECT_EQ(status.error_message(), "Couldn't connect to server");

  status = store->get_peer("operator-0", pod);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNKNOWN);
  EXPECT_EQ(status.error_message(), "HTTP status 403");

  status = store->get_peer("operator-0", pod);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNKNOWN);
  EXPECT_THAT(status.error_message(), HasSubstr("cannot parse"));
}

/// @test Verify the classification of HTTP status codes.
TEST(kube_token_store, classify_response) {
  using ke::detail::classify_response;
  EXPECT_TRUE(classify_response(make_response(200, "")).ok());
  EXPECT_TRUE(classify_response(make_response(201, "")).ok());
  EXPECT_TRUE(classify_response(make_response(202, "")).ok());
  EXPECT_EQ(classify_response(make_response(404, "")).error_code(), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(classify_response(make_response(409, conflict_json)).error_code(), grpc::StatusCode::ALREADY_EXISTS);
  EXPECT_EQ(classify_response(make_response(401, "")).error_code(), grpc::StatusCode::UNKNOWN);
  EXPECT_EQ(classify_response(make_response(500, "")).error_code(), grpc::StatusCode::UNKNOWN);
  EXPECT_EQ(classify_response(make_response(0, "")).error_code(), grpc::StatusCode::UNKNOWN);
}
