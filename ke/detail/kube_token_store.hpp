#ifndef ke_detail_kube_token_store_hpp
#define ke_detail_kube_token_store_hpp
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

#include <ke/detail/http_client.hpp>
#include <ke/token_store.hpp>

#include <google/protobuf/message.h>
#include <memory>
#include <string>

namespace ke {
namespace detail {

/**
 * Implement ke::token_store using the Kubernetes core/v1 REST API.
 *
 * The lock is a ConfigMap, the peers are Pods, all in the namespace @a ns.  The JSON documents are converted from and
 * to the messages in ke/k8s.proto.
 */
class kube_token_store : public token_store {
public:
  kube_token_store(std::string ns, std::unique_ptr<http_client> client);

  grpc::Status get_token(std::string const& name, k8s::ConfigMap& token) override;
  grpc::Status create_token(std::string const& name, k8s::OwnerReference const& owner) override;
  grpc::Status get_peer(std::string const& name, k8s::Pod& pod) override;
  grpc::Status delete_peer(std::string const& name) override;

private:
  /// Perform a request and classify the result.
  grpc::Status round_trip(http_request const& request, http_response& response);

  std::string collection_path(char const* resource) const;

private:
  std::string ns_;
  std::unique_ptr<http_client> client_;
};

/**
 * Convert an API server response into one of the status codes used by ke::token_store.
 *
 * 2xx is OK, 404 is NOT_FOUND, 409 is ALREADY_EXISTS, everything else is UNKNOWN.  The message of the returned status
 * is taken from the Kubernetes Status document in the body, if any.
 */
grpc::Status classify_response(http_response const& response);

/// Parse a Kubernetes JSON document into @a msg, ignoring any fields not in the message.
grpc::Status parse_json(std::string const& json, google::protobuf::Message& msg);

/// Format @a msg as a Kubernetes JSON document into @a json.
grpc::Status to_json(google::protobuf::Message const& msg, std::string& json);

} // namespace detail
} // namespace ke

#endif // ke_detail_kube_token_store_hpp
