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

#include <google/protobuf/util/json_util.h>
#include <sstream>

namespace ke {
namespace detail {

kube_token_store::kube_token_store(std::string ns, std::unique_ptr<http_client> client)
    : ns_(std::move(ns))
    , client_(std::move(client)) {
}

grpc::Status kube_token_store::get_token(std::string const& name, k8s::ConfigMap& token) {
  http_response response;
  auto status = round_trip(http_request{"GET", collection_path("configmaps") + "/" + name, ""}, response);
  if (not status.ok()) {
    return status;
  }
  return parse_json(response.body, token);
}

grpc::Status kube_token_store::create_token(std::string const& name, k8s::OwnerReference const& owner) {
  k8s::ConfigMap token;
  token.set_api_version("v1");
  token.set_kind("ConfigMap");
  token.mutable_metadata()->set_name(name);
  token.mutable_metadata()->set_namespace_(ns_);
  *token.mutable_metadata()->add_owner_references() = owner;

  std::string body;
  auto status = to_json(token, body);
  if (not status.ok()) {
    return status;
  }
  http_response response;
  return round_trip(http_request{"POST", collection_path("configmaps"), body}, response);
}

grpc::Status kube_token_store::get_peer(std::string const& name, k8s::Pod& pod) {
  http_response response;
  auto status = round_trip(http_request{"GET", collection_path("pods") + "/" + name, ""}, response);
  if (not status.ok()) {
    return status;
  }
  return parse_json(response.body, pod);
}

grpc::Status kube_token_store::delete_peer(std::string const& name) {
  http_response response;
  return round_trip(http_request{"DELETE", collection_path("pods") + "/" + name, ""}, response);
}

grpc::Status kube_token_store::round_trip(http_request const& request, http_response& response) {
  auto status = client_->perform(request, response);
  if (not status.ok()) {
    return grpc::Status(grpc::StatusCode::UNKNOWN, status.error_message());
  }
  return classify_response(response);
}

std::string kube_token_store::collection_path(char const* resource) const {
  return "/api/v1/namespaces/" + ns_ + "/" + resource;
}

grpc::Status classify_response(http_response const& response) {
  if (response.status_code >= 200 and response.status_code < 300) {
    return grpc::Status::OK;
  }
  std::string message;
  k8s::Status details;
  if (parse_json(response.body, details).ok() and not details.message().empty()) {
    message = details.message();
  } else {
    std::ostringstream os;
    os << "HTTP status " << response.status_code;
    message = os.str();
  }
  switch (response.status_code) {
  case 404:
    return grpc::Status(grpc::StatusCode::NOT_FOUND, message);
  case 409:
    return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, message);
  default:
    break;
  }
  return grpc::Status(grpc::StatusCode::UNKNOWN, message);
}

grpc::Status parse_json(std::string const& json, google::protobuf::Message& msg) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(json, &msg, options);
  if (not status.ok()) {
    return grpc::Status(
        grpc::StatusCode::UNKNOWN, "cannot parse " + msg.GetTypeName() + " from API response: " + status.ToString());
  }
  return grpc::Status::OK;
}

grpc::Status to_json(google::protobuf::Message const& msg, std::string& json) {
  google::protobuf::util::JsonPrintOptions options;
  auto status = google::protobuf::util::MessageToJsonString(msg, &json, options);
  if (not status.ok()) {
    return grpc::Status(grpc::StatusCode::UNKNOWN, "cannot format " + msg.GetTypeName() + ": " + status.ToString());
  }
  return grpc::Status::OK;
}

} // namespace detail
} // namespace ke
