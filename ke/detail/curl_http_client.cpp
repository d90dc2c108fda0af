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
#include "ke/detail/http_client.hpp"
#include <ke/log.hpp>

#include <curl/curl.h>

#include <mutex>
#include <sstream>

namespace {
std::once_flag curl_initialized;

std::size_t append_to_string(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

using curl_handle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_headers = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

/**
 * Send requests to the API server using libcurl.
 *
 * Each request uses a new easy handle, the election makes a handful of requests per minute at most.
 */
class curl_http_client : public ke::detail::http_client {
public:
  explicit curl_http_client(ke::api_config config)
      : config_(std::move(config)) {
    std::call_once(curl_initialized, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  grpc::Status perform(ke::detail::http_request const& request, ke::detail::http_response& response) override {
    curl_handle handle(curl_easy_init(), &curl_easy_cleanup);
    if (not handle) {
      return grpc::Status(grpc::StatusCode::UNKNOWN, "curl_easy_init() failed");
    }
    auto url = config_.server + request.path;
    auto authorization = "Authorization: Bearer " + config_.bearer_token;

    curl_headers headers(nullptr, &curl_slist_free_all);
    for (auto h : {"Accept: application/json", "Content-Type: application/json", authorization.c_str()}) {
      auto* list = curl_slist_append(headers.get(), h);
      if (list == nullptr) {
        return grpc::Status(grpc::StatusCode::UNKNOWN, "curl_slist_append() failed");
      }
      headers.release();
      headers.reset(list);
    }

    response.status_code = 0;
    response.body.clear();
    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (request.method == "POST") {
      curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    if (not config_.ca_file.empty()) {
      curl_easy_setopt(h, CURLOPT_CAINFO, config_.ca_file.c_str());
    }
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &append_to_string);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    KE_LOG(trace) << request.method << " " << url;
    auto code = curl_easy_perform(h);
    if (code != CURLE_OK) {
      std::ostringstream os;
      os << request.method << " " << url << " failed: " << curl_easy_strerror(code);
      return grpc::Status(grpc::StatusCode::UNKNOWN, os.str());
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    KE_LOG(trace) << request.method << " " << url << " -> " << response.status_code;
    return grpc::Status::OK;
  }

private:
  ke::api_config config_;
};
} // anonymous namespace

namespace ke {
namespace detail {

http_client::~http_client() {
}

std::unique_ptr<http_client> make_curl_http_client(api_config config) {
  return std::unique_ptr<http_client>(new curl_http_client(std::move(config)));
}

} // namespace detail
} // namespace ke
