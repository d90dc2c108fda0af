#ifndef ke_detail_http_client_hpp
#define ke_detail_http_client_hpp
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

#include <ke/api_config.hpp>

#include <grpc++/grpc++.h>
#include <memory>
#include <string>

namespace ke {
namespace detail {

/// A request to the API server, @a path is relative to the server URL.
struct http_request {
  std::string method;
  std::string path;
  std::string body;
};

struct http_response {
  long status_code = 0;
  std::string body;
};

/**
 * Provides a dependency injection point to mock the HTTP transport.
 *
 * The Kubernetes token store formats requests and interprets responses, this interface performs the round trip.
 * Please see ke::detail::mocked_http_client for a mocked version.
 */
class http_client {
public:
  virtual ~http_client();

  /**
   * Send @a request and wait for the response.
   *
   * HTTP errors are not failures of this function, they are reported in @a response.  A non-OK status means the
   * request could not be completed at all, for example because the server is unreachable.
   */
  virtual grpc::Status perform(http_request const& request, http_response& response) = 0;
};

/// Create the production transport, based on libcurl.
std::unique_ptr<http_client> make_curl_http_client(api_config config);

} // namespace detail
} // namespace ke

#endif // ke_detail_http_client_hpp
