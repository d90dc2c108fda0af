#ifndef ke_detail_mocked_http_client_hpp
#define ke_detail_mocked_http_client_hpp
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

#include <gmock/gmock.h>

namespace ke {
namespace detail {

/**
 * A transport that intercepts all requests, to verify how the Kubernetes token store uses the REST API.
 */
class mocked_http_client : public http_client {
public:
  MOCK_METHOD2(perform, grpc::Status(http_request const& request, http_response& response));
};

} // namespace detail
} // namespace ke

#endif // ke_detail_mocked_http_client_hpp
