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
#include "ke/api_config.hpp"
#include <ke/errors.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
char const* getenv_or_empty(char const* name) {
  char const* value = std::getenv(name);
  return value == nullptr ? "" : value;
}
} // anonymous namespace

namespace ke {

api_config in_cluster_config(std::string const& service_account_dir) {
  std::string host = getenv_or_empty("KUBERNETES_SERVICE_HOST");
  std::string port = getenv_or_empty("KUBERNETES_SERVICE_PORT");
  if (host.empty() or port.empty()) {
    throw configuration_error(
        "unable to load in-cluster configuration, KUBERNETES_SERVICE_HOST and KUBERNETES_SERVICE_PORT must be defined");
  }

  auto token_file = service_account_dir + "/token";
  std::ifstream is(token_file);
  if (not is) {
    throw configuration_error("unable to load in-cluster configuration, cannot open " + token_file);
  }
  std::ostringstream token;
  token << is.rdbuf();

  api_config config;
  // ... IPv6 addresses need brackets in a URL ...
  if (host.find(':') != std::string::npos) {
    host = "[" + host + "]";
  }
  config.server = "https://" + host + ":" + port;
  config.bearer_token = token.str();
  while (not config.bearer_token.empty() and
         (config.bearer_token.back() == '\n' or config.bearer_token.back() == '\r')) {
    config.bearer_token.pop_back();
  }
  if (config.bearer_token.empty()) {
    throw configuration_error("unable to load in-cluster configuration, empty token in " + token_file);
  }
  config.ca_file = service_account_dir + "/ca.crt";
  return config;
}

} // namespace ke
