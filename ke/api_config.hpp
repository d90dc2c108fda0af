#ifndef ke_api_config_hpp
#define ke_api_config_hpp
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

#include <chrono>
#include <string>

namespace ke {

/**
 * How to reach and authenticate with the Kubernetes API server.
 */
struct api_config {
  api_config()
      : server()
      , bearer_token()
      , ca_file()
      , timeout(std::chrono::seconds(30)) {
  }

  /// The base URL, for example https://10.0.0.1:443
  std::string server;
  /// The service account token sent in the Authorization header.
  std::string bearer_token;
  /// The file with the certificate authority used to verify the server.
  std::string ca_file;
  /// The maximum time for a single request.
  std::chrono::milliseconds timeout;
};

/**
 * Load the configuration available to any pod with a service account.
 *
 * Uses the KUBERNETES_SERVICE_HOST and KUBERNETES_SERVICE_PORT environment variables, and the token and ca.crt files
 * mounted in @a service_account_dir.
 *
 * @throws ke::configuration_error if the process is not running in a cluster, or the files cannot be read.
 */
api_config in_cluster_config(std::string const& service_account_dir = "/var/run/secrets/kubernetes.io/serviceaccount");

} // namespace ke

#endif // ke_api_config_hpp
