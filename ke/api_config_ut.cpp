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

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

namespace {
std::string make_service_account_dir(std::string const& token) {
  auto dir = ::testing::TempDir() + "ke_api_config_ut";
  mkdir(dir.c_str(), 0700);
  std::ofstream(dir + "/token") << token;
  return dir;
}
} // anonymous namespace

/**
 * @test Verify that the in-cluster configuration is loaded from the environment and the service account.
 */
TEST(api_config, in_cluster) {
  auto dir = make_service_account_dir("secret-token\n");
  setenv("KUBERNETES_SERVICE_HOST", "10.96.0.1", 1);
  setenv("KUBERNETES_SERVICE_PORT", "443", 1);

  auto config = ke::in_cluster_config(dir);
  EXPECT_EQ(config.server, "https://10.96.0.1:443");
  EXPECT_EQ(config.bearer_token, "secret-token");
  EXPECT_EQ(config.ca_file, dir + "/ca.crt");
  EXPECT_EQ(config.timeout, std::chrono::seconds(30));

  setenv("KUBERNETES_SERVICE_HOST", "fd00::1", 1);
  EXPECT_EQ(ke::in_cluster_config(dir).server, "https://[fd00::1]:443");

  unsetenv("KUBERNETES_SERVICE_HOST");
  unsetenv("KUBERNETES_SERVICE_PORT");
  std::remove((dir + "/token").c_str());
}

/**
 * @test Verify that running outside a cluster is a configuration error.
 */
TEST(api_config, not_in_cluster) {
  auto dir = make_service_account_dir("secret-token");
  unsetenv("KUBERNETES_SERVICE_HOST");
  setenv("KUBERNETES_SERVICE_PORT", "443", 1);
  EXPECT_THROW(ke::in_cluster_config(dir), ke::configuration_error);

  setenv("KUBERNETES_SERVICE_HOST", "10.96.0.1", 1);
  EXPECT_THROW(ke::in_cluster_config(dir + "/does-not-exist"), ke::configuration_error);

  std::ofstream(dir + "/token") << "\n";
  EXPECT_THROW(ke::in_cluster_config(dir), ke::configuration_error);

  unsetenv("KUBERNETES_SERVICE_HOST");
  unsetenv("KUBERNETES_SERVICE_PORT");
  std::remove((dir + "/token").c_str());
}
