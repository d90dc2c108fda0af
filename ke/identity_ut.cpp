#include "ke/identity.hpp"
#include <ke/detail/fake_token_store.hpp>
#include <ke/detail/mocked_token_store.hpp>
#include <ke/errors.hpp>

#include <gmock/gmock.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace {
std::string write_temp_file(std::string const& basename, std::string const& contents) {
  auto path = ::testing::TempDir() + basename;
  std::ofstream os(path);
  os << contents;
  return path;
}
} // anonymous namespace

/**
 * @test Verify that the namespace is read and trimmed.
 */
TEST(identity, read_namespace) {
  auto path = write_temp_file("ke_identity_ut_namespace", "  team-a \n");
  EXPECT_EQ(ke::read_namespace(path), "team-a");
  std::remove(path.c_str());
}

/**
 * @test Verify that a missing or empty namespace file is a configuration error.
 */
TEST(identity, read_namespace_errors) {
  EXPECT_THROW(ke::read_namespace(::testing::TempDir() + "ke_identity_ut_does_not_exist"), ke::configuration_error);

  auto path = write_temp_file("ke_identity_ut_empty_namespace", " \n\t");
  EXPECT_THROW(ke::read_namespace(path), ke::configuration_error);
  std::remove(path.c_str());
}

/**
 * @test Verify that the pod name is read from the environment, and its absence reported.
 */
TEST(identity, pod_name_from_environment) {
  using namespace ::testing;
  char const* variable = "KE_IDENTITY_UT_POD_NAME";
  unsetenv(variable);
  try {
    ke::pod_name_from_environment(variable);
    FAIL() << "expected a configuration error";
  } catch (ke::configuration_error const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr(variable));
    EXPECT_THAT(ex.what(), HasSubstr("downward API"));
  }

  setenv(variable, "", 1);
  EXPECT_THROW(ke::pod_name_from_environment(variable), ke::configuration_error);

  setenv(variable, "operator-7d9f-abcde", 1);
  EXPECT_EQ(ke::pod_name_from_environment(variable), "operator-7d9f-abcde");
  unsetenv(variable);
}

/**
 * @test Verify that the identity includes the uid of the pod.
 */
TEST(identity, resolve) {
  ke::detail::fake_token_store store("team-a");
  store.add_pod("operator-0", "uid-0000", "Running");

  auto self = ke::resolve_identity(store, "team-a", "operator-0");
  EXPECT_EQ(self.ns, "team-a");
  EXPECT_EQ(self.name, "operator-0");
  EXPECT_EQ(self.uid, "uid-0000");

  auto owner = ke::make_owner_reference(self);
  EXPECT_EQ(owner.api_version(), "v1");
  EXPECT_EQ(owner.kind(), "Pod");
  EXPECT_EQ(owner.name(), "operator-0");
  EXPECT_EQ(owner.uid(), "uid-0000");
}

/**
 * @test Verify that a missing pod is a configuration error.
 */
TEST(identity, resolve_not_found) {
  ke::detail::fake_token_store store("team-a");
  EXPECT_THROW(ke::resolve_identity(store, "team-a", "operator-0"), ke::configuration_error);
}

/**
 * @test Verify that unexpected lookup errors are reported as ke::api_error.
 */
TEST(identity, resolve_api_error) {
  using namespace ::testing;
  ke::detail::mocked_token_store store;
  EXPECT_CALL(store, get_peer("operator-0", _))
      .WillOnce(Return(grpc::Status(grpc::StatusCode::UNKNOWN, "pods is forbidden")));

  try {
    ke::resolve_identity(store, "team-a", "operator-0");
    FAIL() << "expected an api error";
  } catch (ke::api_error const& ex) {
    EXPECT_EQ(ex.status().error_code(), grpc::StatusCode::UNKNOWN);
    EXPECT_THAT(ex.what(), HasSubstr("pods is forbidden"));
    EXPECT_THAT(ex.what(), HasSubstr("pod=operator-0"));
  }
}
