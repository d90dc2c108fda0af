#include "ke/detail/status_errors.hpp"
#include <ke/k8s.pb.h>

#include <gmock/gmock.h>

/**
 * @test Verify that check_status does not raise on success.
 */
TEST(status_errors, check_status_ok) {
  using namespace ke::detail;

  grpc::Status status = grpc::Status::OK;
  ASSERT_NO_THROW(check_status(status, "test"));

  ke::k8s::OwnerReference owner;
  ASSERT_NO_THROW(check_status(status, "test", " in iteration=", 42, ", owner=", print_to_stream(owner)));
}

/**
 * @test Verify that check_status raises ke::api_error with the annotations and the original status.
 */
TEST(status_errors, check_status_error_annotations) {
  using namespace ke::detail;
  using namespace ::testing;

  ke::k8s::OwnerReference owner;
  owner.set_kind("Pod");
  owner.set_name("leader-0");
  grpc::Status status(grpc::StatusCode::UNKNOWN, "forbidden");
  try {
    check_status(status, "get_token(my-lock)", " owner=", print_to_stream(owner));
    FAIL() << "check_status() should have raised";
  } catch (ke::api_error const& ex) {
    EXPECT_THAT(ex.what(), StartsWith("get_token(my-lock) api error: forbidden [UNKNOWN] owner={"));
    EXPECT_THAT(ex.what(), HasSubstr("name: \"leader-0\""));
    EXPECT_EQ(ex.status().error_code(), grpc::StatusCode::UNKNOWN);
    EXPECT_EQ(ex.status().error_message(), "forbidden");
  }
}

/**
 * @test Verify that check_status works without annotations.
 */
TEST(status_errors, check_status_error_bare) {
  using namespace ke::detail;
  grpc::Status status(grpc::StatusCode::NOT_FOUND, "pods \"p-1\" not found");
  try {
    check_status(status, "test");
    FAIL() << "check_status() should have raised";
  } catch (std::runtime_error const& ex) {
    ASSERT_EQ(std::string(ex.what()), "test api error: pods \"p-1\" not found [NOT_FOUND]");
  }
}

/**
 * @test Verify that print_to_stream prints the message on a single line.
 */
TEST(status_errors, print_to_stream_basic) {
  using namespace ke::detail;
  using namespace ::testing;

  ke::k8s::ConfigMap token;
  token.mutable_metadata()->set_name("my-lock");
  token.mutable_metadata()->add_owner_references()->set_name("leader-0");

  std::ostringstream os;
  os << print_to_stream(token);
  auto actual = os.str();
  EXPECT_THAT(actual, StartsWith("{metadata {"));
  EXPECT_THAT(actual, HasSubstr("name: \"my-lock\""));
  EXPECT_THAT(actual, HasSubstr("owner_references {"));
  EXPECT_THAT(actual, Not(HasSubstr("\n")));
}

/**
 * @test Verify the symbolic names of the status codes used by the token store.
 */
TEST(status_errors, status_code_names) {
  using namespace ke::detail;
  std::ostringstream os;
  os << grpc::StatusCode::OK << " " << grpc::StatusCode::NOT_FOUND << " " << grpc::StatusCode::ALREADY_EXISTS << " "
     << grpc::StatusCode::UNKNOWN << " " << grpc::StatusCode::INTERNAL;
  ASSERT_EQ(os.str(), "OK NOT_FOUND ALREADY_EXISTS UNKNOWN StatusCode(13)");
}
