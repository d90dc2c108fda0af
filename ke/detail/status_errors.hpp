/**
 * @file
 *
 * Helper functions to report errors returned by the token store.
 */
#ifndef ke_detail_status_errors_hpp
#define ke_detail_status_errors_hpp
#include <ke/detail/append_annotations.hpp>
#include <ke/errors.hpp>

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>
#include <sstream>

namespace ke {
namespace detail {

/// Streaming operator for the status codes, prints the symbolic name.
std::ostream& operator<<(std::ostream& os, grpc::StatusCode code);

/**
 * Raise a ke::api_error if @a status is not OK.
 *
 * @param status the status returned by a ke::token_store operation.
 * @param where a string to let the user know where the error took place.
 * @param a a list of additional annotations to append (using operator<<) to the end of the exception what() message.
 * @throws ke::api_error if @a status.ok() is false.
 */
template <typename Location, typename... Annotations>
void check_status(grpc::Status const& status, Location const& where, Annotations&&... a) {
  if (status.ok()) {
    return;
  }
  std::ostringstream os;
  os << where << " api error: " << status.error_message() << " [" << status.error_code() << "]";
  detail::append_annotations(os, std::forward<Annotations>(a)...);
  throw api_error(os.str(), status);
}

/**
 * Print a protobuf on a std::ostream.
 *
 * Uses google::protobuf::TextFormat to print a resource, typically in log messages about malformed locks:
 *
 * @code
 * ke::k8s::ConfigMap const& token = ...;
 * KE_LOG(info) << "malformed lock " << print_to_stream(token);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace ke

#endif // ke_detail_status_errors_hpp
