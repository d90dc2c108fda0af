#include "ke/detail/status_errors.hpp"

#include <google/protobuf/text_format.h>
#include <string>

namespace ke {
namespace detail {

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  // Print and ignore errors, on failure we just get an empty string ...
  std::string formatted;
  google::protobuf::TextFormat::Printer printer;
  printer.SetSingleLineMode(true);
  (void)printer.PrintToString(x.msg, &formatted);
  return os << "{" << formatted << "}";
}

std::ostream& operator<<(std::ostream& os, grpc::StatusCode code) {
  switch (code) {
  case grpc::StatusCode::OK:
    return os << "OK";
  case grpc::StatusCode::NOT_FOUND:
    return os << "NOT_FOUND";
  case grpc::StatusCode::ALREADY_EXISTS:
    return os << "ALREADY_EXISTS";
  case grpc::StatusCode::UNKNOWN:
    return os << "UNKNOWN";
  default:
    break;
  }
  return os << "StatusCode(" << static_cast<int>(code) << ")";
}

} // namespace detail
} // namespace ke
