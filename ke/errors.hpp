#ifndef ke_errors_hpp
#define ke_errors_hpp

/**
 * @file
 *
 * Define the exceptions raised when an election cannot continue.
 *
 * Losing the election is not an error, the protocol keeps waiting.  These exceptions represent conditions the
 * process cannot recover from, the typical reaction is to terminate and let the orchestrator restart the pod.
 */

#include <grpc++/grpc++.h>

#include <stdexcept>
#include <string>

namespace ke {

/**
 * The deployment is misconfigured.
 *
 * Raised when the namespace file is missing, the POD_NAME variable is not set (the downward API is not configured),
 * the pod cannot find itself, or the in-cluster API configuration is incomplete.  Never retried.
 */
class configuration_error : public std::runtime_error {
public:
  explicit configuration_error(std::string const& what)
      : std::runtime_error(what) {
  }
};

/**
 * An unexpected failure reported by the orchestrator API.
 *
 * Anything other than the expected "not found" and "already exists" results, including authorization and transport
 * errors.  The original status is preserved for callers that want to distinguish them.
 */
class api_error : public std::runtime_error {
public:
  api_error(std::string const& what, grpc::Status status)
      : std::runtime_error(what)
      , status_(std::move(status)) {
  }

  grpc::Status const& status() const {
    return status_;
  }

private:
  grpc::Status status_;
};

} // namespace ke

#endif // ke_errors_hpp
