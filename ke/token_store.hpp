#ifndef ke_token_store_hpp
#define ke_token_store_hpp

#include <ke/k8s.pb.h>

#include <grpc++/grpc++.h>
#include <string>

namespace ke {
/**
 * Define the interface to the orchestrator resources used by the election.
 *
 * The election uses two kinds of resources in the pod's namespace: the lock (a ConfigMap) and the pods that
 * participate in the election.  Each member function is a single round trip to the API server, implementations do
 * not cache nor retry, the election engine decides what to do with each failure.
 *
 * Failures are reported using exactly three status codes:
 * - grpc::StatusCode::NOT_FOUND: the resource does not exist.
 * - grpc::StatusCode::ALREADY_EXISTS: create_token() lost the race, another candidate holds the lock.
 * - grpc::StatusCode::UNKNOWN: anything else, such as authorization or transport errors.
 */
class token_store {
public:
  virtual ~token_store();

  /// Fetch the lock named @a name into @a token.
  virtual grpc::Status get_token(std::string const& name, k8s::ConfigMap& token) = 0;

  /**
   * Atomically create the lock named @a name, with @a owner as its only owner reference.
   *
   * Fails with ALREADY_EXISTS if the lock exists, regardless of its contents.
   */
  virtual grpc::Status create_token(std::string const& name, k8s::OwnerReference const& owner) = 0;

  /// Fetch the pod named @a name into @a pod.
  virtual grpc::Status get_peer(std::string const& name, k8s::Pod& pod) = 0;

  /// Delete the pod named @a name.
  virtual grpc::Status delete_peer(std::string const& name) = 0;
};

} // namespace ke

#endif // ke_token_store_hpp
