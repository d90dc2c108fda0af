#ifndef ke_identity_hpp
#define ke_identity_hpp

/**
 * @file
 *
 * Discover the identity of this process from its environment.
 */

#include <ke/peer_identity.hpp>
#include <ke/token_store.hpp>

#include <string>

namespace ke {

/**
 * Where to find the identity of this process.
 *
 * The defaults match a pod with a service account and the downward API configured as:
 *
 * @code
 * env:
 *   - name: POD_NAME
 *     valueFrom:
 *       fieldRef:
 *         fieldPath: metadata.name
 * @endcode
 */
struct identity_config {
  identity_config()
      : namespace_file("/var/run/secrets/kubernetes.io/serviceaccount/namespace")
      , pod_name_variable("POD_NAME") {
  }

  /// The file containing the namespace of the pod.
  std::string namespace_file;
  /// The environment variable containing the name of the pod.
  std::string pod_name_variable;
};

/**
 * Read the namespace from @a path, trimming any surrounding whitespace.
 *
 * @throws ke::configuration_error if the file does not exist, cannot be read, or is empty.
 */
std::string read_namespace(std::string const& path);

/**
 * Read the pod name from the environment variable @a variable.
 *
 * @throws ke::configuration_error if the variable is not set or is empty.
 */
std::string pod_name_from_environment(std::string const& variable);

/**
 * Resolve the full identity of the pod @a pod_name in the namespace served by @a store.
 *
 * @throws ke::configuration_error if the pod does not exist.
 * @throws ke::api_error if the lookup fails for any other reason.
 */
peer_identity resolve_identity(token_store& store, std::string const& ns, std::string const& pod_name);

} // namespace ke

#endif // ke_identity_hpp
