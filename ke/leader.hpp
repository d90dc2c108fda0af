#ifndef ke_leader_hpp
#define ke_leader_hpp

/**
 * @file
 *
 * The entry point to become the leader among the pods of a deployment.
 */

#include <ke/cancellation.hpp>
#include <ke/detail/backoff_strategy.hpp>
#include <ke/detail/election_engine.hpp>
#include <ke/election_result.hpp>
#include <ke/identity.hpp>
#include <ke/token_store.hpp>

#include <functional>
#include <memory>
#include <string>

namespace ke {

/**
 * Block until this pod is the leader among all the pods using @a lock_name in its namespace.
 *
 * The pod tries to create a ConfigMap named @a lock_name, owned by the pod.  Only one such ConfigMap can exist, the
 * pod that creates it is the leader.  When that pod terminates the garbage collector deletes the ConfigMap, and a
 * different pod becomes the leader.  Leadership is never released while the pod exists, a restarted container
 * recognizes the lock and continues as the leader.
 *
 * The pod must have a service account allowed to get and create ConfigMaps, and to get and delete Pods, in its
 * namespace.  The POD_NAME environment variable must contain the name of the pod (use the downward API).
 *
 * @return election_result::elected or election_result::already_leader.
 * @throws ke::configuration_error if the pod environment is not configured as described above.
 * @throws ke::api_error if the API server reports an unexpected error.
 */
election_result become_leader(std::string const& lock_name);

/**
 * Like become_leader(std::string const&), but can be cancelled from another thread.
 *
 * @return election_result::cancelled if @a cancel was signaled before this pod became the leader.
 */
election_result become_leader(std::string const& lock_name, cancellation& cancel);

namespace detail {
/// Create a token store for the namespace @a ns.
using token_store_factory = std::function<std::unique_ptr<token_store>(std::string const& ns)>;

/**
 * Implement become_leader() with all the dependencies injected.
 *
 * The identity is resolved before any token store is created, a pod without POD_NAME fails without contacting the
 * API server.  An election already cancelled when the configuration is read returns election_result::cancelled
 * without creating the token store.
 */
election_result become_leader(
    std::string const& lock_name, identity_config const& config, token_store_factory const& make_store,
    backoff_strategy& backoff, election_engine::sleep_function sleep,
    election_engine::cancelled_function cancelled = election_engine::cancelled_function());
} // namespace detail

} // namespace ke

#endif // ke_leader_hpp
