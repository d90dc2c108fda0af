#ifndef ke_detail_eviction_reclaimer_hpp
#define ke_detail_eviction_reclaimer_hpp

#include <ke/token_store.hpp>

namespace ke {
namespace detail {

/// Return true if the pod was evicted, a terminal state that the pod never leaves on its own.
bool is_evicted(k8s::Pod const& pod);

/**
 * Inspect the holder of a lock we failed to acquire, and delete it if it was evicted.
 *
 * The lock disappears when the garbage collector notices its owner is gone.  An evicted pod stays around (in the
 * Failed phase) until somebody deletes it, so without intervention the lock would never be released.  This function
 * deletes such pods, all other conditions are logged and left alone.
 *
 * Failures to delete the evicted pod are logged and ignored, the next attempt will try again.
 *
 * @throws ke::api_error if the holder cannot be fetched for reasons other than it being already deleted.
 */
void reclaim(token_store& store, k8s::ConfigMap const& token);

} // namespace detail
} // namespace ke

#endif // ke_detail_eviction_reclaimer_hpp
