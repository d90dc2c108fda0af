#ifndef ke_peer_identity_hpp
#define ke_peer_identity_hpp

#include <ke/k8s.pb.h>

#include <iosfwd>
#include <string>

namespace ke {

/**
 * The identity of this process in the orchestrator.
 *
 * Resolved once at startup (see ke::resolve_identity()) and passed by value to the election engine.
 */
struct peer_identity {
  std::string ns;
  std::string name;
  std::string uid;
};

/// The owner reference a lock created by @a self carries.
k8s::OwnerReference make_owner_reference(peer_identity const& self);

std::ostream& operator<<(std::ostream& os, peer_identity const& x);

} // namespace ke

#endif // ke_peer_identity_hpp
