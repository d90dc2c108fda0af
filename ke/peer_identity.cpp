#include "ke/peer_identity.hpp"

#include <iostream>

namespace ke {

k8s::OwnerReference make_owner_reference(peer_identity const& self) {
  k8s::OwnerReference owner;
  owner.set_api_version("v1");
  owner.set_kind("Pod");
  owner.set_name(self.name);
  owner.set_uid(self.uid);
  return owner;
}

std::ostream& operator<<(std::ostream& os, peer_identity const& x) {
  return os << x.ns << "/" << x.name << " (uid=" << x.uid << ")";
}

} // namespace ke
