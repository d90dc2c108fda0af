#include "ke/detail/eviction_reclaimer.hpp"
#include <ke/detail/status_errors.hpp>
#include <ke/log.hpp>

namespace ke {
namespace detail {

bool is_evicted(k8s::Pod const& pod) {
  return pod.status().phase() == "Failed" and pod.status().reason() == "Evicted";
}

void reclaim(token_store& store, k8s::ConfigMap const& token) {
  auto const& owners = token.metadata().owner_references();
  if (owners.size() != 1) {
    KE_LOG(warning) << "leader lock must have exactly one owner reference, lock=" << print_to_stream(token);
    return;
  }
  auto const& owner = owners.Get(0);
  if (owner.kind() != "Pod") {
    KE_LOG(warning) << "leader lock owner reference must be a pod, owner=" << print_to_stream(owner);
    return;
  }

  k8s::Pod leader;
  auto status = store.get_peer(owner.name(), leader);
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    KE_LOG(info) << "leader pod " << owner.name() << " has been deleted, waiting for garbage collection to remove "
                 << token.metadata().name();
    return;
  }
  check_status(status, "reclaim()", " leader=", owner.name(), " lock=", token.metadata().name());

  if (is_evicted(leader) and leader.metadata().deletion_timestamp().empty()) {
    KE_LOG(notice) << "pod with leader lock has been evicted, leader=" << owner.name();
    KE_LOG(notice) << "deleting evicted leader " << owner.name();
    auto deleted = store.delete_peer(owner.name());
    if (not deleted.ok()) {
      KE_LOG(error) << "leader pod " << owner.name() << " could not be deleted: " << deleted.error_message() << " ["
                    << deleted.error_code() << "]";
    }
    return;
  }
  KE_LOG(info) << "not the leader, " << owner.name() << " holds " << token.metadata().name() << ". waiting.";
}

} // namespace detail
} // namespace ke
