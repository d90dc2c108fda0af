#include "ke/detail/election_engine.hpp"
#include <ke/assert_throw.hpp>
#include <ke/detail/eviction_reclaimer.hpp>
#include <ke/detail/status_errors.hpp>
#include <ke/log.hpp>

#include <utility>

namespace ke {
namespace detail {

election_engine::election_engine(
    token_store& store, peer_identity self, std::string lock_name, backoff_strategy& backoff, sleep_function sleep,
    cancelled_function cancelled)
    : store_(store)
    , self_(std::move(self))
    , lock_name_(std::move(lock_name))
    , backoff_(backoff)
    , sleep_(std::move(sleep))
    , cancelled_(std::move(cancelled))
    , machine_() {
}

election_result election_engine::run() {
  if (check_cancelled()) {
    return election_result::cancelled;
  }
  KE_LOG(info) << "trying to become the leader, lock=" << lock_name_ << ", self=" << self_;
  change_state("run()", election_state::checking_existing);

  k8s::ConfigMap existing;
  auto status = store_.get_token(lock_name_, existing);
  if (status.ok()) {
    if (owned_by_self(existing)) {
      KE_LOG(info) << "found existing lock with my name, I was likely restarted. continuing as the leader.";
      change_state("run()", election_state::already_leader);
      return election_result::already_leader;
    }
    for (auto const& owner : existing.metadata().owner_references()) {
      KE_LOG(info) << "found existing lock " << lock_name_ << ", owner=" << owner.name();
    }
  } else if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    KE_LOG(info) << "no pre-existing lock was found";
  } else {
    check(status, "get_token()");
  }

  auto const owner = make_owner_reference(self_);
  for (;;) {
    if (check_cancelled()) {
      return election_result::cancelled;
    }
    change_state("run()", election_state::acquiring);
    auto created = store_.create_token(lock_name_, owner);
    if (created.ok()) {
      change_state("run()", election_state::leader);
      KE_LOG(info) << "became the leader, lock=" << lock_name_;
      return election_result::elected;
    }
    if (created.error_code() != grpc::StatusCode::ALREADY_EXISTS) {
      check(created, "create_token()");
    }

    change_state("run()", election_state::waiting);
    if (refresh_conflicting_token(existing)) {
      try {
        reclaim(store_, existing);
      } catch (api_error const&) {
        change_state("reclaim()", election_state::failed);
        throw;
      }
    }

    auto delay = backoff_.jittered_delay();
    KE_LOG(debug) << "waiting " << delay.count() << "ms before the next attempt, nominal backoff="
                  << backoff_.current_delay().count() << "ms";
    if (sleep_(delay)) {
      change_state("run()", election_state::cancelled);
      KE_LOG(info) << "election cancelled while waiting for lock " << lock_name_;
      return election_result::cancelled;
    }
    backoff_.record_failure();
  }
}

bool election_engine::check_cancelled() {
  if (not cancelled_ or not cancelled_()) {
    return false;
  }
  change_state("run()", election_state::cancelled);
  KE_LOG(info) << "election cancelled before acquiring lock " << lock_name_;
  return true;
}

bool election_engine::owned_by_self(k8s::ConfigMap const& token) const {
  for (auto const& owner : token.metadata().owner_references()) {
    if (owner.name() == self_.name) {
      return true;
    }
  }
  return false;
}

bool election_engine::refresh_conflicting_token(k8s::ConfigMap& token) {
  k8s::ConfigMap current;
  auto status = store_.get_token(lock_name_, current);
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    KE_LOG(info) << "lock " << lock_name_ << " was released after the last attempt, trying again";
    return false;
  }
  check(status, "get_token()");
  token.Swap(&current);
  return true;
}

void election_engine::change_state(char const* where, election_state nstate) {
  KE_ASSERT_THROW(machine_.change_state(where, nstate));
}

void election_engine::check(grpc::Status const& status, char const* where) {
  if (status.ok()) {
    return;
  }
  KE_LOG(error) << "unexpected error in " << where << " for lock " << lock_name_ << ": " << status.error_message();
  change_state(where, election_state::failed);
  check_status(status, where, " lock=", lock_name_, " namespace=", self_.ns);
}

} // namespace detail
} // namespace ke
