#include "ke/detail/election_state_machine.hpp"
#include <ke/log.hpp>

#include <iostream>

namespace ke {
namespace detail {

std::ostream& operator<<(std::ostream& os, election_state x) {
  char const* values[] = {
      "init", "checking_existing", "already_leader", "acquiring", "leader", "waiting", "cancelled", "failed",
  };
  return os << values[int(x)];
}

bool is_terminal(election_state s) {
  using st = election_state;
  return s == st::already_leader or s == st::leader or s == st::cancelled or s == st::failed;
}

election_state_machine::election_state_machine()
    : mu_()
    , state_(election_state::init) {
}

election_state election_state_machine::current() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

bool election_state_machine::change_state(char const* where, election_state nstate) {
  std::lock_guard<std::mutex> lock(mu_);
  if (not check_change_state(nstate)) {
    KE_LOG(debug) << where << " rejected state transition " << state_ << " -> " << nstate;
    return false;
  }
  KE_LOG(trace) << where << " " << state_ << " -> " << nstate;
  state_ = nstate;
  return true;
}

bool election_state_machine::check_change_state(election_state nstate) const {
  using s = election_state;
  if (is_terminal(state_)) {
    return false;
  }
  if (nstate == s::cancelled or nstate == s::failed) {
    return true;
  }
  switch (state_) {
  case s::init:
    return nstate == s::checking_existing;
  case s::checking_existing:
    return nstate == s::already_leader or nstate == s::acquiring;
  case s::acquiring:
    return nstate == s::leader or nstate == s::waiting;
  case s::waiting:
    return nstate == s::acquiring;
  default:
    break;
  }
  return false;
}

} // namespace detail
} // namespace ke
