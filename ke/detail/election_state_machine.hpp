#ifndef ke_detail_election_state_machine_hpp
#define ke_detail_election_state_machine_hpp

#include <iosfwd>
#include <mutex>

namespace ke {
namespace detail {
/**
 * The states of a single attempt to become the leader.
 *
 * @code
 * init -> checking_existing -> already_leader
 *                           -> acquiring -> leader
 *                                        -> waiting -> acquiring
 * @endcode
 *
 * Any non-terminal state can also move to @c cancelled or @c failed.
 */
enum class election_state {
  /// Initial state, identity resolved.
  init,
  /// Fetching the current lock, if any.
  checking_existing,
  /// Terminal: the lock was already ours, the process was restarted while holding it.
  already_leader,
  /// Trying to create the lock.
  acquiring,
  /// Terminal: the lock was created, this process is the leader.
  leader,
  /// Somebody else holds the lock, backing off before the next attempt.
  waiting,
  /// Terminal: the application cancelled the election.
  cancelled,
  /// Terminal: an unexpected error aborted the election.
  failed,
};

/**
 * The streaming operator for @c election_state.
 *
 * Mostly used for unit testing and debugging / logging messages.
 */
std::ostream& operator<<(std::ostream& os, election_state x);

/// Return true if no transitions are possible from @a s.
bool is_terminal(election_state s);

/**
 * Implement the state machine for an election.
 *
 * Centralizes the valid transitions and the debug logging of each transition.  The election runs in a single
 * thread, but the current state can be queried from any thread, for example by a health check.
 */
class election_state_machine {
public:
  election_state_machine();

  /// Return the current state.
  election_state current() const;

  /// Propose a state change, returns true if accepted.
  bool change_state(char const* where, election_state nstate);

private:
  /// Checks if a state transition is acceptable.
  bool check_change_state(election_state nstate) const;

private:
  mutable std::mutex mu_;
  election_state state_;
};

} // namespace detail
} // namespace ke

#endif // ke_detail_election_state_machine_hpp
