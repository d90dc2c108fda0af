#ifndef ke_election_result_hpp
#define ke_election_result_hpp

#include <iosfwd>

namespace ke {
/**
 * How an election ended, fatal errors are reported as exceptions.
 */
enum class election_result {
  /// This process created the lock and is now the leader.
  elected,
  /// The lock already named this process as owner, the process was restarted while being the leader.
  already_leader,
  /// The application cancelled the election before this process became the leader.
  cancelled,
};

std::ostream& operator<<(std::ostream& os, election_result x);

/// Return true if @a x means this process is the leader.
inline bool is_leader(election_result x) {
  return x == election_result::elected or x == election_result::already_leader;
}

} // namespace ke

#endif // ke_election_result_hpp
