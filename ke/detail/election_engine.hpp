#ifndef ke_detail_election_engine_hpp
#define ke_detail_election_engine_hpp

#include <ke/detail/backoff_strategy.hpp>
#include <ke/detail/election_state_machine.hpp>
#include <ke/election_result.hpp>
#include <ke/peer_identity.hpp>
#include <ke/token_store.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace ke {
namespace detail {

/**
 * Run the leader election protocol for a single process.
 *
 * The lock is a ConfigMap whose only owner reference is the leader pod.  Creating the ConfigMap is atomic, exactly
 * one candidate succeeds.  The losers wait (with backoff and jitter) and try again.  When the leader pod is deleted the
 * garbage collector deletes the lock, and one of the waiting candidates will succeed.  There is no heartbeat, the
 * owner reference is the only failure detector.
 *
 * Transient API errors are not retried, they abort the election and the caller is expected to terminate the process.
 */
class election_engine {
public:
  /**
   * Wait for @a delay, return true if the wait was cancelled.
   *
   * Production code uses ke::cancellation::wait_for(), tests record the delays without sleeping.
   */
  using sleep_function = std::function<bool(std::chrono::milliseconds)>;

  /// Return true if the election was cancelled, an empty function means it is never cancelled.
  using cancelled_function = std::function<bool()>;

  election_engine(
      token_store& store, peer_identity self, std::string lock_name, backoff_strategy& backoff, sleep_function sleep,
      cancelled_function cancelled = cancelled_function());

  /**
   * Block until this process is the leader, or the election is cancelled.
   *
   * @throws ke::api_error if the token store reports an unexpected failure.
   */
  election_result run();

  /// The current state, mostly for debugging and testing.
  election_state state() const {
    return machine_.current();
  }

private:
  /// Move to the cancelled state and return true if the election was cancelled.
  bool check_cancelled();

  /// Return true if any owner reference of @a token names this process.
  bool owned_by_self(k8s::ConfigMap const& token) const;

  /// Fetch the lock after losing a race, returns false if it disappeared in the meantime.
  bool refresh_conflicting_token(k8s::ConfigMap& token);

  /// Transition to @a nstate, the transitions made by the engine are always valid.
  void change_state(char const* where, election_state nstate);

  /// Raise ke::api_error if @a status is not OK, moving to the failed state first.
  void check(grpc::Status const& status, char const* where);

private:
  token_store& store_;
  peer_identity self_;
  std::string lock_name_;
  backoff_strategy& backoff_;
  sleep_function sleep_;
  cancelled_function cancelled_;
  election_state_machine machine_;
};

} // namespace detail
} // namespace ke

#endif // ke_detail_election_engine_hpp
