#ifndef ke_detail_backoff_strategy_hpp
#define ke_detail_backoff_strategy_hpp

#include <chrono>

namespace ke {
namespace detail {
/**
 * Define the interface for a backoff strategy.
 *
 * Candidates that lose the race to create the lock wait before trying again.  All the candidates in a deployment
 * typically start at the same time, so the strategy should spread the attempts (jitter) and slow them down (backoff)
 * to avoid hammering the API server.
 */
class backoff_strategy {
public:
  virtual ~backoff_strategy() = default;

  /// Report a failed attempt to the backoff strategy, returns the new nominal delay.
  virtual std::chrono::milliseconds record_failure() = 0;
  /// Returns the current nominal delay.
  virtual std::chrono::milliseconds current_delay() const = 0;
  /// Returns the current delay perturbed by the jitter policy, this is how long the caller should actually wait.
  virtual std::chrono::milliseconds jittered_delay() = 0;
};
} // namespace detail
} // namespace ke

#endif // ke_detail_backoff_strategy_hpp
