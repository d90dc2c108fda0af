#ifndef ke_detail_exponential_backoff_hpp
#define ke_detail_exponential_backoff_hpp

#include <ke/detail/backoff_strategy.hpp>

#include <cstdint>
#include <random>

namespace ke {
namespace detail {
/**
 * Exponential backoff with a ceiling and uniform jitter.
 *
 * The nominal delay starts at @a min_delay and doubles on each failure until it reaches @a max_delay, where it stays.
 * The jittered delay is uniformly distributed in [(1 - jitter) * nominal, (1 + jitter) * nominal].  There is no
 * limit on the number of attempts, a candidate waits for as long as somebody else is the leader.
 */
class exponential_backoff : public backoff_strategy {
public:
  template <typename min_duration_type, typename max_duration_type>
  exponential_backoff(min_duration_type min_delay, max_duration_type max_delay, double jitter)
      : exponential_backoff(min_delay, max_delay, jitter, std::random_device()()) {
  }

  /// Constructor with an explicit seed, used in tests to get repeatable sequences.
  template <typename min_duration_type, typename max_duration_type>
  exponential_backoff(min_duration_type min_delay, max_duration_type max_delay, double jitter, std::uint64_t seed)
      : min_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(min_delay))
      , max_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(max_delay))
      , jitter_(jitter)
      , current_delay_(min_delay_)
      , generator_(seed) {
    validate_arguments();
  }

  std::chrono::milliseconds record_failure() override;
  std::chrono::milliseconds current_delay() const override;
  std::chrono::milliseconds jittered_delay() override;

private:
  void validate_arguments();

private:
  std::chrono::milliseconds min_delay_;
  std::chrono::milliseconds max_delay_;
  double jitter_;
  std::chrono::milliseconds current_delay_;
  std::mt19937_64 generator_;
};
} // namespace detail
} // namespace ke

#endif // ke_detail_exponential_backoff_hpp
