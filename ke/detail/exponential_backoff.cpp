#include <ke/detail/exponential_backoff.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace ke {
namespace detail {
std::chrono::milliseconds exponential_backoff::record_failure() {
  if (current_delay_ < max_delay_) {
    current_delay_ = 2 * current_delay_;
  }
  if (current_delay_ > max_delay_) {
    current_delay_ = max_delay_;
  }
  return current_delay_;
}

std::chrono::milliseconds exponential_backoff::current_delay() const {
  return current_delay_;
}

std::chrono::milliseconds exponential_backoff::jittered_delay() {
  std::uniform_real_distribution<double> factor(1.0 - jitter_, 1.0 + jitter_);
  auto count = static_cast<double>(current_delay_.count()) * factor(generator_);
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(count)));
}

void exponential_backoff::validate_arguments() {
  if (min_delay_.count() <= 0) {
    std::ostringstream os;
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) should be > 0";
    throw std::invalid_argument(os.str());
  }
  if (min_delay_ > max_delay_) {
    std::ostringstream os;
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) should be <= max_delay ("
       << max_delay_.count() << "ms)";
    throw std::invalid_argument(os.str());
  }
  if (jitter_ < 0.0 or jitter_ >= 1.0) {
    std::ostringstream os;
    os << "exponential_backoff() - jitter (" << jitter_ << ") should be in the [0, 1) range";
    throw std::invalid_argument(os.str());
  }
}

} // namespace detail
} // namespace ke
