#include "ke/cancellation.hpp"

namespace ke {

void cancellation::cancel() {
  std::unique_lock<std::mutex> lock(mu_);
  cancelled_ = true;
  lock.unlock();
  cv_.notify_all();
}

} // namespace ke
