#ifndef ke_cancellation_hpp
#define ke_cancellation_hpp

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ke {

/**
 * Allow an application to abandon an election that is waiting for the lock.
 *
 * The election blocks the calling thread while it waits for the current leader to go away, which may take forever.
 * An application that needs to shut down cleanly (for example, on SIGTERM) calls cancel() from another thread, the
 * election wakes up and returns ke::election_result::cancelled.
 *
 * Once cancelled the object stays cancelled.
 */
class cancellation {
public:
  cancellation()
      : mu_()
      , cv_()
      , cancelled_(false) {
  }

  cancellation(cancellation const&) = delete;
  cancellation& operator=(cancellation const&) = delete;

  /// Request cancellation, wakes up any thread blocked in wait_for().
  void cancel();

  /// Return true if cancel() has been called.
  bool cancelled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cancelled_;
  }

  /**
   * Block for (approximately) @a timeout or until cancel() is called.
   *
   * @return true if the object was cancelled, false if the full timeout elapsed.
   */
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> const& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_;
};

} // namespace ke

#endif // ke_cancellation_hpp
