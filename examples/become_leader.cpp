#include <ke/errors.hpp>
#include <ke/leader.hpp>
#include <ke/log.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> interrupt(false);
extern "C" void signal_handler(int sig) {
  interrupt = true;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <lock-name>" << std::endl;
    return 1;
  }
  std::string lock_name = argv[1];

  ke::log::instance().add_sink(ke::make_ostream_log_sink(std::cerr));
  if (char const* level = std::getenv("KE_LOG_LEVEL")) {
    ke::log::instance().min_severity(ke::parse_severity(level));
  }

  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);

  // ... the election blocks this thread, a second thread turns signals into a cancellation ...
  ke::cancellation cancel;
  std::thread watcher([&cancel]() {
    while (not interrupt and not cancel.cancelled()) {
      std::this_thread::sleep_for(20ms);
    }
    cancel.cancel();
  });

  ke::election_result result;
  try {
    result = ke::become_leader(lock_name, cancel);
  } catch (...) {
    // ... stop the watcher before the exception destroys it ...
    cancel.cancel();
    watcher.join();
    throw;
  }
  if (not ke::is_leader(result)) {
    watcher.join();
    std::cout << "election was cancelled before becoming the leader" << std::endl;
    return 0;
  }
  std::cout << "this pod is the leader (" << result << ")... wait for interrupt" << std::endl;

  // ... there is nothing to resign, the lock is released when the pod is deleted, a real application would do its
  // work here ...
  watcher.join();
  return 0;
} catch (ke::configuration_error const& ex) {
  std::cerr << "configuration error: " << ex.what() << std::endl;
  return 1;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
