#include "ke/log.hpp"

#include <iostream>

namespace {
std::once_flag log_initialized;

/// Write each message to an ostream, used for the common "log to stderr" configuration.
class ostream_log_sink : public ke::log_sink {
public:
  explicit ostream_log_sink(std::ostream& os)
      : mu_()
      , os_(os) {
  }

  void log(ke::severity sev, std::string&& message) override {
    std::lock_guard<std::mutex> guard(mu_);
    os_ << message << std::endl;
  }

private:
  std::mutex mu_;
  std::ostream& os_;
};
} // anonymous namespace

namespace ke {

std::unique_ptr<log> log::singleton_;

log& log::instance() {
  std::call_once(log_initialized, []() { singleton_.reset(new log); });
  return *singleton_;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sinks_.empty() or sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // Special case, very common and avoid copying the message ...
  if (sinks.size() == 1) {
    sinks[0]->log(sev, std::move(msg));
    return;
  }
  for (auto s : sinks) {
    std::string copy(msg);
    s->log(sev, std::move(copy));
  }
}

std::shared_ptr<log_sink> make_ostream_log_sink(std::ostream& os) {
  return std::make_shared<ostream_log_sink>(os);
}

logger<false>::logger(severity s, char const* func, char const* file, int l, log& sink)
    : os()
    , sev(s)
    , closed(sev < sink.min_severity()) {
  if (closed) {
    return;
  }
  function = func;
  filename = file;
  lineno = l;
  os << "[" << sev << "] ";
}

void logger<false>::write_to(log& sink) {
  closed = true;
  os << " in " << function << "(" << filename << ":" << lineno << ")";
  sink.write(sev, os.str());
}

} // namespace ke
