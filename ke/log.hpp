#ifndef ke_log_hpp
#define ke_log_hpp

/**
 * @file
 *
 * Define macros, types, and functions for logging in Kubelect.
 */
#include <ke/detail/null_stream.hpp>
#include <ke/log_severity.hpp>
#include <ke/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define KE_PP_CAT(a, b) a##b

/**
 * Create a unique, or mostly-likely unique identifier.
 *
 * KE_LOG() declares a logger inside a for-loop scope, the name depends on the line number so it does not shadow any
 * variable the caller streams into the message.
 */
#define KE_LOGGER_IDENTIFIER KE_PP_CAT(ke_log_, __LINE__)

/**
 * The main entry point for Kubelect logging facilities.
 *
 * Typically this used only in tests, applications should use KE_LOG().
 */
#define KE_LOG_I(level, sink)                                                                                          \
  for (auto KE_LOGGER_IDENTIFIER = ke::logger<level_compile_time_disabled(ke::severity::level)>(                       \
           ke::severity::level, __func__, __FILE__, __LINE__, sink);                                                   \
       (bool)KE_LOGGER_IDENTIFIER; KE_LOGGER_IDENTIFIER.write_to(sink))                                                \
  KE_LOGGER_IDENTIFIER.get()

#ifndef KE_LOG
#define KE_LOG(level) KE_LOG_I(level, ke::log::instance())
#endif // KE_LOG

/**
 * The main namespace for the Kubelect library.
 */
namespace ke {
/**
 * The logging framework core.
 *
 * The election runs deep inside an application's start up sequence, the application decides where (and if) the
 * progress messages go.  The log is a singleton so the election code does not need a logger parameter on every
 * function, tests create their own instances and use KE_LOG_I() to capture the messages.
 */
class log {
public:
  /// Normally use @c ke::log::instance(), this is useful in testing.
  log()
      : min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// Return the singleton instance
  static log& instance();

  /// Add a new sink to the core.
  void add_sink(std::shared_ptr<log_sink> sink);

  /// Remove all the current log sinks from the core.
  void clear_sinks();

  /// Write a new log message
  void write(severity sev, std::string&& msg);

  /// Set the minimum severity for the following messages, notice that each sink can implement its own filtering.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  /// Return the minimum run-time severity.
  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  mutable std::mutex mu_;
  severity min_severity_;
  std::vector<std::shared_ptr<log_sink>> sinks_;

  static std::unique_ptr<log> singleton_;
};

/**
 * A compile-time disabled log message container.
 *
 * All streaming operations are no-op's, see @c detail::null_stream.
 *
 * @tparam disabled if true, use a compile-time-disabled logger, which does not log anything.
 */
template <bool disabled>
class logger {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink) {
  }

  explicit operator bool() const {
    return false;
  }

  detail::null_stream& get() {
    return os;
  }

  void write_to(log& sink) {
  }

private:
  detail::null_stream os;
};

/**
 * A simple log message container.
 *
 * This specialization formats the message into a std::ostringstream and then sends the result to the configured
 * sinks, if any.
 */
template <>
class logger<false> {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink);

  explicit operator bool() const {
    return not closed;
  }

  /// Get the std::ostream where the message will be formatted.
  std::ostream& get() {
    return os;
  }

  /// Save the message to the log sink
  void write_to(ke::log& sink);

private:
  std::ostringstream os;
  severity sev;
  std::string function;
  std::string filename;
  int lineno;
  bool closed;
};

/**
 * Determine if a given severity level is disabled at compile-time.
 *
 * @param lvl the severity level to check.
 * @returns true if @a lvl is disabled at compile-time.
 */
bool constexpr level_compile_time_disabled(severity lvl) {
  return lvl < ke::severity::KE_MIN_SEVERITY;
}
} // namespace ke

#endif // ke_log_hpp
