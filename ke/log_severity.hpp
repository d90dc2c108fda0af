#ifndef ke_log_severity_hpp
#define ke_log_severity_hpp

/**
 * @file
 *
 * Define the log severity values and some macros associated with them.
 */

#include <iosfwd>
#include <string>

#ifndef KE_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * Election progress is reported at the info level, the detailed state transitions at the debug and trace levels.
 * Those are compiled out unless the application (or a test) defines a lower floor before including the logging
 * headers.
 */
#define KE_MIN_SEVERITY info
#endif // KE_MIN_SEVERITY

namespace ke {
/**
 * Define the severity levels for Kubelect logging.
 *
 * These are modelled after the severity level in syslog(1) and many derived tools.
 */
enum class severity {
  /// Use this level for messages that indicate the code is entering and leaving functions.
  trace,
  /// Use this level for debug messages that should not be present in production.
  debug,
  /// Informational messages, such as normal progress.
  info,
  /// Informational messages, such as unusual, but expected conditions.
  notice,
  /// An indication of problems, users may need to take action.
  warning,
  /// An error has been detected.  Do not use for expected conditions, such as losing an election.
  error,
  /// The system is in a critical state, such as running out of local resources.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(KE_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert a severity name, as produced by the streaming operator, into a severity value.
 *
 * The comparison ignores case, so "WARNING" and "warning" are equivalent.  This is used to configure the run-time
 * log level from an environment variable or a command-line flag.
 *
 * @throws std::invalid_argument if @a name is not a known severity.
 */
severity parse_severity(std::string const& name);

} // namespace ke

#endif // ke_log_severity_hpp
