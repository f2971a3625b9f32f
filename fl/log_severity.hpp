#ifndef fl_log_severity_hpp
#define fl_log_severity_hpp
/**
 * @file
 *
 * Define the log severity values and the compile-time floor.
 */

#include <iosfwd>
#include <string>

#ifndef FL_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * The poll loop logs every attempt at trace level, production builds should not pay for those messages.  The
 * compile-time disabled levels reduce to no-op's that the optimizer eliminates.
 */
#define FL_MIN_SEVERITY info
#endif // FL_MIN_SEVERITY

namespace fl {
/**
 * The severity of a log message, ordered from least to most severe.
 *
 * The names follow syslog(3).
 */
enum class severity {
  /// Queue, timer and RPC plumbing.
  trace,
  debug,
  /// Leadership transitions, sessions opened and revoked.
  info,
  notice,
  /// Transient problems, the elector will try again.
  warning,
  /// A lock could not be released, or a session revoked, during shutdown.
  error,
  critical,
  alert,
  fatal,
  HIGHEST = int(fatal),
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(FL_MIN_SEVERITY),
};

/// Streaming operator, writes the lowercase name.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert a severity name, as printed by operator<<, back to a severity.
 *
 * Used to read the run-time minimum severity from flags and environment variables.
 *
 * @throws std::invalid_argument if @a name is not a severity name.
 */
severity parse_severity(std::string const& name);

} // namespace fl

#endif // fl_log_severity_hpp
