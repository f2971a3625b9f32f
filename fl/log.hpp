#ifndef fl_log_hpp
#define fl_log_hpp
/**
 * @file
 *
 * Define macros, types, and functions for logging in fluxlock.
 */
#include <fl/log_severity.hpp>
#include <fl/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define FL_PP_CAT_I(a, b) a##b
#define FL_PP_CAT(a, b) FL_PP_CAT_I(a, b)

/// The name of the log line object, FL_LOG() may be used in an expression that mentions a local with any other name.
#define FL_LOG_LINE FL_PP_CAT(fl_log_line_, __LINE__)

/**
 * Log to a specific fl::log object, FL_LOG() is the common case.
 *
 * The streaming expression after the macro is only evaluated if the message is enabled, both at compile-time and at
 * run-time.
 */
#define FL_LOG_I(level, core)                                                                                          \
  for (fl::detail::log_line<fl::detail::compile_time_disabled(fl::severity::level)> FL_LOG_LINE(                       \
           fl::severity::level, __FILE__, __LINE__, core);                                                             \
       FL_LOG_LINE.open(); FL_LOG_LINE.flush())                                                                        \
  FL_LOG_LINE

#ifndef FL_LOG
/// Log a message at @a level, as in: FL_LOG(info) << "acquired " << lock;
#define FL_LOG(level) FL_LOG_I(level, fl::log::instance())
#endif // FL_LOG

/**
 * The main namespace for the fluxlock library.
 */
namespace fl {
/**
 * The logging core: a run-time minimum severity and a list of sinks.
 *
 * The elector logs from its background loop, from the shutdown path, and from the store helpers, all through the
 * process-wide instance().  Tests create their own objects and log through FL_LOG_I().  Without sinks nothing is
 * formatted.
 */
class log {
public:
  log()
      : mu_()
      , min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// The process-wide core used by FL_LOG().
  static log& instance();

  void add_sink(std::shared_ptr<log_sink> sink);
  void clear_sinks();

  /// True if a message at @a sev would reach at least one sink.
  bool enabled(severity sev) const;

  /// Send a formatted message to all the sinks.
  void write(severity sev, std::string&& msg);

  /// Set the run-time minimum severity, each sink can still do its own filtering.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  mutable std::mutex mu_;
  severity min_severity_;
  std::vector<std::shared_ptr<log_sink>> sinks_;
};

namespace detail {
/// True if @a sev is below FL_MIN_SEVERITY.
constexpr bool compile_time_disabled(severity sev) {
  return sev < severity::LOWEST_ENABLED;
}

/**
 * One log message being formatted.
 *
 * This is the version for levels disabled at compile-time: open() is always false, so the loop in FL_LOG_I() never
 * runs, but the streaming expression must still compile.
 */
template <bool disabled>
class log_line {
public:
  log_line(severity, char const*, int, log&) {
  }

  bool open() const {
    return false;
  }
  void flush() {
  }

  template <typename T>
  log_line& operator<<(T const&) {
    return *this;
  }
};

/// A log line for a level enabled at compile-time.
template <>
class log_line<false> {
public:
  log_line(severity sev, char const* file, int lineno, log& core);

  /// True until the message is flushed, false from the start if the core filters @c sev out.
  bool open() const {
    return open_;
  }

  /// Append the location and send the message to the core.
  void flush();

  template <typename T>
  std::ostream& operator<<(T const& x) {
    return os_ << x;
  }

private:
  log& core_;
  severity sev_;
  char const* file_;
  int lineno_;
  bool open_;
  std::ostringstream os_;
};
} // namespace detail
} // namespace fl

#endif // fl_log_hpp
