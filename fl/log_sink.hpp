#ifndef fl_log_sink_hpp
#define fl_log_sink_hpp

#include <fl/log_severity.hpp>

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace fl {

/**
 * A destination for log messages.
 *
 * Host applications route the elector's messages to their own logging by adding one or more sinks to fl::log.  Sinks
 * are called from the elector threads, possibly concurrently, each implementation must do its own locking.
 */
class log_sink {
public:
  virtual ~log_sink() {}

  /// Consume one formatted message.
  virtual void log(severity sev, std::string&& message) = 0;
};

/// The signature of the functors accepted by make_log_sink().
using log_function = std::function<void(severity, std::string&&)>;

/// Create a sink that forwards every message to @a f.
std::shared_ptr<log_sink> make_log_sink(log_function f);

/**
 * Create a sink that writes one message per line to @a os, serialized by a mutex.
 *
 * The stream must outlive the sink, typically it is std::clog or std::cerr.
 */
std::shared_ptr<log_sink> make_stream_sink(std::ostream& os);

} // namespace fl

#endif // fl_log_sink_hpp
