#ifndef fl_active_completion_queue_hpp
#define fl_active_completion_queue_hpp

#include <fl/completion_queue.hpp>

#include <memory>
#include <string>
#include <thread>

namespace fl {

/**
 * A completion_queue<> and the thread running its event loop.
 *
 * The store queue is shared by all the electors of a process, each elector also owns one of these to run its polls.
 * The destructor shuts down the queue, drains it, and joins the thread.  Any object with operations pending in the
 * queue must be destroyed first.
 */
class active_completion_queue {
public:
  /// Create the queue and start its thread, @a name only appears in the logs.
  explicit active_completion_queue(std::string name = "fluxlock");

  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  ~active_completion_queue();

  completion_queue<>& cq() {
    return *queue_;
  }

  std::string const& name() const {
    return name_;
  }

  /// True if called from the thread running the event loop.
  bool in_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
  }

private:
  std::string name_;
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace fl

#endif // fl_active_completion_queue_hpp
