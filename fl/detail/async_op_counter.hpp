#ifndef fl_detail_async_op_counter_hpp
#define fl_detail_async_op_counter_hpp

#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

namespace fl {
namespace detail {

/**
 * Track the asynchronous operations an object has in flight, by name.
 *
 * The elector keeps its poll timer counted here, a session its keep alive timer, write and read.  Before either
 * object releases its resources it calls shutdown(), cancels what it can, and blocks until the callbacks of the rest
 * have run, otherwise they could run against a half-destroyed object.
 */
class async_op_counter {
public:
  async_op_counter()
      : mu_()
      , cv_()
      , pending_()
      , shutdown_(false) {
  }

  /**
   * Record that the operation @a name is about to start.
   *
   * Call it before posting the operation, the completion may be delivered before the post returns.
   *
   * @return false if shutdown() was called, in that case the operation must not be started.
   */
  bool async_op_start(char const* name);

  /**
   * Record that the operation @a name completed, successfully or not.
   *
   * Call it as the last statement of the completion callback.
   */
  void async_op_done(char const* name);

  /// Reject all future operations, async_op_start() returns false afterwards.
  void shutdown();

  bool in_shutdown() const {
    std::lock_guard<std::mutex> lock(mu_);
    return shutdown_;
  }

  /// The number of operations started and not done.
  int pending() const;

  /**
   * Reject all future operations and block until the pending ones are done.
   *
   * Must not be called from the thread that delivers the completions.
   */
  void block_until_all_done();

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<std::string, int> pending_;
  bool shutdown_;
};

} // namespace detail
} // namespace fl

#endif // fl_detail_async_op_counter_hpp
