#ifndef fl_elector_hpp
#define fl_elector_hpp

#include <fl/lock_identifier.hpp>

#include <functional>

namespace fl {
/**
 * Define the interface to campaign for an advisory lock and run a singleton duty while holding it.
 *
 * Many identical instances of a service each create an elector for the same lock_identifier.  Each elector polls the
 * shared store, at most one of them holds the lock at a time.
 */
class elector {
public:
  /// The type of the transition callbacks.
  using callback_type = std::function<void()>;

  virtual ~elector() noexcept(false);

  /**
   * Start the poll loop.
   *
   * The first poll happens immediately, then one per poll interval.  @a on_become_leader is called on each
   * not leader -> leader transition, @a on_lose_leadership on each leader -> not leader transition.  Both are called
   * from the poll loop thread, never concurrently, and they must return quickly: a slow callback delays the next poll.
   *
   * @throws std::runtime_error if the elector was already started or stopped.
   */
  virtual void start(callback_type on_become_leader, callback_type on_lose_leadership) = 0;

  /**
   * Stop the poll loop, release the lock if held, and close the session.
   *
   * Errors releasing the lock are logged, not reported.  Afterwards is_leader() is false.  Calling stop() more than
   * once is a no-op, calling it from a transition callback is not supported.
   */
  virtual void stop() = 0;

  /// The leadership observed by the last poll, false before the first poll and after stop().
  virtual bool is_leader() const = 0;

  /**
   * Make a single acquire attempt, without the poll loop.
   *
   * Updates the same leadership flag as the poll loop.
   *
   * @return true if the lock is held after the attempt.
   * @throws std::runtime_error if the store fails, the flag is not changed, or if called after stop().
   */
  virtual bool try_acquire_once() = 0;

  /// The lock this elector campaigns for.
  virtual lock_identifier const& lock() const = 0;
};
} // namespace fl

#endif // fl_elector_hpp
