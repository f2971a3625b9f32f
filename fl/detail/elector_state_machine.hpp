#ifndef fl_detail_elector_state_machine_hpp
#define fl_detail_elector_state_machine_hpp

#include <iostream>
#include <mutex>

namespace fl {
namespace detail {
/**
 * The lifecycle of a leader elector.
 *
 * Makes the state machine explicit, mostly to debug the transitions through logging and to reject requests that are
 * invalid once certain states are reached (a second start(), anything after stop()).
 */
enum class elector_state {
  /// Constructed, not started.
  idle,
  /// The poll loop is running, the lock is not held.
  polling,
  /// The poll loop is running, the lock is held.
  leader,
  /// stop() is cancelling the loop and releasing the lock.
  stopping,
  /// Final state.
  stopped,
};

/// The streaming operator for @c elector_state.
std::ostream& operator<<(std::ostream& os, elector_state x);

/**
 * Implement the state machine for a leader elector.
 *
 * A small place to look at valid vs. invalid transitions and to centralize debug logging.
 */
class elector_state_machine {
public:
  elector_state_machine();

  /// Return the current state.
  elector_state current() const;

  /// Propose a state change, returns true if accepted.
  bool change_state(char const* where, elector_state nstate);

private:
  /// Checks if a state transition is acceptable.
  bool check_change_state(elector_state nstate) const;

private:
  mutable std::mutex mu_;
  elector_state state_;
};

} // namespace detail
} // namespace fl

#endif // fl_detail_elector_state_machine_hpp
