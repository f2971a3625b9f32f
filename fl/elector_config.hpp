#ifndef fl_elector_config_hpp
#define fl_elector_config_hpp

#include <chrono>
#include <iostream>
#include <string>

namespace fl {

/**
 * Tunable parameters of a leader elector.
 *
 * Passed by value into each elector.  The defaults match a fleet of schedulers polling every few seconds.
 */
struct elector_config {
  /// Time between poll attempts, the first poll happens immediately.
  std::chrono::milliseconds poll_interval = std::chrono::seconds(5);

  /// Deadline for each individual acquire or release against the store.
  std::chrono::milliseconds operation_timeout = std::chrono::seconds(5);

  /// TTL of the session lease, the store drops the lock this long after the holder disappears.
  std::chrono::milliseconds session_ttl = std::chrono::seconds(10);

  /// The lock for id N is stored at "<key_prefix>/<N as 16 hex digits>".
  std::string key_prefix = "fluxlock/advisory";

  /// Stored as the value of the lock key, to let operators see who holds it.
  std::string holder = default_holder();

  /// "<hostname>:<pid>"
  static std::string default_holder();
};

/**
 * Check an elector configuration.
 *
 * @throws std::invalid_argument if a duration is not positive, the session TTL is below one second (etcd leases have
 * a resolution of seconds), or the key prefix is empty.
 */
void validate(elector_config const& config);

/// Streaming operator, for logging.
std::ostream& operator<<(std::ostream& os, elector_config const& x);

/// Host-level scaling settings, they decide if the singleton duties run at all.
struct scaling_config {
  /// Elect one instance in the fleet to run the schedulers.
  bool enable_leader_election = false;
  /// Never run the schedulers in this instance.
  bool disable_scheduler = false;
  /// This instance only executes work, it never schedules.
  bool worker_only = false;
};

/// How the host runs its singleton duties.
enum class scheduler_mode {
  /// Every instance runs them, there is a single instance.
  always,
  /// This instance never runs them.
  never,
  /// Only the elected leader runs them.
  when_elected,
};

/// The streaming operator for @c scheduler_mode.
std::ostream& operator<<(std::ostream& os, scheduler_mode x);

/// Decide the scheduler mode, disable_scheduler and worker_only win over enable_leader_election.
scheduler_mode decide_scheduler_mode(scaling_config const& config);

} // namespace fl

#endif // fl_elector_config_hpp
