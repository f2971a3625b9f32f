#ifndef fl_session_hpp
#define fl_session_hpp

#include <chrono>
#include <cstdint>

namespace fl {

/**
 * Define the interface for a session, a backing-store connection that owns advisory locks.
 *
 * A session is realized as an etcd lease kept alive in the background.  Any lock acquired through the session is
 * attached to the lease, so when the session dies, either revoked or expired, the store drops its locks too.
 */
class session {
public:
  /**
   * Destroy a session, releasing only local resources.
   *
   * No attempt is made to release resources in etcd, such as the lease.  If the application wants to release them it
   * should call revoke() before destroying the object.
   */
  virtual ~session() noexcept(false);

  /// The session's lease.
  virtual std::int64_t lease_id() const = 0;

  /// The TTL granted (and possibly later adjusted) by the server.
  virtual std::chrono::milliseconds actual_TTL() const = 0;

  /**
   * Return true if the lease is known to be alive.
   *
   * Becomes false once the keep alive stream fails, the server reports the lease as expired, the last confirmed
   * renewal is older than the TTL, or the session is revoked.  It never becomes true again.
   */
  virtual bool is_active() const = 0;

  /**
   * Stop the keep alives and revoke the lease on the server.
   *
   * Local resources are released even if the revoke request fails, in that case the exception is propagated.
   */
  virtual void revoke() = 0;
};

} // namespace fl

#endif // fl_session_hpp
