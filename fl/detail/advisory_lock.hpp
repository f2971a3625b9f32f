#ifndef fl_detail_advisory_lock_hpp
#define fl_detail_advisory_lock_hpp

#include <fl/completion_queue.hpp>
#include <fl/detail/grpc_errors.hpp>
#include <fl/lock_identifier.hpp>
#include <fl/log.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace fl {
namespace detail {

/// Return the etcd key for a lock, "<prefix>/<16 hex digits>".
inline std::string advisory_lock_key(std::string const& prefix, lock_identifier const& lock) {
  std::ostringstream os;
  os << prefix << "/" << std::hex << std::setw(16) << std::setfill('0') << static_cast<std::uint64_t>(lock.id);
  return os.str();
}

/**
 * Non-blocking acquire and release of an advisory lock in etcd.
 *
 * Ownership is tied to the session (lease) passed in each call: the lock key is attached to the lease, acquiring a
 * lock already held by the same lease succeeds without stacking, and a release only deletes the key if it is attached
 * to the caller's lease.  Each call is a single Txn with its own deadline; the call blocks the calling thread until
 * the response arrives, so it must not be made from the thread running @a queue.
 *
 * @tparam completion_queue_type the type of completion queue, tests use a mocked version.
 */
template <typename completion_queue_type>
class advisory_lock {
public:
  advisory_lock(
      completion_queue_type& queue, std::unique_ptr<etcdserverpb::KV::Stub> kv_stub, std::string key_prefix,
      std::string holder, std::chrono::milliseconds operation_timeout)
      : queue_(queue)
      , kv_stub_(std::move(kv_stub))
      , key_prefix_(std::move(key_prefix))
      , holder_(std::move(holder))
      , operation_timeout_(operation_timeout) {
  }

  std::string key(lock_identifier const& lock) const {
    return advisory_lock_key(key_prefix_, lock);
  }

  /**
   * Try to acquire the lock for the session with @a lease_id.
   *
   * @return true if the session holds the lock after the call.
   * @throws std::runtime_error on any store error, including a missed deadline.
   */
  bool try_acquire(lock_identifier const& lock, std::int64_t lease_id) {
    auto const k = key(lock);
    etcdserverpb::TxnRequest req;
    // ... the key does not exist ...
    auto& cmp = *req.add_compare();
    cmp.set_key(k);
    cmp.set_result(etcdserverpb::Compare::EQUAL);
    cmp.set_target(etcdserverpb::Compare::CREATE);
    cmp.set_create_revision(0);
    // ... then create it, attached to the session ...
    auto& put = *req.add_success()->mutable_request_put();
    put.set_key(k);
    put.set_value(holder_);
    put.set_lease(lease_id);
    // ... else fetch it, to find out if we already own it ...
    req.add_failure()->mutable_request_range()->set_key(k);

    auto resp = queue_
                    .async_rpc(
                        kv_stub_.get(), &etcdserverpb::KV::Stub::AsyncTxn, std::move(req), deadline(),
                        "advisory_lock/try_acquire", fl::use_future())
                    .get();
    if (resp.succeeded()) {
      FL_LOG(trace) << "try_acquire(" << lock << ") created " << k << " lease_id=" << std::hex << lease_id;
      return true;
    }
    if (resp.responses_size() == 0 or resp.responses(0).response_range().kvs_size() == 0) {
      // ... the key vanished between the compare and the range, impossible in a single Txn ...
      std::ostringstream os;
      os << "try_acquire(" << lock << ") unexpected response " << print_to_stream(resp);
      throw std::runtime_error(os.str());
    }
    auto const& kv = resp.responses(0).response_range().kvs(0);
    FL_LOG(trace) << "try_acquire(" << lock << ") " << k << " held by lease_id=" << std::hex << kv.lease()
                  << " value=" << kv.value();
    return kv.lease() == lease_id;
  }

  /**
   * Release the lock if the session with @a lease_id holds it.
   *
   * @return true if the lock was held by the session and is now released, false if it was not held.
   * @throws std::runtime_error on any store error, including a missed deadline.
   */
  bool release(lock_identifier const& lock, std::int64_t lease_id) {
    auto const k = key(lock);
    etcdserverpb::TxnRequest req;
    auto& cmp = *req.add_compare();
    cmp.set_key(k);
    cmp.set_result(etcdserverpb::Compare::EQUAL);
    cmp.set_target(etcdserverpb::Compare::LEASE);
    cmp.set_lease(lease_id);
    req.add_success()->mutable_request_delete_range()->set_key(k);

    auto resp = queue_
                    .async_rpc(
                        kv_stub_.get(), &etcdserverpb::KV::Stub::AsyncTxn, std::move(req), deadline(),
                        "advisory_lock/release", fl::use_future())
                    .get();
    return resp.succeeded();
  }

private:
  std::chrono::system_clock::time_point deadline() const {
    return std::chrono::system_clock::now() + operation_timeout_;
  }

private:
  completion_queue_type& queue_;
  std::unique_ptr<etcdserverpb::KV::Stub> kv_stub_;
  std::string key_prefix_;
  std::string holder_;
  std::chrono::milliseconds operation_timeout_;
};

} // namespace detail
} // namespace fl

#endif // fl_detail_advisory_lock_hpp
