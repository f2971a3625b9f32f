#ifndef fl_detail_session_impl_hpp
#define fl_detail_session_impl_hpp

#include <fl/completion_queue.hpp>
#include <fl/detail/async_op_counter.hpp>
#include <fl/detail/async_ops.hpp>
#include <fl/detail/grpc_errors.hpp>
#include <fl/log.hpp>
#include <fl/session.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace fl {
namespace detail {

/**
 * Implement fl::session on top of an etcd lease.
 *
 * The constructor blocks until the KeepAlive stream is created and the lease is granted.  Afterwards a timer fires a
 * few times per TTL, each firing writes a LeaseKeepAlive request and reads its response, then re-arms the timer.  All
 * those callbacks run in the thread of @a queue, so the constructor and revoke() must not be called from it.
 *
 * @tparam completion_queue_type the type of completion queue, tests use a mocked version.
 */
template <typename completion_queue_type>
class session_impl : public ::fl::session {
public:
  //@{
  /// @name type traits

  /// The type of the bi-directional RPC stream for keep alive messages
  using ka_stream_type = async_rdwr_stream<etcdserverpb::LeaseKeepAliveRequest, etcdserverpb::LeaseKeepAliveResponse>;

  /// The preferred units for measuring time in this class
  using duration_type = std::chrono::milliseconds;
  //@}

  /// How many KeepAlive requests we send per TTL cycle.
  static int constexpr keep_alives_per_ttl = 3;

  /**
   * Constructor, obtains a new lease.
   *
   * @param queue the queue used for all RPCs and timers.
   * @param lease_stub the etcd Lease service stub.
   * @param desired_TTL the requested lease TTL, etcd rounds it to seconds.
   * @param rpc_timeout the deadline applied to each unary RPC (grant and revoke).
   * @throws std::runtime_error if the lease cannot be obtained.
   */
  template <typename ttl_duration_type, typename timeout_duration_type>
  session_impl(
      completion_queue_type& queue, std::unique_ptr<etcdserverpb::Lease::Stub> lease_stub,
      ttl_duration_type desired_TTL, timeout_duration_type rpc_timeout)
      : queue_(queue)
      , lease_client_(std::move(lease_stub))
      , ka_stream_()
      , lease_id_(0)
      , desired_TTL_(convert_duration(desired_TTL))
      , rpc_timeout_(convert_duration(rpc_timeout))
      , mu_()
      , actual_TTL_(desired_TTL_)
      , expires_()
      , lost_(false)
      , current_timer_()
      , ops_() {
    preamble();
  }

  session_impl(session_impl const&) = delete;
  session_impl& operator=(session_impl const&) = delete;
  session_impl(session_impl&&) = delete;
  session_impl& operator=(session_impl&&) = delete;

  ~session_impl() noexcept(false) override {
    stop_keep_alives();
  }

  std::int64_t lease_id() const override {
    return lease_id_;
  }

  std::chrono::milliseconds actual_TTL() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return actual_TTL_;
  }

  bool is_active() const override {
    if (ops_.in_shutdown()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    return not lost_ and std::chrono::steady_clock::now() < expires_;
  }

  /// Convert a duration to the preferred units in this class
  template <typename other_duration_type>
  static duration_type convert_duration(other_duration_type d) {
    return std::chrono::duration_cast<duration_type>(d);
  }

  void revoke() override {
    if (ops_.in_shutdown()) {
      return;
    }
    stop_keep_alives();

    etcdserverpb::LeaseRevokeRequest req;
    req.set_id(lease_id_);
    auto fut = queue_.async_rpc(
        lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseRevoke, std::move(req), rpc_deadline(),
        "session/revoke/lease_revoke", fl::use_future());
    fut.get();
    FL_LOG(info) << "session lease_id=" << std::hex << lease_id_ << " revoked";
  }

private:
  /// Create the KeepAlive stream and obtain a lease.
  void preamble() try {
    auto fut = queue_.async_create_rdwr_stream(
        lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseKeepAlive, "session/preamble/ka_stream",
        fl::use_future());
    ka_stream_ = fut.get();

    etcdserverpb::LeaseGrantRequest req;
    // ... the TTL is in seconds, etcd ignores the fraction ...
    req.set_ttl(std::chrono::duration_cast<std::chrono::seconds>(desired_TTL_).count());
    req.set_id(0);
    auto lfut = queue_.async_rpc(
        lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseGrant, std::move(req), rpc_deadline(),
        "session/preamble/lease_grant", fl::use_future());
    auto resp = lfut.get();
    if (resp.error() != "") {
      std::ostringstream os;
      os << "lease grant request rejected, response=" << print_to_stream(resp);
      throw std::runtime_error(os.str());
    }

    lease_id_ = resp.id();
    renewed(std::chrono::seconds(resp.ttl()));
    FL_LOG(info) << "session lease_id=" << std::hex << lease_id_ << std::dec << " granted, ttl=" << resp.ttl() << "s";
    set_timer();
  } catch (std::exception const&) {
    stop_keep_alives();
    throw;
  }

  /// Cancel the keep alive cycle and release the local resources, idempotent.
  void stop_keep_alives() {
    if (ops_.in_shutdown()) {
      return;
    }
    ops_.shutdown();
    std::shared_ptr<deadline_timer> timer;
    {
      std::lock_guard<std::mutex> lock(mu_);
      timer = std::move(current_timer_);
    }
    if (timer) {
      queue_.cancel_timer(std::move(timer));
    }
    if (not ka_stream_) {
      ops_.block_until_all_done();
      return;
    }
    queue_.try_cancel_on(*ka_stream_);
    ops_.block_until_all_done();
    try {
      auto status = queue_.async_finish(*ka_stream_, "session/shutdown/finish", fl::use_future()).get();
      FL_LOG(trace) << "session keep alive stream closed: " << status.error_message();
    } catch (std::exception const& ex) {
      FL_LOG(warning) << "session keep alive stream did not finish cleanly: " << ex.what();
    }
  }

  std::chrono::system_clock::time_point rpc_deadline() const {
    return std::chrono::system_clock::now() + rpc_timeout_;
  }

  /// Record a confirmed lease renewal.
  void renewed(std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mu_);
    actual_TTL_ = convert_duration(ttl);
    expires_ = std::chrono::steady_clock::now() + actual_TTL_;
  }

  /// Record that the lease can no longer be trusted.
  void mark_lost(char const* reason) {
    if (ops_.in_shutdown()) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      lost_ = true;
    }
    FL_LOG(warning) << "session lease_id=" << std::hex << lease_id_ << " lost: " << reason;
  }

  /// Set a timer to start the next Write/Read cycle.
  void set_timer() {
    // ... only one Write() may be outstanding on the stream, the timer is armed after the previous Read() completes ...
    if (not ops_.async_op_start("session/set_timer/ttl_refresh")) {
      return;
    }
    auto timer = queue_.make_relative_timer(
        actual_TTL() / keep_alives_per_ttl, "session/set_timer/ttl_refresh",
        [this](auto const& top, bool tok) { this->on_timeout(top, tok); });
    std::lock_guard<std::mutex> lock(mu_);
    current_timer_ = std::move(timer);
  }

  /// Handle the timer expiration, Write() a new LeaseKeepAlive request.
  void on_timeout(deadline_timer const& op, bool ok) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (current_timer_.get() == &op) {
        current_timer_.reset();
      }
    }
    if (ok and ops_.async_op_start("session/on_timeout/write")) {
      etcdserverpb::LeaseKeepAliveRequest req;
      req.set_id(lease_id_);
      queue_.async_write(
          *ka_stream_, std::move(req), "session/on_timeout/write",
          [this](auto const& wop, bool wok) { this->on_write(wop, wok); });
    }
    ops_.async_op_done("session/set_timer/ttl_refresh");
  }

  /// Handle the Write() completion, schedule a LeaseKeepAlive Read().
  void on_write(typename ka_stream_type::write_op const& op, bool ok) {
    if (not ok) {
      mark_lost("keep alive write failed");
    } else if (ops_.async_op_start("session/on_write/read")) {
      queue_.async_read(
          *ka_stream_, "session/on_write/read", [this](auto const& rop, bool rok) { this->on_read(rop, rok); });
    }
    ops_.async_op_done("session/on_timeout/write");
  }

  /// Handle the Read() completion, schedule a new timer.
  void on_read(typename ka_stream_type::read_op const& op, bool ok) {
    if (not ok) {
      mark_lost("keep alive read failed");
    } else if (op.response.ttl() <= 0) {
      mark_lost("lease expired on the server");
    } else {
      // ... the server may adjust the TTL ...
      renewed(std::chrono::seconds(op.response.ttl()));
      set_timer();
    }
    ops_.async_op_done("session/on_write/read");
  }

private:
  completion_queue_type& queue_;

  std::unique_ptr<etcdserverpb::Lease::Stub> lease_client_;
  std::shared_ptr<ka_stream_type> ka_stream_;

  /// Assigned by etcd during the constructor
  std::int64_t lease_id_;

  std::chrono::milliseconds desired_TTL_;
  std::chrono::milliseconds rpc_timeout_;

  mutable std::mutex mu_;
  std::chrono::milliseconds actual_TTL_;
  std::chrono::steady_clock::time_point expires_;
  bool lost_;

  /// The current timer, null while waiting for a KeepAlive response.
  std::shared_ptr<deadline_timer> current_timer_;

  /// Track pending keep alive operations.
  async_op_counter ops_;
};

/// Define the object.
template <typename completion_queue_type>
int constexpr session_impl<completion_queue_type>::keep_alives_per_ttl;

} // namespace detail
} // namespace fl

#endif // fl_detail_session_impl_hpp
