#ifndef fl_detail_leader_elector_impl_hpp
#define fl_detail_leader_elector_impl_hpp

#include <fl/completion_queue.hpp>
#include <fl/detail/advisory_lock.hpp>
#include <fl/detail/async_op_counter.hpp>
#include <fl/detail/async_ops.hpp>
#include <fl/detail/elector_state_machine.hpp>
#include <fl/elector.hpp>
#include <fl/elector_config.hpp>
#include <fl/log.hpp>
#include <fl/session.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>

namespace fl {
namespace detail {

/**
 * Implement a leader elector given the type of completion queue.
 *
 * The poll loop is a chain of one-shot timers in @a loop_queue: each timer runs one poll and arms the next one.  A
 * poll blocks on the store RPCs, which complete in @a store_queue, so the two queues must be run by different threads.
 * Tests use the same mocked queue for both, the mocks complete the operations synchronously.
 *
 * The elector pins a single session for its lifetime: it is opened by the first poll (or try_acquire_once()), used
 * for every acquire and release, and revoked by stop().  A session that dies takes the lock with it, the elector
 * records the loss and opens a new session on the next poll.
 */
template <typename completion_queue_type>
class leader_elector_impl : public ::fl::elector {
public:
  /// Create the session used to hold the lock.
  using session_factory = std::function<std::unique_ptr<session>()>;

  leader_elector_impl(
      completion_queue_type& loop_queue, completion_queue_type& store_queue,
      std::unique_ptr<etcdserverpb::KV::Stub> kv_stub, session_factory make_session, lock_identifier lock,
      elector_config config)
      : loop_queue_(loop_queue)
      , lock_(std::move(lock))
      , config_(std::move(config))
      , store_(store_queue, std::move(kv_stub), config_.key_prefix, config_.holder, config_.operation_timeout)
      , make_session_(std::move(make_session))
      , state_machine_()
      , held_mu_()
      , held_(false)
      , held_session_()
      , store_mu_()
      , session_()
      , timer_mu_()
      , current_timer_()
      , on_become_leader_()
      , on_lose_leadership_()
      , ops_() {
    validate(config_);
  }

  leader_elector_impl(leader_elector_impl const&) = delete;
  leader_elector_impl& operator=(leader_elector_impl const&) = delete;

  ~leader_elector_impl() noexcept(false) override {
    stop();
  }

  void start(callback_type on_become_leader, callback_type on_lose_leadership) override {
    auto const s = state_machine_.current();
    if (s != elector_state::idle) {
      std::ostringstream os;
      os << "start() called on " << s << " elector for " << lock_;
      throw std::runtime_error(os.str());
    }
    // ... the callbacks are only used by the loop, which has not started yet ...
    on_become_leader_ = std::move(on_become_leader);
    on_lose_leadership_ = std::move(on_lose_leadership);
    if (not state_machine_.change_state("start", elector_state::polling)) {
      std::ostringstream os;
      os << "start() raced with another start() or stop() for " << lock_;
      throw std::runtime_error(os.str());
    }
    // ... a poll with a try_acquire_once() lock already held starts as leader, without calling the callback ...
    bool held = false;
    {
      std::shared_lock<std::shared_timed_mutex> held_lock(held_mu_);
      held = held_;
    }
    if (held) {
      state_machine_.change_state("start", elector_state::leader);
    }
    FL_LOG(info) << "elector for " << lock_ << " started " << config_;
    arm_timer(std::chrono::milliseconds(0));
  }

  void stop() override {
    if (not state_machine_.change_state("stop", elector_state::stopping)) {
      return;
    }
    // ... no more polls, cancel the one armed and wait for the one running ...
    ops_.shutdown();
    cancel_timer();
    ops_.block_until_all_done();

    std::lock_guard<std::mutex> lock(store_mu_);
    bool was_held = false;
    {
      std::unique_lock<std::shared_timed_mutex> held_lock(held_mu_);
      was_held = held_;
      held_ = false;
      held_session_.reset();
    }
    if (was_held and session_) {
      try {
        bool released = store_.release(lock_, session_->lease_id());
        FL_LOG(info) << "elector for " << lock_ << " released=" << std::boolalpha << released;
      } catch (std::exception const& ex) {
        FL_LOG(error) << "elector for " << lock_ << " could not release the lock: " << ex.what();
      }
    }
    if (session_) {
      try {
        session_->revoke();
      } catch (std::exception const& ex) {
        FL_LOG(error) << "elector for " << lock_ << " could not revoke its session: " << ex.what();
      }
      session_.reset();
    }
    state_machine_.change_state("stop", elector_state::stopped);
    FL_LOG(info) << "elector for " << lock_ << " stopped";
  }

  bool is_leader() const override {
    std::shared_ptr<session> holder;
    {
      std::shared_lock<std::shared_timed_mutex> lock(held_mu_);
      if (not held_) {
        return false;
      }
      holder = held_session_;
    }
    // ... the lease can expire between polls, and the store drops the lock with it ...
    return holder and holder->is_active();
  }

  bool try_acquire_once() override {
    bool lost = false;
    bool granted = false;
    std::shared_ptr<session> holder;
    std::exception_ptr error;
    {
      std::lock_guard<std::mutex> lock(store_mu_);
      auto const s = state_machine_.current();
      if (s == elector_state::stopping or s == elector_state::stopped) {
        std::ostringstream os;
        os << "try_acquire_once() called on " << s << " elector for " << lock_;
        throw std::runtime_error(os.str());
      }
      lost = discard_dead_session();
      try {
        granted = acquire();
        holder = session_;
      } catch (std::exception const&) {
        error = std::current_exception();
      }
    }
    if (lost) {
      record_outcome(false, nullptr);
    }
    if (error) {
      std::rethrow_exception(error);
    }
    record_outcome(granted, std::move(holder));
    return granted;
  }

  lock_identifier const& lock() const override {
    return lock_;
  }

  /// The current state, mostly for tests and debugging.
  elector_state state() const {
    return state_machine_.current();
  }

  /// The lease of the pinned session, 0 if there is none, mostly for tests and debugging.
  std::int64_t lease_id() const {
    std::lock_guard<std::mutex> lock(store_mu_);
    return session_ ? session_->lease_id() : 0;
  }

private:
  /// Schedule the next poll.
  void arm_timer(std::chrono::milliseconds delay) {
    if (not ops_.async_op_start("elector/poll_timer")) {
      return;
    }
    auto timer = loop_queue_.make_relative_timer(
        delay, "elector/poll_timer", [this](auto const& op, bool ok) { this->on_timer(op, ok); });
    {
      std::lock_guard<std::mutex> lock(timer_mu_);
      current_timer_ = std::move(timer);
    }
    // ... stop() may have looked for the timer before it was saved ...
    if (ops_.in_shutdown()) {
      cancel_timer();
    }
  }

  void cancel_timer() {
    std::shared_ptr<deadline_timer> timer;
    {
      std::lock_guard<std::mutex> lock(timer_mu_);
      timer = std::move(current_timer_);
    }
    if (timer) {
      loop_queue_.cancel_timer(std::move(timer));
    }
  }

  /// Run a poll and arm the next timer, unless the timer was cancelled.
  void on_timer(deadline_timer const& op, bool ok) {
    {
      std::lock_guard<std::mutex> lock(timer_mu_);
      if (current_timer_.get() == &op) {
        current_timer_.reset();
      }
    }
    if (ok and not ops_.in_shutdown()) {
      poll();
      arm_timer(config_.poll_interval);
    }
    ops_.async_op_done("elector/poll_timer");
  }

  /// One poll attempt, store errors keep the previous leadership flag.
  void poll() {
    bool lost = false;
    bool granted = false;
    std::shared_ptr<session> holder;
    try {
      std::lock_guard<std::mutex> lock(store_mu_);
      lost = discard_dead_session();
      if (not lost) {
        granted = acquire();
        holder = session_;
      }
    } catch (std::exception const& ex) {
      FL_LOG(warning) << "poll for " << lock_ << " failed, is_leader() remains " << std::boolalpha << is_leader()
                      << ": " << ex.what();
      return;
    }
    // ... a dead session is certain evidence, the store dropped the lock with the lease, try again next poll ...
    if (lost) {
      record_outcome(false, nullptr);
      return;
    }
    record_outcome(granted, std::move(holder));
  }

  /**
   * Discard the session if it is no longer active, return true if it was discarded.
   *
   * The session may have only expired locally, with the lease still alive in the server and the lock attached to it.
   * Revoking it lets the other electors take over without waiting for the server to expire the lease.
   *
   * Must be called with store_mu_ held.
   */
  bool discard_dead_session() {
    if (not session_ or session_->is_active()) {
      return false;
    }
    FL_LOG(warning) << "elector for " << lock_ << " lost session lease_id=" << std::hex << session_->lease_id()
                    << ", the lock is gone with it";
    try {
      session_->revoke();
    } catch (std::exception const& ex) {
      FL_LOG(warning) << "elector for " << lock_ << " could not revoke the lost session: " << ex.what();
    }
    session_.reset();
    return true;
  }

  /// Open the session if needed and make one acquire attempt, must be called with store_mu_ held.
  bool acquire() {
    if (not session_) {
      session_ = make_session_();
      FL_LOG(info) << "elector for " << lock_ << " opened session lease_id=" << std::hex << session_->lease_id();
    }
    return store_.try_acquire(lock_, session_->lease_id());
  }

  /// Update the leadership flag, and the session holding the lock, and call the callbacks on a transition.
  void record_outcome(bool granted, std::shared_ptr<session> holder) {
    bool previous = false;
    {
      std::unique_lock<std::shared_timed_mutex> lock(held_mu_);
      previous = held_;
      held_ = granted;
      held_session_ = granted ? std::move(holder) : std::shared_ptr<session>();
    }
    if (previous == granted) {
      return;
    }
    FL_LOG(info) << "elector for " << lock_ << (granted ? " acquired the lock" : " lost the lock");
    auto const s = state_machine_.current();
    if (s != elector_state::polling and s != elector_state::leader) {
      return;
    }
    state_machine_.change_state("record_outcome", granted ? elector_state::leader : elector_state::polling);
    auto const& callback = granted ? on_become_leader_ : on_lose_leadership_;
    if (not callback) {
      return;
    }
    try {
      callback();
    } catch (std::exception const& ex) {
      FL_LOG(error) << "elector for " << lock_ << " transition callback raised: " << ex.what();
    }
  }

private:
  completion_queue_type& loop_queue_;
  lock_identifier lock_;
  elector_config config_;
  advisory_lock<completion_queue_type> store_;
  session_factory make_session_;
  elector_state_machine state_machine_;

  /// The leadership flag, written by the poll loop (or try_acquire_once()), read by anybody.
  mutable std::shared_timed_mutex held_mu_;
  bool held_;
  /// The session the lock is attached to, is_leader() checks it is still alive.
  std::shared_ptr<session> held_session_;

  /// Serialize the use of the session and the store.
  mutable std::mutex store_mu_;
  std::shared_ptr<session> session_;

  std::mutex timer_mu_;
  std::shared_ptr<deadline_timer> current_timer_;

  callback_type on_become_leader_;
  callback_type on_lose_leadership_;

  /// Track the armed timer, it runs the poll.
  async_op_counter ops_;
};

} // namespace detail
} // namespace fl

#endif // fl_detail_leader_elector_impl_hpp
