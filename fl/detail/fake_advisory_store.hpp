#ifndef fl_detail_fake_advisory_store_hpp
#define fl_detail_fake_advisory_store_hpp

#include <fl/completion_queue.hpp>
#include <fl/detail/async_ops.hpp>
#include <fl/detail/mocked_grpc_interceptor.hpp>
#include <fl/session.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.pb.h>

#include <gmock/gmock.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fl {
namespace detail {

/**
 * An in-memory stand-in for the etcd KV and Lease services, used by the elector unit tests.
 *
 * Interprets the Txn requests posted to a mocked completion queue against a key map, with the etcd semantics for the
 * compare targets the advisory locks use (CREATE, LEASE, VERSION, VALUE), and completes them synchronously.  Sessions
 * are plain leases in the map: revoking or expiring one deletes the keys attached to it.  Tests can inject store
 * failures for the next N Txn requests.
 */
class fake_advisory_store {
public:
  using completion_queue_type = completion_queue<mocked_grpc_interceptor>;
  using txn_op_type = unary_rpc_op<etcdserverpb::TxnRequest, etcdserverpb::TxnResponse>;

  /// A session backed by a lease in the fake store.
  class fake_session : public ::fl::session {
  public:
    fake_session(fake_advisory_store& store, std::int64_t lease_id)
        : store_(store)
        , lease_id_(lease_id) {
    }
    std::int64_t lease_id() const override {
      return lease_id_;
    }
    std::chrono::milliseconds actual_TTL() const override {
      return std::chrono::seconds(10);
    }
    bool is_active() const override {
      return store_.lease_alive(lease_id_);
    }
    void revoke() override {
      store_.revoke(lease_id_);
    }

  private:
    fake_advisory_store& store_;
    std::int64_t lease_id_;
  };

  fake_advisory_store()
      : mu_()
      , revision_(1)
      , next_lease_(1000)
      , live_leases_()
      , keys_()
      , failures_(0)
      , txn_log_()
      , revoked_()
      , gate_()
      , entered_() {
  }

  /// Route the Txn RPCs of @a queue to this store.
  void attach(completion_queue_type& queue) {
    using namespace ::testing;
    EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([this](auto bop) {
      this->handle(bop);
    }));
  }

  /// Open a new session, the equivalent of a LeaseGrant.
  std::unique_ptr<::fl::session> open_session() {
    std::lock_guard<std::mutex> lock(mu_);
    auto id = next_lease_++;
    live_leases_.insert(id);
    return std::unique_ptr<::fl::session>(new fake_session(*this, id));
  }

  /// Fail the next @a n Txn requests with UNAVAILABLE.
  void fail_next(int n) {
    std::lock_guard<std::mutex> lock(mu_);
    failures_ = n;
  }

  /**
   * Make the next Txn request wait until @a gate is ready.
   *
   * The returned future is satisfied once the request has reached the store and is waiting, the request is not
   * executed until the gate opens.
   */
  std::future<void> hold_next(std::shared_future<void> gate) {
    std::lock_guard<std::mutex> lock(mu_);
    gate_ = std::move(gate);
    entered_ = std::make_shared<std::promise<void>>();
    return entered_->get_future();
  }

  /// Expire a lease on the "server", its keys are deleted.
  void expire(std::int64_t lease_id) {
    drop_lease(lease_id);
  }

  /// The lease attached to @a key, 0 if the key does not exist.
  std::int64_t lease_of(std::string const& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto i = keys_.find(key);
    return i == keys_.end() ? 0 : i->second.lease();
  }

  /// The value of @a key, empty if the key does not exist.
  std::string value_of(std::string const& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto i = keys_.find(key);
    return i == keys_.end() ? std::string() : i->second.value();
  }

  /// A copy of all the Txn requests received, including the failed ones.
  std::vector<etcdserverpb::TxnRequest> txn_log() const {
    std::lock_guard<std::mutex> lock(mu_);
    return txn_log_;
  }

  /// The leases revoked through a session, in order.
  std::vector<std::int64_t> revoked() const {
    std::lock_guard<std::mutex> lock(mu_);
    return revoked_;
  }

  bool lease_alive(std::int64_t lease_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return live_leases_.count(lease_id) != 0;
  }

  void revoke(std::int64_t lease_id) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      revoked_.push_back(lease_id);
    }
    drop_lease(lease_id);
  }

private:
  void handle(std::shared_ptr<base_async_op> bop) {
    auto* op = dynamic_cast<txn_op_type*>(bop.get());
    if (op == nullptr) {
      // ... the fake only speaks Txn ...
      bop->callback(*bop, false);
      return;
    }
    std::shared_future<void> gate;
    std::shared_ptr<std::promise<void>> entered;
    {
      std::lock_guard<std::mutex> lock(mu_);
      gate = std::move(gate_);
      entered = std::move(entered_);
      gate_ = std::shared_future<void>();
    }
    if (entered) {
      entered->set_value();
      gate.wait();
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      txn_log_.push_back(op->request);
      if (failures_ > 0) {
        --failures_;
        op->status = grpc::Status(grpc::UNAVAILABLE, "injected store failure");
      } else {
        op->response = execute(op->request);
      }
    }
    bop->callback(*bop, true);
  }

  /// Must be called with mu_ held.
  etcdserverpb::TxnResponse execute(etcdserverpb::TxnRequest const& req) {
    bool succeeded = true;
    for (auto const& c : req.compare()) {
      succeeded = succeeded and compare(c);
    }
    etcdserverpb::TxnResponse resp;
    resp.set_succeeded(succeeded);
    auto const& ops = succeeded ? req.success() : req.failure();
    for (auto const& op : ops) {
      auto& r = *resp.add_responses();
      if (op.has_request_put()) {
        auto const& put = op.request_put();
        auto& kv = keys_[put.key()];
        ++revision_;
        if (kv.create_revision() == 0) {
          kv.set_create_revision(revision_);
        }
        kv.set_key(put.key());
        kv.set_value(put.value());
        kv.set_lease(put.lease());
        kv.set_mod_revision(revision_);
        kv.set_version(kv.version() + 1);
        r.mutable_response_put();
      } else if (op.has_request_range()) {
        auto& range = *r.mutable_response_range();
        auto i = keys_.find(op.request_range().key());
        if (i != keys_.end()) {
          *range.add_kvs() = i->second;
          range.set_count(1);
        }
      } else if (op.has_request_delete_range()) {
        auto n = keys_.erase(op.request_delete_range().key());
        r.mutable_response_delete_range()->set_deleted(n);
      }
    }
    return resp;
  }

  /// Must be called with mu_ held.
  bool compare(etcdserverpb::Compare const& c) const {
    mvccpb::KeyValue kv;
    auto i = keys_.find(c.key());
    if (i != keys_.end()) {
      kv = i->second;
    }
    std::int64_t lhs = 0;
    std::int64_t rhs = 0;
    switch (c.target()) {
    case etcdserverpb::Compare::CREATE:
      lhs = kv.create_revision();
      rhs = c.create_revision();
      break;
    case etcdserverpb::Compare::LEASE:
      lhs = kv.lease();
      rhs = c.lease();
      break;
    case etcdserverpb::Compare::VERSION:
      lhs = kv.version();
      rhs = c.version();
      break;
    case etcdserverpb::Compare::VALUE:
      lhs = kv.value().compare(c.value());
      break;
    default:
      return false;
    }
    switch (c.result()) {
    case etcdserverpb::Compare::EQUAL:
      return lhs == rhs;
    case etcdserverpb::Compare::NOT_EQUAL:
      return lhs != rhs;
    case etcdserverpb::Compare::GREATER:
      return lhs > rhs;
    case etcdserverpb::Compare::LESS:
      return lhs < rhs;
    default:
      return false;
    }
  }

  void drop_lease(std::int64_t lease_id) {
    std::lock_guard<std::mutex> lock(mu_);
    live_leases_.erase(lease_id);
    for (auto i = keys_.begin(); i != keys_.end();) {
      if (i->second.lease() == lease_id) {
        i = keys_.erase(i);
      } else {
        ++i;
      }
    }
  }

private:
  mutable std::mutex mu_;
  std::int64_t revision_;
  std::int64_t next_lease_;
  std::set<std::int64_t> live_leases_;
  std::map<std::string, mvccpb::KeyValue> keys_;
  int failures_;
  std::vector<etcdserverpb::TxnRequest> txn_log_;
  std::vector<std::int64_t> revoked_;
  std::shared_future<void> gate_;
  std::shared_ptr<std::promise<void>> entered_;
};

} // namespace detail
} // namespace fl

#endif // fl_detail_fake_advisory_store_hpp
