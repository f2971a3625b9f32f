#include "fl/detail/mocked_grpc_interceptor.hpp"
#include <fl/completion_queue.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <vector>

namespace {
using completion_queue_type = fl::completion_queue<fl::detail::mocked_grpc_interceptor>;
using txn_op_type = fl::detail::unary_rpc_op<etcdserverpb::TxnRequest, etcdserverpb::TxnResponse>;

std::chrono::system_clock::time_point soon() {
  return std::chrono::system_clock::now() + std::chrono::seconds(5);
}
} // anonymous namespace

/**
 * @test Verify that we can mock timers, including their cancellation.
 */
TEST(mocked_grpc_interceptor, deadline_timer) {
  using namespace std::chrono_literals;
  using namespace fl::detail;

  completion_queue_type queue;

  std::vector<std::shared_ptr<deadline_timer>> pending_timer;
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_))
      .WillRepeatedly(Invoke([&pending_timer](auto bop) {
        auto* op = dynamic_cast<deadline_timer*>(bop.get());
        ASSERT_TRUE(op != nullptr);
        // ... the standard trick to downcast shared_ptr<> ...
        pending_timer.push_back(std::shared_ptr<deadline_timer>(bop, op));
      }));
  EXPECT_CALL(*queue.interceptor().shared_mock, cancel_deadline_timer(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));

  int cnt_ok = 0;
  int cnt_cancelled = 0;
  auto handle_timer = [&cnt_ok, &cnt_cancelled](auto const& op, bool ok) {
    if (ok) {
      ++cnt_ok;
    } else {
      ++cnt_cancelled;
    }
  };
  queue.make_relative_timer(100ms, "testing/relative_timer", handle_timer);
  ASSERT_EQ(pending_timer.size(), 1UL);
  EXPECT_EQ(pending_timer[0]->name, "testing/relative_timer");
  pending_timer[0]->callback(*pending_timer[0], true);
  EXPECT_EQ(cnt_ok, 1);
  EXPECT_EQ(cnt_cancelled, 0);

  auto timer = queue.make_deadline_timer(soon(), "testing/deadline_timer", handle_timer);
  ASSERT_EQ(pending_timer.size(), 2UL);
  queue.cancel_timer(timer);
  EXPECT_EQ(cnt_ok, 1);
  EXPECT_EQ(cnt_cancelled, 1);
}

/**
 * @test Make sure we can mock async_rpc() calls, and that the future is only satisfied by the callback.
 */
TEST(mocked_grpc_interceptor, async_rpc) {
  using namespace std::chrono_literals;

  // ... a null stub, the mocked operations never use it ...
  std::shared_ptr<etcdserverpb::KV::Stub> kv;
  completion_queue_type queue;

  using ::testing::_;
  using ::testing::Invoke;
  std::shared_ptr<fl::detail::base_async_op> last_op;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([&last_op](auto op) {
    last_op = op;
  }));

  etcdserverpb::TxnRequest req;
  req.add_compare()->set_key("fluxlock/advisory/000000000000002a");
  auto fut = queue.async_rpc(
      kv.get(), &etcdserverpb::KV::Stub::AsyncTxn, std::move(req), soon(), "test/txn", fl::use_future());
  ASSERT_EQ(fut.wait_for(10ms), std::future_status::timeout);

  ASSERT_TRUE((bool)last_op);
  auto* op = dynamic_cast<txn_op_type*>(last_op.get());
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(op->request.compare(0).key(), "fluxlock/advisory/000000000000002a");
  op->response.set_succeeded(true);
  last_op->callback(*last_op, true);

  ASSERT_EQ(fut.wait_for(10ms), std::future_status::ready);
  EXPECT_TRUE(fut.get().succeeded());
}

/**
 * @test Verify cancelled RPCs result in an exception for the future.
 */
TEST(mocked_grpc_interceptor, async_rpc_cancelled) {
  using namespace std::chrono_literals;
  std::shared_ptr<etcdserverpb::KV::Stub> kv;
  completion_queue_type queue;

  using ::testing::_;
  using ::testing::Invoke;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));

  auto fut = queue.async_rpc(
      kv.get(), &etcdserverpb::KV::Stub::AsyncRange, etcdserverpb::RangeRequest(), soon(), "test/range/cancelled",
      fl::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  EXPECT_THROW(fut.get(), std::runtime_error);
}

/**
 * @test Verify RPCs with an error status result in an exception for the future.
 */
TEST(mocked_grpc_interceptor, async_rpc_error_status) {
  using namespace std::chrono_literals;
  std::shared_ptr<etcdserverpb::KV::Stub> kv;
  completion_queue_type queue;

  using ::testing::_;
  using ::testing::Invoke;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<txn_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::DEADLINE_EXCEEDED, "deadline exceeded");
    bop->callback(*bop, true);
  }));

  auto fut = queue.async_rpc(
      kv.get(), &etcdserverpb::KV::Stub::AsyncTxn, etcdserverpb::TxnRequest(), soon(), "test/txn/error",
      fl::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  try {
    fut.get();
    FAIL() << "expected an exception";
  } catch (std::runtime_error const& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("test/txn/error"));
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("deadline exceeded"));
  }
}

/**
 * @test Verify creation and use of rdwr RPC streams is intercepted.
 */
TEST(mocked_grpc_interceptor, rdwr_stream) {
  using namespace std::chrono_literals;
  std::shared_ptr<etcdserverpb::Lease::Stub> lease;
  completion_queue_type queue;

  using ::testing::_;
  using ::testing::Invoke;
  auto const& mock = *queue.interceptor().shared_mock;
  auto immediate = [](auto op) { op->callback(*op, true); };
  EXPECT_CALL(mock, async_create_rdwr_stream(_)).WillOnce(Invoke(immediate));
  EXPECT_CALL(mock, async_write(_)).WillOnce(Invoke(immediate));
  EXPECT_CALL(mock, async_read(_)).WillOnce(Invoke([](auto bop) {
    using op_type = fl::detail::read_op<etcdserverpb::LeaseKeepAliveResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_ttl(7);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(mock, async_finish(_)).WillOnce(Invoke(immediate));
  EXPECT_CALL(mock, try_cancel()).Times(1);

  auto fut = queue.async_create_rdwr_stream(
      lease.get(), &etcdserverpb::Lease::Stub::AsyncLeaseKeepAlive, "test/keep_alive", fl::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  auto stream = fut.get();
  ASSERT_TRUE((bool)stream);

  bool written = false;
  etcdserverpb::LeaseKeepAliveRequest req;
  req.set_id(42);
  queue.async_write(*stream, std::move(req), "test/write", [&written](auto const& op, bool ok) {
    EXPECT_EQ(op.request.id(), 42);
    written = ok;
  });
  EXPECT_TRUE(written);

  std::int64_t ttl = 0;
  queue.async_read(*stream, "test/read", [&ttl](auto const& op, bool ok) { ttl = op.response.ttl(); });
  EXPECT_EQ(ttl, 7);

  EXPECT_TRUE(queue.async_finish(*stream, "test/finish", fl::use_future()).get().ok());
  queue.try_cancel_on(*stream);
}
