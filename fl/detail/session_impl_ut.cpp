#include "fl/detail/session_impl.hpp"
#include <fl/detail/mocked_grpc_interceptor.hpp>

#include <gtest/gtest.h>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = fl::completion_queue<fl::detail::mocked_grpc_interceptor>;
using session_type = fl::detail::session_impl<completion_queue_type>;
using grant_op_type = fl::detail::unary_rpc_op<etcdserverpb::LeaseGrantRequest, etcdserverpb::LeaseGrantResponse>;
using revoke_op_type = fl::detail::unary_rpc_op<etcdserverpb::LeaseRevokeRequest, etcdserverpb::LeaseRevokeResponse>;

/// Common initialization for all tests, timers are saved in @a pending_timer and never fired automatically.
void prepare_mocks_common(completion_queue_type& queue, std::shared_ptr<fl::detail::deadline_timer>& pending_timer);

/// Make the lease grant succeed with the given id and ttl.
void expect_grant(completion_queue_type& queue, std::int64_t id, std::int64_t ttl);

std::unique_ptr<session_type> make_session(completion_queue_type& queue) {
  using namespace std::chrono_literals;
  return std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms, 1s);
}
} // anonymous namespace

/**
 * @test Verify that fl::detail::session_impl works in the simple case.
 */
TEST(session_impl, basic) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  expect_grant(queue, 1000, 42);

  auto session = make_session(queue);
  EXPECT_EQ(session->lease_id(), 1000);
  EXPECT_EQ(session->actual_TTL().count(), 42000);
  EXPECT_TRUE(session->is_active());
  ASSERT_TRUE((bool)pending_timer);
  EXPECT_EQ(pending_timer->name, "session/set_timer/ttl_refresh");
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that fl::detail::session_impl reports leases rejected by the server.
 */
TEST(session_impl, lease_error) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<grant_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_error("something broke");
    bop->callback(*bop, true);
  }));

  std::unique_ptr<session_type> session;
  EXPECT_THROW(session = make_session(queue), std::runtime_error);
  EXPECT_FALSE((bool)pending_timer);
}

/**
 * @test Verify that fl::detail::session_impl reports RPC errors while obtaining the lease.
 */
TEST(session_impl, lease_rpc_error) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<grant_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAVAILABLE, "no etcd here");
    bop->callback(*bop, true);
  }));

  std::unique_ptr<session_type> session;
  EXPECT_THROW(session = make_session(queue), std::runtime_error);
  EXPECT_FALSE((bool)pending_timer);
}

/**
 * @test Verify a full lifecycle: create, get lease, some keep alive cycles, revoke.
 */
TEST(session_impl, full_lifecycle) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  expect_grant(queue, 1000, 42);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).Times(2).WillRepeatedly(Invoke([](auto bop) {
    using op_type = fl::detail::write_op<etcdserverpb::LeaseKeepAliveRequest>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.id(), 1000);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).Times(2).WillRepeatedly(Invoke([](auto bop) {
    using op_type = fl::detail::read_op<etcdserverpb::LeaseKeepAliveResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_ttl(24);
    bop->callback(*bop, true);
  }));
  int revoke_count = 0;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/revoke/lease_revoke";
  }))).WillOnce(Invoke([&revoke_count](auto bop) {
    auto* op = dynamic_cast<revoke_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.id(), 1000);
    ++revoke_count;
    bop->callback(*bop, true);
  }));

  auto session = make_session(queue);
  ASSERT_TRUE(session->is_active());

  // ... each timer -> write -> read cycle arms a new timer, and picks up the TTL from the response ...
  for (int i = 0; i != 2; ++i) {
    auto p = std::move(pending_timer);
    ASSERT_TRUE((bool)p);
    p->callback(*p, true);
    EXPECT_EQ(session->actual_TTL().count(), 24000);
    EXPECT_TRUE(session->is_active());
  }
  ASSERT_TRUE((bool)pending_timer);

  session->revoke();
  EXPECT_FALSE(session->is_active());
  EXPECT_EQ(revoke_count, 1);

  // ... a second revoke is a no-op ...
  EXPECT_NO_THROW(session->revoke());
  EXPECT_EQ(revoke_count, 1);
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that a failed keep alive marks the session as lost.
 */
TEST(session_impl, keep_alive_failure) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  expect_grant(queue, 2000, 10);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));

  auto session = make_session(queue);
  ASSERT_TRUE(session->is_active());

  auto p = std::move(pending_timer);
  p->callback(*p, true);
  EXPECT_FALSE(session->is_active());
  // ... a lost session stops renewing ...
  EXPECT_FALSE((bool)pending_timer);
}

/**
 * @test Verify that a keep alive response with ttl <= 0 marks the session as lost.
 */
TEST(session_impl, lease_expired) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  expect_grant(queue, 3000, 10);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillOnce(Invoke([](auto bop) {
    using op_type = fl::detail::read_op<etcdserverpb::LeaseKeepAliveResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_ttl(0);
    bop->callback(*bop, true);
  }));

  auto session = make_session(queue);
  auto p = std::move(pending_timer);
  p->callback(*p, true);
  EXPECT_FALSE(session->is_active());
  EXPECT_FALSE((bool)pending_timer);
}

/**
 * @test Verify that revoke() cancels the pending timer and does not start a new keep alive cycle.
 */
TEST(session_impl, revoke_cancels_timer) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  expect_grant(queue, 4000, 10);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).Times(0);
  EXPECT_CALL(*queue.interceptor().shared_mock, cancel_deadline_timer(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));

  auto session = make_session(queue);
  ASSERT_TRUE((bool)pending_timer);
  EXPECT_NO_THROW(session->revoke());
  EXPECT_FALSE(session->is_active());
}

/**
 * @test Verify that revoke() reports errors, and that the session is inactive anyway.
 */
TEST(session_impl, revoke_error) {
  completion_queue_type queue;
  std::shared_ptr<fl::detail::deadline_timer> pending_timer;
  prepare_mocks_common(queue, pending_timer);
  expect_grant(queue, 5000, 10);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/revoke/lease_revoke";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<revoke_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::DEADLINE_EXCEEDED, "too slow");
    bop->callback(*bop, true);
  }));

  auto session = make_session(queue);
  EXPECT_THROW(session->revoke(), std::runtime_error);
  EXPECT_FALSE(session->is_active());
}

namespace {
void prepare_mocks_common(completion_queue_type& queue, std::shared_ptr<fl::detail::deadline_timer>& pending_timer) {
  using namespace ::testing;
  auto immediate = [](auto op) { op->callback(*op, true); };
  auto const& mock = *queue.interceptor().shared_mock;
  EXPECT_CALL(mock, async_rpc(_)).WillRepeatedly(Invoke(immediate));
  EXPECT_CALL(mock, async_read(_)).WillRepeatedly(Invoke(immediate));
  EXPECT_CALL(mock, async_write(_)).WillRepeatedly(Invoke(immediate));
  EXPECT_CALL(mock, async_create_rdwr_stream(_)).WillRepeatedly(Invoke(immediate));
  EXPECT_CALL(mock, async_finish(_)).WillRepeatedly(Invoke(immediate));
  EXPECT_CALL(mock, try_cancel()).Times(AnyNumber());
  EXPECT_CALL(mock, cancel_deadline_timer(_)).WillRepeatedly(Invoke([](auto op) { op->callback(*op, false); }));
  EXPECT_CALL(mock, make_deadline_timer(_)).WillRepeatedly(Invoke([&pending_timer](auto bop) {
    auto* op = dynamic_cast<fl::detail::deadline_timer*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    // ... the standard trick to downcast shared_ptr<> ...
    pending_timer = std::shared_ptr<fl::detail::deadline_timer>(bop, op);
  }));
}

void expect_grant(completion_queue_type& queue, std::int64_t id, std::int64_t ttl) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).WillOnce(Invoke([id, ttl](auto bop) {
    auto* op = dynamic_cast<grant_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.ttl(), 5);
    EXPECT_EQ(op->request.id(), 0);
    op->response.set_id(id);
    op->response.set_ttl(ttl);
    bop->callback(*bop, true);
  }));
}
} // anonymous namespace
