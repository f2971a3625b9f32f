#include "fl/detail/advisory_lock.hpp"
#include <fl/detail/fake_advisory_store.hpp>

#include <gtest/gtest.h>

namespace {
using completion_queue_type = fl::detail::fake_advisory_store::completion_queue_type;
using lock_type = fl::detail::advisory_lock<completion_queue_type>;

std::unique_ptr<lock_type> make_lock(completion_queue_type& queue, std::string holder) {
  using namespace std::chrono_literals;
  return std::make_unique<lock_type>(
      queue, std::unique_ptr<etcdserverpb::KV::Stub>(), "test/locks", std::move(holder), 5000ms);
}
} // anonymous namespace

/**
 * @test Verify the format of the lock keys.
 */
TEST(advisory_lock, key) {
  EXPECT_EQ(fl::detail::advisory_lock_key("a/b", fl::lock_identifier{42, "x"}), "a/b/000000000000002a");
  EXPECT_EQ(fl::detail::advisory_lock_key("p", fl::lock_identifier{-1, "x"}), "p/ffffffffffffffff");
  auto jobs = fl::lock_registry::lookup(fl::lock_purpose::jobs_scheduler);
  EXPECT_EQ(fl::detail::advisory_lock_key("fluxlock/advisory", jobs), "fluxlock/advisory/464c555800000001");
}

/**
 * @test Verify that acquire is exclusive, idempotent for the holder, and that release is scoped to the session.
 */
TEST(advisory_lock, session_scoped) {
  fl::detail::fake_advisory_store store;
  completion_queue_type queue;
  store.attach(queue);
  auto lock = make_lock(queue, "host-a:1");
  fl::lock_identifier id{42, "test"};
  auto const key = lock->key(id);

  auto a = store.open_session();
  auto b = store.open_session();

  EXPECT_TRUE(lock->try_acquire(id, a->lease_id()));
  EXPECT_EQ(store.lease_of(key), a->lease_id());
  EXPECT_EQ(store.value_of(key), "host-a:1");

  // ... the holder acquires again, nothing changes ...
  EXPECT_TRUE(lock->try_acquire(id, a->lease_id()));
  EXPECT_EQ(store.lease_of(key), a->lease_id());

  // ... a different session cannot acquire, nor release ...
  EXPECT_FALSE(lock->try_acquire(id, b->lease_id()));
  EXPECT_FALSE(lock->release(id, b->lease_id()));
  EXPECT_EQ(store.lease_of(key), a->lease_id());

  // ... one release is enough, the acquire did not stack ...
  EXPECT_TRUE(lock->release(id, a->lease_id()));
  EXPECT_EQ(store.lease_of(key), 0);
  EXPECT_FALSE(lock->release(id, a->lease_id()));

  EXPECT_TRUE(lock->try_acquire(id, b->lease_id()));
  EXPECT_EQ(store.lease_of(key), b->lease_id());
}

/**
 * @test Verify that a lock is dropped when the session that holds it dies.
 */
TEST(advisory_lock, dropped_with_session) {
  fl::detail::fake_advisory_store store;
  completion_queue_type queue;
  store.attach(queue);
  auto lock = make_lock(queue, "host-a:1");
  fl::lock_identifier id{7, "test"};

  auto a = store.open_session();
  auto b = store.open_session();
  ASSERT_TRUE(lock->try_acquire(id, a->lease_id()));
  store.expire(a->lease_id());
  EXPECT_FALSE(a->is_active());
  EXPECT_TRUE(lock->try_acquire(id, b->lease_id()));
}

/**
 * @test Verify that store errors are reported as exceptions.
 */
TEST(advisory_lock, store_errors) {
  fl::detail::fake_advisory_store store;
  completion_queue_type queue;
  store.attach(queue);
  auto lock = make_lock(queue, "host-a:1");
  fl::lock_identifier id{42, "test"};
  auto a = store.open_session();

  store.fail_next(2);
  EXPECT_THROW(lock->try_acquire(id, a->lease_id()), std::runtime_error);
  EXPECT_THROW(lock->release(id, a->lease_id()), std::runtime_error);
  EXPECT_EQ(store.lease_of(lock->key(id)), 0);
  EXPECT_TRUE(lock->try_acquire(id, a->lease_id()));
}

/**
 * @test Verify the shape of the requests, each one carries the session lease and a deadline.
 */
TEST(advisory_lock, requests) {
  completion_queue_type queue;
  using namespace ::testing;
  using op_type = fl::detail::fake_advisory_store::txn_op_type;
  std::vector<etcdserverpb::TxnRequest> requests;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([&requests](auto bop) {
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_GT(op->context.deadline(), std::chrono::system_clock::now());
    requests.push_back(op->request);
    op->response.set_succeeded(true);
    bop->callback(*bop, true);
  }));

  auto lock = make_lock(queue, "host-b:2");
  fl::lock_identifier id{42, "test"};
  EXPECT_TRUE(lock->try_acquire(id, 1234));
  EXPECT_TRUE(lock->release(id, 1234));
  ASSERT_EQ(requests.size(), 2UL);

  auto const& acquire = requests[0];
  ASSERT_EQ(acquire.compare_size(), 1);
  EXPECT_EQ(acquire.compare(0).target(), etcdserverpb::Compare::CREATE);
  EXPECT_EQ(acquire.compare(0).create_revision(), 0);
  ASSERT_EQ(acquire.success_size(), 1);
  EXPECT_EQ(acquire.success(0).request_put().lease(), 1234);
  EXPECT_EQ(acquire.success(0).request_put().value(), "host-b:2");
  ASSERT_EQ(acquire.failure_size(), 1);
  EXPECT_TRUE(acquire.failure(0).has_request_range());

  auto const& release = requests[1];
  ASSERT_EQ(release.compare_size(), 1);
  EXPECT_EQ(release.compare(0).target(), etcdserverpb::Compare::LEASE);
  EXPECT_EQ(release.compare(0).lease(), 1234);
  ASSERT_EQ(release.success_size(), 1);
  EXPECT_EQ(release.success(0).request_delete_range().key(), "test/locks/000000000000002a");
}
