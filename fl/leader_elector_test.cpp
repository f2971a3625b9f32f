#include "fl/leader_elector.hpp"
#include <fl/detail/session_impl.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <random>
#include <thread>

namespace {
using session_type = fl::detail::session_impl<fl::completion_queue<>>;

/// The etcd endpoint used by these tests, they are skipped if it is not set.
std::string etcd_endpoint() {
  char const* endpoint = std::getenv("FLUXLOCK_ETCD_ENDPOINT");
  return endpoint == nullptr ? std::string() : std::string(endpoint);
}

/// A lock nobody else uses, the tests share the etcd server with other runs.
fl::lock_identifier unique_lock() {
  std::random_device rd;
  std::uniform_int_distribution<std::int64_t> dist(1, std::int64_t(1) << 48);
  auto id = dist(rd);
  return fl::lock_identifier{id, "test-" + std::to_string(id)};
}

fl::elector_config fast_config() {
  using namespace std::chrono_literals;
  fl::elector_config config;
  config.poll_interval = 200ms;
  config.operation_timeout = 2s;
  config.session_ttl = 5s;
  config.key_prefix = "fluxlock-test/advisory";
  return config;
}

/// Wait until @a predicate is true, or the timeout expires.
template <typename predicate>
bool wait_for(predicate&& p) {
  using namespace std::chrono_literals;
  auto const deadline = std::chrono::steady_clock::now() + 10s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (p()) {
      return true;
    }
    std::this_thread::sleep_for(50ms);
  }
  return p();
}
} // anonymous namespace

/**
 * @test Verify that a session can be created and revoked.
 */
TEST(leader_elector, session) {
  auto const endpoint = etcd_endpoint();
  if (endpoint.empty()) {
    GTEST_SKIP() << "FLUXLOCK_ETCD_ENDPOINT not set";
  }
  auto etcd_channel = grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<fl::active_completion_queue>();

  using namespace std::chrono_literals;
  session_type s(queue->cq(), etcdserverpb::Lease::NewStub(etcd_channel), 5s, 2s);
  EXPECT_NE(s.lease_id(), 0);
  EXPECT_TRUE(s.is_active());
  EXPECT_GE(s.actual_TTL(), 1000ms);
  EXPECT_NO_THROW(s.revoke());
  EXPECT_FALSE(s.is_active());
}

/**
 * @test Verify that one elector acquires a free lock, and releases it on stop().
 */
TEST(leader_elector, basic) {
  auto const endpoint = etcd_endpoint();
  if (endpoint.empty()) {
    GTEST_SKIP() << "FLUXLOCK_ETCD_ENDPOINT not set";
  }
  auto etcd_channel = grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<fl::active_completion_queue>();

  auto lock = unique_lock();
  fl::leader_elector tested(queue, etcd_channel, lock, fast_config());
  EXPECT_FALSE(tested.is_leader());
  std::atomic<int> elected(0);
  std::atomic<int> deposed(0);
  tested.start([&elected]() { ++elected; }, [&deposed]() { ++deposed; });
  EXPECT_TRUE(wait_for([&tested]() { return tested.is_leader(); }));
  EXPECT_EQ(elected.load(), 1);

  tested.stop();
  EXPECT_FALSE(tested.is_leader());
  EXPECT_EQ(deposed.load(), 0);

  // ... the lock is free again ...
  fl::leader_elector other(queue, etcd_channel, lock, fast_config());
  EXPECT_TRUE(other.try_acquire_once());
  other.stop();
}

/**
 * @test Verify that at most one of two electors leads, and the other takes over after stop().
 */
TEST(leader_elector, hand_over) {
  auto const endpoint = etcd_endpoint();
  if (endpoint.empty()) {
    GTEST_SKIP() << "FLUXLOCK_ETCD_ENDPOINT not set";
  }
  auto etcd_channel = grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<fl::active_completion_queue>();

  auto lock = unique_lock();
  fl::leader_elector a(queue, etcd_channel, lock, fast_config());
  fl::leader_elector b(queue, etcd_channel, lock, fast_config());
  ASSERT_TRUE(a.try_acquire_once());
  a.start([]() {}, []() {});
  std::atomic<int> b_elected(0);
  b.start([&b_elected]() { ++b_elected; }, []() {});

  using namespace std::chrono_literals;
  std::this_thread::sleep_for(1s);
  EXPECT_TRUE(a.is_leader());
  EXPECT_FALSE(b.is_leader());
  EXPECT_EQ(b_elected.load(), 0);

  a.stop();
  EXPECT_TRUE(wait_for([&b]() { return b.is_leader(); }));
  EXPECT_EQ(b_elected.load(), 1);
  b.stop();
}
