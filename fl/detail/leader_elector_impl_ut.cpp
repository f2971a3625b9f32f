#include "fl/detail/leader_elector_impl.hpp"
#include <fl/detail/fake_advisory_store.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <random>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = fl::detail::fake_advisory_store::completion_queue_type;
using elector_type = fl::detail::leader_elector_impl<completion_queue_type>;
using fl::detail::deadline_timer;
using fl::detail::elector_state;

fl::elector_config test_config() {
  using namespace std::chrono_literals;
  fl::elector_config config;
  config.poll_interval = 5s;
  config.operation_timeout = 1s;
  config.key_prefix = "test/advisory";
  return config;
}

/**
 * One instance of the service: its own mocked queue, its own elector, and counters for the callbacks.
 *
 * Timers are never fired automatically, the test fires them with poll().
 */
class test_node {
public:
  test_node(fl::detail::fake_advisory_store& store, fl::lock_identifier lock, fl::elector_config config = test_config())
      : store_(store)
      , queue_()
      , timers_()
      , sessions_opened(0)
      , elected(0)
      , deposed(0) {
    using namespace ::testing;
    store_.attach(queue_);
    EXPECT_CALL(*queue_.interceptor().shared_mock, make_deadline_timer(_)).WillRepeatedly(Invoke([this](auto bop) {
      auto* op = dynamic_cast<deadline_timer*>(bop.get());
      ASSERT_TRUE(op != nullptr);
      EXPECT_EQ(op->name, "elector/poll_timer");
      timers_.push_back(std::shared_ptr<deadline_timer>(bop, op));
    }));
    EXPECT_CALL(*queue_.interceptor().shared_mock, cancel_deadline_timer(_)).WillRepeatedly(Invoke([this](auto bop) {
      // ... like grpc::Alarm::Cancel(), only pending timers are delivered with ok == false ...
      auto i = std::find_if(timers_.begin(), timers_.end(), [&bop](auto const& t) { return t.get() == bop.get(); });
      if (i == timers_.end()) {
        return;
      }
      timers_.erase(i);
      bop->callback(*bop, false);
    }));
    elector = std::make_unique<elector_type>(
        queue_, queue_, std::unique_ptr<etcdserverpb::KV::Stub>(),
        [this]() {
          ++sessions_opened;
          return store_.open_session();
        },
        std::move(lock), std::move(config));
  }

  void start() {
    elector->start([this]() { ++elected; }, [this]() { ++deposed; });
  }

  /// Fire the pending poll timer, return false if there is none.
  bool poll() {
    if (timers_.empty()) {
      return false;
    }
    auto t = timers_.front();
    timers_.erase(timers_.begin());
    t->callback(*t, true);
    return true;
  }

  std::size_t pending_timers() const {
    return timers_.size();
  }

  std::shared_ptr<deadline_timer> next_timer() const {
    return timers_.empty() ? std::shared_ptr<deadline_timer>() : timers_.front();
  }

private:
  fl::detail::fake_advisory_store& store_;
  completion_queue_type queue_;
  std::vector<std::shared_ptr<deadline_timer>> timers_;

public:
  int sessions_opened;
  int elected;
  int deposed;
  std::unique_ptr<elector_type> elector;
};

/// Count the release requests (a compare on the key lease) in the log.
int count_releases(fl::detail::fake_advisory_store const& store) {
  auto log = store.txn_log();
  return std::count_if(log.begin(), log.end(), [](auto const& r) {
    return r.compare_size() == 1 and r.compare(0).target() == etcdserverpb::Compare::LEASE;
  });
}

fl::lock_identifier const lock42{42, "test-42"};
} // anonymous namespace

/**
 * @test Verify that the first poll happens without waiting a poll interval, and acquires a free lock.
 */
TEST(leader_elector_impl, immediate_acquisition) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  EXPECT_FALSE(a.elector->is_leader());
  EXPECT_EQ(a.elector->state(), elector_state::idle);

  auto before = std::chrono::system_clock::now();
  a.start();
  EXPECT_EQ(a.elector->state(), elector_state::polling);
  ASSERT_EQ(a.pending_timers(), 1UL);
  EXPECT_LE(a.next_timer()->deadline, std::chrono::system_clock::now());
  EXPECT_EQ(a.elected, 0);

  ASSERT_TRUE(a.poll());
  EXPECT_EQ(a.elected, 1);
  EXPECT_EQ(a.deposed, 0);
  EXPECT_TRUE(a.elector->is_leader());
  EXPECT_EQ(a.elector->state(), elector_state::leader);

  // ... the next poll is one interval away ...
  ASSERT_EQ(a.pending_timers(), 1UL);
  EXPECT_GE(a.next_timer()->deadline, before + test_config().poll_interval);
}

/**
 * @test Verify that repeated outcomes do not call the callbacks, only transitions do.
 */
TEST(leader_elector_impl, edge_triggered) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  test_node b(store, lock42);
  a.start();
  b.start();

  for (int i = 0; i != 3; ++i) {
    ASSERT_TRUE(a.poll());
    ASSERT_TRUE(b.poll());
  }
  EXPECT_EQ(a.elected, 1);
  EXPECT_EQ(a.deposed, 0);
  EXPECT_EQ(b.elected, 0);
  EXPECT_EQ(b.deposed, 0);

  // ... the lease of the leader expires and somebody else grabs the lock first ...
  auto const lost_lease = a.elector->lease_id();
  store.expire(lost_lease);
  ASSERT_TRUE(b.poll());
  EXPECT_TRUE(b.elector->is_leader());
  EXPECT_EQ(b.elected, 1);

  // ... the old leader calls the callback on its next poll, exactly once, and revokes the lost session ...
  EXPECT_EQ(a.deposed, 0);
  ASSERT_TRUE(a.poll());
  EXPECT_FALSE(a.elector->is_leader());
  EXPECT_EQ(a.deposed, 1);
  EXPECT_EQ(store.revoked(), std::vector<std::int64_t>{lost_lease});
  for (int i = 0; i != 3; ++i) {
    ASSERT_TRUE(a.poll());
    ASSERT_TRUE(b.poll());
  }
  EXPECT_EQ(a.elected, 1);
  EXPECT_EQ(a.deposed, 1);
  EXPECT_EQ(b.elected, 1);
  EXPECT_EQ(b.deposed, 0);
  EXPECT_NE(a.elector->lease_id(), lost_lease);
  EXPECT_EQ(a.sessions_opened, 2);
}

/**
 * @test Verify that is_leader() turns false as soon as the session dies, without waiting for the next poll.
 */
TEST(leader_elector_impl, session_expired_between_polls) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  test_node b(store, lock42);
  a.start();
  b.start();
  ASSERT_TRUE(a.poll());
  ASSERT_TRUE(b.poll());
  ASSERT_TRUE(a.elector->is_leader());

  store.expire(a.elector->lease_id());
  EXPECT_FALSE(a.elector->is_leader());
  ASSERT_TRUE(b.poll());
  EXPECT_TRUE(b.elector->is_leader());
  EXPECT_FALSE(a.elector->is_leader());
  // ... the state and the callbacks wait for the loop ...
  EXPECT_EQ(a.elector->state(), elector_state::leader);
  EXPECT_EQ(a.deposed, 0);

  ASSERT_TRUE(a.poll());
  EXPECT_EQ(a.elector->state(), elector_state::polling);
  EXPECT_EQ(a.deposed, 1);
  EXPECT_FALSE(a.elector->is_leader());
}

/**
 * @test Verify that a store error keeps the previous leadership flag, both when leader and when not.
 */
TEST(leader_elector_impl, fail_safe_on_error) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  test_node b(store, lock42);
  a.start();
  b.start();
  ASSERT_TRUE(a.poll());
  ASSERT_TRUE(b.poll());
  ASSERT_TRUE(a.elector->is_leader());
  ASSERT_FALSE(b.elector->is_leader());

  store.fail_next(2);
  ASSERT_TRUE(a.poll());
  ASSERT_TRUE(b.poll());
  EXPECT_TRUE(a.elector->is_leader());
  EXPECT_FALSE(b.elector->is_leader());
  EXPECT_EQ(a.elected + a.deposed + b.elected + b.deposed, 1);

  // ... the loop survives the errors ...
  EXPECT_EQ(a.pending_timers(), 1UL);
  EXPECT_EQ(b.pending_timers(), 1UL);
}

/**
 * @test Verify that three consecutive errors followed by a granted poll call on_become_leader once, on the fourth poll.
 */
TEST(leader_elector_impl, three_errors_then_granted) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  store.fail_next(3);
  a.start();
  for (int i = 0; i != 3; ++i) {
    ASSERT_TRUE(a.poll());
    EXPECT_FALSE(a.elector->is_leader());
    EXPECT_EQ(a.elected, 0);
  }
  ASSERT_TRUE(a.poll());
  EXPECT_TRUE(a.elector->is_leader());
  EXPECT_EQ(a.elected, 1);
  ASSERT_TRUE(a.poll());
  EXPECT_EQ(a.elected, 1);
}

/**
 * @test Verify that stop() releases a held lock exactly once, revokes the session, and stops polling.
 */
TEST(leader_elector_impl, stop_releases_once) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  a.start();
  ASSERT_TRUE(a.poll());
  ASSERT_TRUE(a.elector->is_leader());
  auto const lease = a.elector->lease_id();
  auto const key = fl::detail::advisory_lock_key(test_config().key_prefix, lock42);
  ASSERT_EQ(store.lease_of(key), lease);

  a.elector->stop();
  EXPECT_FALSE(a.elector->is_leader());
  EXPECT_EQ(a.elector->state(), elector_state::stopped);
  EXPECT_EQ(a.pending_timers(), 0UL);
  EXPECT_EQ(count_releases(store), 1);
  EXPECT_EQ(store.lease_of(key), 0);
  EXPECT_EQ(store.revoked(), std::vector<std::int64_t>{lease});
  EXPECT_EQ(a.elector->lease_id(), 0);
  // ... stop() is initiated by the host, it does not call on_lose_leadership ...
  EXPECT_EQ(a.deposed, 0);

  // ... stop() is terminal ...
  a.elector->stop();
  EXPECT_EQ(count_releases(store), 1);
  EXPECT_EQ(store.revoked().size(), 1UL);
  EXPECT_FALSE(a.poll());
}

/**
 * @test Verify that stop() waits for the poll running in another thread, and releases the lock that poll obtained.
 */
TEST(leader_elector_impl, stop_waits_for_running_poll) {
  using namespace std::chrono_literals;
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  a.start();

  std::promise<void> gate;
  auto entered = store.hold_next(gate.get_future().share());
  auto poller = std::async(std::launch::async, [&a]() { return a.poll(); });
  ASSERT_EQ(entered.wait_for(5s), std::future_status::ready);

  std::atomic<bool> stopped(false);
  auto stopper = std::async(std::launch::async, [&a, &stopped]() {
    a.elector->stop();
    stopped = true;
  });
  EXPECT_EQ(stopper.wait_for(100ms), std::future_status::timeout);
  EXPECT_FALSE(stopped.load());
  EXPECT_EQ(a.elector->state(), elector_state::stopping);
  EXPECT_EQ(store.txn_log().size(), 1UL);

  gate.set_value();
  ASSERT_EQ(stopper.wait_for(5s), std::future_status::ready);
  stopper.get();
  EXPECT_TRUE(poller.get());
  EXPECT_TRUE(stopped.load());
  EXPECT_EQ(a.elector->state(), elector_state::stopped);
  EXPECT_FALSE(a.elector->is_leader());

  // ... the acquire granted by the last poll is followed by exactly one release ...
  auto log = store.txn_log();
  ASSERT_EQ(log.size(), 2UL);
  EXPECT_EQ(log[0].compare(0).target(), etcdserverpb::Compare::CREATE);
  EXPECT_EQ(log[1].compare(0).target(), etcdserverpb::Compare::LEASE);
  EXPECT_EQ(count_releases(store), 1);
  EXPECT_EQ(store.lease_of(fl::detail::advisory_lock_key(test_config().key_prefix, lock42)), 0);
  // ... the poll finished after stop() started, no callbacks ...
  EXPECT_EQ(a.elected, 0);
  EXPECT_EQ(a.deposed, 0);
  EXPECT_EQ(a.pending_timers(), 0UL);
}

/**
 * @test Verify that stop() does not release a lock it does not hold.
 */
TEST(leader_elector_impl, stop_follower) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  test_node b(store, lock42);
  a.start();
  b.start();
  ASSERT_TRUE(a.poll());
  ASSERT_TRUE(b.poll());

  b.elector->stop();
  EXPECT_EQ(count_releases(store), 0);
  EXPECT_EQ(store.revoked().size(), 1UL);
  EXPECT_TRUE(a.elector->is_leader());
}

/**
 * @test Verify that stop() completes and clears the flag even when the release fails.
 */
TEST(leader_elector_impl, stop_release_error) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  a.start();
  ASSERT_TRUE(a.poll());
  ASSERT_TRUE(a.elector->is_leader());

  store.fail_next(1);
  EXPECT_NO_THROW(a.elector->stop());
  EXPECT_FALSE(a.elector->is_leader());
  EXPECT_EQ(a.elector->state(), elector_state::stopped);
  EXPECT_EQ(count_releases(store), 1);
  // ... the session is still revoked, which drops the lock in the store ...
  EXPECT_EQ(store.lease_of(fl::detail::advisory_lock_key(test_config().key_prefix, lock42)), 0);
}

/**
 * @test Verify that every acquire uses the same session for the lifetime of the elector.
 */
TEST(leader_elector_impl, session_pinned) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  a.start();
  for (int i = 0; i != 5; ++i) {
    ASSERT_TRUE(a.poll());
  }
  auto const lease = a.elector->lease_id();
  a.elector->stop();

  EXPECT_EQ(a.sessions_opened, 1);
  auto log = store.txn_log();
  ASSERT_EQ(log.size(), 6UL);
  for (auto const& r : log) {
    if (r.compare(0).target() == etcdserverpb::Compare::LEASE) {
      EXPECT_EQ(r.compare(0).lease(), lease);
    } else {
      EXPECT_EQ(r.success(0).request_put().lease(), lease);
    }
  }
  EXPECT_EQ(store.revoked(), std::vector<std::int64_t>{lease});
}

/**
 * @test Verify that a session that cannot be opened counts as a store error.
 */
TEST(leader_elector_impl, session_open_failure) {
  fl::detail::fake_advisory_store store;
  completion_queue_type queue;
  store.attach(queue);
  using namespace ::testing;
  std::vector<std::shared_ptr<deadline_timer>> timers;
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_)).WillRepeatedly(Invoke([&timers](auto bop) {
    timers.push_back(std::shared_ptr<deadline_timer>(bop, dynamic_cast<deadline_timer*>(bop.get())));
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, cancel_deadline_timer(_)).WillRepeatedly(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));

  int attempts = 0;
  elector_type elector(
      queue, queue, std::unique_ptr<etcdserverpb::KV::Stub>(),
      [&attempts, &store]() -> std::unique_ptr<fl::session> {
        if (++attempts == 1) {
          throw std::runtime_error("lease grant failed");
        }
        return store.open_session();
      },
      lock42, test_config());
  int elected = 0;
  elector.start([&elected]() { ++elected; }, []() {});

  auto fire = [&timers]() {
    auto t = timers.back();
    t->callback(*t, true);
  };
  fire();
  EXPECT_FALSE(elector.is_leader());
  EXPECT_EQ(timers.size(), 2UL);
  fire();
  EXPECT_TRUE(elector.is_leader());
  EXPECT_EQ(elected, 1);
  EXPECT_EQ(attempts, 2);
  elector.stop();
}

/**
 * @test Verify the misuse policy: double start, start after stop, try_acquire_once after stop.
 */
TEST(leader_elector_impl, misuse) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  EXPECT_FALSE(a.elector->is_leader());
  a.start();
  EXPECT_THROW(a.start(), std::runtime_error);
  EXPECT_EQ(a.pending_timers(), 1UL);
  a.elector->stop();
  EXPECT_THROW(a.start(), std::runtime_error);
  EXPECT_THROW(a.elector->try_acquire_once(), std::runtime_error);
  EXPECT_FALSE(a.elector->is_leader());
}

/**
 * @test Verify try_acquire_once() without the poll loop, and that stop() releases what it obtained.
 */
TEST(leader_elector_impl, try_acquire_once) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  test_node b(store, lock42);

  EXPECT_TRUE(a.elector->try_acquire_once());
  EXPECT_TRUE(a.elector->is_leader());
  EXPECT_TRUE(a.elector->try_acquire_once());
  EXPECT_FALSE(b.elector->try_acquire_once());
  EXPECT_FALSE(b.elector->is_leader());
  EXPECT_EQ(a.pending_timers(), 0UL);
  EXPECT_EQ(a.elected, 0);

  store.fail_next(1);
  EXPECT_THROW(a.elector->try_acquire_once(), std::runtime_error);
  EXPECT_TRUE(a.elector->is_leader());

  a.elector->stop();
  EXPECT_FALSE(a.elector->is_leader());
  EXPECT_EQ(count_releases(store), 1);
  EXPECT_TRUE(b.elector->try_acquire_once());
}

/**
 * @test Verify that a callback that raises does not stop the loop.
 */
TEST(leader_elector_impl, callback_raises) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  int calls = 0;
  a.elector->start(
      [&calls]() {
        ++calls;
        throw std::runtime_error("bad callback");
      },
      []() {});
  ASSERT_TRUE(a.poll());
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(a.elector->is_leader());
  ASSERT_TRUE(a.poll());
  EXPECT_EQ(calls, 1);
}

/**
 * @test Verify the hand-over: A leads lock 42, B follows, A stops, B leads after its next poll.
 */
TEST(leader_elector_impl, hand_over) {
  fl::detail::fake_advisory_store store;
  test_node a(store, lock42);
  test_node b(store, lock42);

  a.start();
  ASSERT_TRUE(a.poll());
  ASSERT_TRUE(a.elector->is_leader());

  b.start();
  ASSERT_TRUE(b.poll());
  EXPECT_FALSE(b.elector->is_leader());
  EXPECT_EQ(b.elected, 0);

  a.elector->stop();
  ASSERT_TRUE(b.poll());
  EXPECT_TRUE(b.elector->is_leader());
  EXPECT_EQ(b.elected, 1);
}

/**
 * @test Verify that among N electors on the same lock at most one is leader after every poll.
 */
TEST(leader_elector_impl, mutual_exclusion) {
  fl::detail::fake_advisory_store store;
  std::vector<std::unique_ptr<test_node>> nodes;
  for (int i = 0; i != 5; ++i) {
    nodes.push_back(std::make_unique<test_node>(store, lock42));
    nodes.back()->start();
  }
  // ... another lock is independent ...
  test_node other(store, fl::lock_identifier{43, "test-43"});
  other.start();

  std::mt19937 gen(20261018);
  std::uniform_int_distribution<std::size_t> pick(0, nodes.size() - 1);
  int leaders_seen = 0;
  for (int step = 0; step != 200; ++step) {
    auto i = pick(gen);
    if (step % 37 == 36 and nodes[i]->elector->is_leader()) {
      // ... replace the leader with a fresh instance ...
      nodes[i]->elector->stop();
      nodes[i] = std::make_unique<test_node>(store, lock42);
      nodes[i]->start();
    }
    nodes[i]->poll();
    int leaders = 0;
    for (auto const& node : nodes) {
      if (node->elector->is_leader()) {
        ++leaders;
      }
    }
    ASSERT_LE(leaders, 1) << "step=" << step;
    leaders_seen = std::max(leaders_seen, leaders);
    other.poll();
    EXPECT_TRUE(other.elector->is_leader());
  }
  EXPECT_EQ(leaders_seen, 1);
}
