#include "fl/completion_queue.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>

namespace fl {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* raw(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace fl

namespace {
/// Record the timers delivered by a queue, in order.
class timer_log {
public:
  auto recorder() {
    return [this](fl::detail::deadline_timer const& op, bool ok) {
      std::lock_guard<std::mutex> lock(mu_);
      events_.push_back(op.name + (ok ? "" : " cancelled"));
    };
  }

  std::vector<std::string> events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

  /// Wait up to ~2s for @a n events.
  bool wait_for(std::size_t n) const {
    using namespace std::chrono_literals;
    for (int i = 0; i != 200; ++i) {
      if (events().size() >= n) {
        return true;
      }
      std::this_thread::sleep_for(10ms);
    }
    return false;
  }

private:
  mutable std::mutex mu_;
  std::vector<std::string> events_;
};
} // anonymous namespace

/**
 * @test Verify that timers fire in deadline order, and that cancelled timers are delivered with ok == false.
 */
TEST(completion_queue, timers) {
  using namespace std::chrono_literals;
  fl::completion_queue<> queue;
  timer_log log;

  auto cancelled = queue.make_relative_timer(10min, "elector/poll_timer", log.recorder());
  EXPECT_EQ(queue.pending_count(), 1U);
  EXPECT_EQ(queue.pending_names(), std::vector<std::string>{"elector/poll_timer"});
  queue.make_relative_timer(60ms, "later", log.recorder());
  auto now = std::chrono::system_clock::now();
  auto first = queue.make_deadline_timer(now + 20ms, "sooner", log.recorder());
  EXPECT_EQ(first->deadline, now + 20ms);
  queue.cancel_timer(cancelled);

  std::thread t([&queue]() { queue.run(); });
  ASSERT_TRUE(log.wait_for(3));
  std::vector<std::string> const expected{"elector/poll_timer cancelled", "sooner", "later"};
  EXPECT_EQ(log.events(), expected);
  EXPECT_EQ(queue.pending_count(), 0U);

  queue.shutdown();
  t.join();
}

/**
 * @test Make sure fl::completion_queue ignores unknown and null tags.
 */
TEST(completion_queue, unknown_tags) {
  using namespace std::chrono_literals;

  fl::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });
  timer_log log;

  // ... alarms with tags that did not go through the queue APIs ...
  grpc::CompletionQueue* cq = fl::detail::base_completion_queue_test_only::raw(queue);
  queue.make_relative_timer(30ms, "known", log.recorder());
  grpc::Alarm null_tag(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  grpc::Alarm unknown_tag(cq, std::chrono::system_clock::now() + 20ms, static_cast<void*>(&log));

  ASSERT_TRUE(log.wait_for(1));
  EXPECT_EQ(log.events(), std::vector<std::string>{"known"});

  queue.shutdown();
  t.join();
}
