#include "fl/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <future>

/**
 * @test Verify that fl::active_completion_queue can be created and destroyed, also when shared.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<fl::active_completion_queue>();
  EXPECT_EQ(shq->name(), "fluxlock");
  EXPECT_NO_THROW(shq.reset());

  fl::active_completion_queue named("store");
  EXPECT_EQ(named.name(), "store");
  EXPECT_FALSE(named.in_loop_thread());
}

/**
 * @test Verify that timers posted to an fl::active_completion_queue run in its own thread.
 */
TEST(active_completion_queue, timers_run_in_loop_thread) {
  using namespace std::chrono_literals;
  fl::active_completion_queue queue("test");

  std::promise<bool> fired;
  queue.cq().make_relative_timer(
      1ms, "test/in_loop_thread", [&fired, &queue](auto const& op, bool ok) { fired.set_value(queue.in_loop_thread()); });
  auto f = fired.get_future();
  ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(f.get());
}
