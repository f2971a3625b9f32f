#include "fl/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>
#include <future>
#include <thread>

/**
 * @test Verify that the event loop runs in the calling thread and returns after shutdown().
 */
TEST(base_completion_queue, run_shutdown) {
  using namespace std::chrono_literals;
  fl::detail::base_completion_queue queue;
  EXPECT_EQ(queue.pending_count(), 0U);
  EXPECT_TRUE(queue.pending_names().empty());

  std::promise<void> running;
  auto done = std::async(std::launch::async, [&]() {
    running.set_value();
    queue.run();
  });
  ASSERT_EQ(running.get_future().wait_for(500ms), std::future_status::ready);
  // ... the loop keeps running with nothing to do ...
  EXPECT_EQ(done.wait_for(2 * fl::detail::base_completion_queue::loop_timeout), std::future_status::timeout);

  queue.shutdown();
  ASSERT_EQ(done.wait_for(500ms), std::future_status::ready);
  EXPECT_NO_THROW(done.get());
}
